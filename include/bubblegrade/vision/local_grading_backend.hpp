#pragma once

#include <bubblegrade/vision/field_extractor.hpp>
#include <bubblegrade/vision/grading_backend.hpp>
#include <bubblegrade/vision/omr_grader.hpp>

namespace bubblegrade::vision {

/// In-process grading with OpenCV (bubbles) and the given OCR engine (fields).
class LocalGradingBackend : public IGradingBackend {
 public:
  LocalGradingBackend(OmrGrader grader, FieldExtractor extractor);

  [[nodiscard]] std::string_view name() const noexcept override { return "local"; }

  [[nodiscard]] std::expected<bubblegrade::core::OmrResult, bubblegrade::core::ScanFailure>
  grade_omr(const bubblegrade::core::Frame& enhanced,
            const bubblegrade::core::RegionBoundingBox& roi) override;

  [[nodiscard]] std::expected<bubblegrade::core::FieldResult, bubblegrade::core::ScanFailure>
  extract_field(const bubblegrade::core::Frame& enhanced,
                const bubblegrade::core::RegionBoundingBox& roi,
                bubblegrade::core::FieldKind kind) override;

 private:
  OmrGrader grader_;
  FieldExtractor extractor_;
};

}  // namespace bubblegrade::vision
