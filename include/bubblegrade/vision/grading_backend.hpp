#pragma once

#include <bubblegrade/core/error.hpp>
#include <bubblegrade/core/frame.hpp>
#include <bubblegrade/core/region.hpp>
#include <bubblegrade/core/scan_result.hpp>
#include <expected>
#include <string_view>

namespace bubblegrade::vision {

/// Grading capability used by the pipeline: bubble grading plus field OCR.
/// grade_omr and extract_field may be called concurrently for the same frame;
/// implementations must not mutate it.
class IGradingBackend {
 public:
  virtual ~IGradingBackend() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  [[nodiscard]] virtual std::expected<bubblegrade::core::OmrResult, bubblegrade::core::ScanFailure>
  grade_omr(const bubblegrade::core::Frame& enhanced,
            const bubblegrade::core::RegionBoundingBox& roi) = 0;

  /// Returned FieldResult already has the CURP pattern rule applied.
  [[nodiscard]] virtual std::expected<bubblegrade::core::FieldResult, bubblegrade::core::ScanFailure>
  extract_field(const bubblegrade::core::Frame& enhanced,
                const bubblegrade::core::RegionBoundingBox& roi,
                bubblegrade::core::FieldKind kind) = 0;
};

}  // namespace bubblegrade::vision
