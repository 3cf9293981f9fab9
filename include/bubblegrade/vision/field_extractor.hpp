#pragma once

#include <bubblegrade/core/error.hpp>
#include <bubblegrade/core/frame.hpp>
#include <bubblegrade/core/region.hpp>
#include <bubblegrade/core/scan_result.hpp>
#include <bubblegrade/vision/ocr_engine.hpp>
#include <expected>
#include <memory>

namespace bubblegrade::vision {

/// Denoise settings for the handwritten name crop.
struct FieldExtractorParams {
  int bilateral_diameter{9};
  double bilateral_sigma_color{75.0};
  double bilateral_sigma_space{75.0};
};

/// Runs OCR over the nombre / curp regions and scores the result.
///
/// nombre: gray -> bilateral filter -> OCR; confidence is the mean token confidence.
/// curp: gray -> Otsu binarization -> OCR; whitespace removed and confidence forced
/// to 0 when the text does not match the CURP pattern.
/// needs_review is left for the result merger to decide.
class FieldExtractor {
 public:
  explicit FieldExtractor(std::unique_ptr<IOcrEngine> engine, FieldExtractorParams params = {});

  [[nodiscard]] std::expected<bubblegrade::core::FieldResult, bubblegrade::core::ScanFailure>
  extract(const bubblegrade::core::Frame& enhanced,
          const bubblegrade::core::RegionBoundingBox& roi,
          bubblegrade::core::FieldKind kind);

  /// The grayscale image handed to the OCR engine for this field.
  [[nodiscard]] std::expected<bubblegrade::core::Frame, bubblegrade::core::ScanFailure>
  preprocess(const bubblegrade::core::Frame& enhanced,
             const bubblegrade::core::RegionBoundingBox& roi,
             bubblegrade::core::FieldKind kind) const;

 private:
  std::unique_ptr<IOcrEngine> engine_;
  FieldExtractorParams params_;
};

}  // namespace bubblegrade::vision
