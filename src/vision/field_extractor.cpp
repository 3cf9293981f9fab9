#include <bubblegrade/vision/field_extractor.hpp>
#include "frame_cv_utils.hpp"
#include <bubblegrade/core/result_merger.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>

namespace bubblegrade::vision {

namespace bc = bubblegrade::core;

FieldExtractor::FieldExtractor(std::unique_ptr<IOcrEngine> engine, FieldExtractorParams params)
    : engine_(std::move(engine)), params_(params) {
  if (!engine_) {
    throw std::invalid_argument("FieldExtractor: OCR engine must not be null");
  }
}

std::expected<bc::Frame, bc::ScanFailure> FieldExtractor::preprocess(
    const bc::Frame& enhanced,
    const bc::RegionBoundingBox& roi,
    bc::FieldKind kind) const {
  auto mat = detail::frame_to_mat(enhanced);
  if (!mat) {
    return std::unexpected(bc::make_failure(bc::PipelineError::InvalidFrame,
                                            "field extractor received an empty frame"));
  }
  const cv::Mat region = detail::crop(*mat, roi);
  if (region.empty()) {
    return std::unexpected(bc::make_failure(
        bc::PipelineError::ExtractionError,
        std::string(bc::to_string(kind)) + " region lies outside the image"));
  }

  try {
    const cv::Mat gray = detail::to_gray(region);
    cv::Mat prepared;
    if (kind == bc::FieldKind::Nombre) {
      cv::bilateralFilter(gray, prepared, params_.bilateral_diameter,
                          params_.bilateral_sigma_color, params_.bilateral_sigma_space);
    } else {
      cv::threshold(gray, prepared, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    }
    return detail::mat_to_frame(prepared, bc::PixelFormat::Grayscale8);
  } catch (const cv::Exception& e) {
    return std::unexpected(bc::make_failure(
        bc::PipelineError::ExtractionError,
        std::string(bc::to_string(kind)) + " preprocessing failed: " + e.what()));
  }
}

std::expected<bc::FieldResult, bc::ScanFailure> FieldExtractor::extract(
    const bc::Frame& enhanced,
    const bc::RegionBoundingBox& roi,
    bc::FieldKind kind) {
  auto prepared = preprocess(enhanced, roi, kind);
  if (!prepared) {
    return std::unexpected(prepared.error());
  }
  auto ocr = engine_->recognize_line(*prepared);
  if (!ocr) {
    return std::unexpected(ocr.error());
  }
  return bc::make_field_result(kind, ocr->text, mean_token_confidence(ocr->tokens));
}

}  // namespace bubblegrade::vision
