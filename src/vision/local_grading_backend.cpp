#include <bubblegrade/vision/local_grading_backend.hpp>

namespace bubblegrade::vision {

namespace bc = bubblegrade::core;

LocalGradingBackend::LocalGradingBackend(OmrGrader grader, FieldExtractor extractor)
    : grader_(std::move(grader)), extractor_(std::move(extractor)) {}

std::expected<bc::OmrResult, bc::ScanFailure> LocalGradingBackend::grade_omr(
    const bc::Frame& enhanced,
    const bc::RegionBoundingBox& roi) {
  return grader_.grade(enhanced, roi);
}

std::expected<bc::FieldResult, bc::ScanFailure> LocalGradingBackend::extract_field(
    const bc::Frame& enhanced,
    const bc::RegionBoundingBox& roi,
    bc::FieldKind kind) {
  return extractor_.extract(enhanced, roi, kind);
}

}  // namespace bubblegrade::vision
