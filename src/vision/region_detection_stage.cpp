#include <bubblegrade/vision/region_detection_stage.hpp>
#include <bubblegrade/vision/image_quality.hpp>
#include <spdlog/spdlog.h>

namespace bubblegrade::vision {

RegionDetectionStage::RegionDetectionStage(RegionDetector detector)
    : detector_(std::move(detector)) {}

std::expected<void, bubblegrade::core::ScanFailure> RegionDetectionStage::process(
    bubblegrade::core::ScanContext& context) {
  auto regions = detector_.detect(context.enhanced);
  if (!regions) {
    return std::unexpected(regions.error());
  }
  if (regions->fallback_layout) {
    spdlog::warn("RegionDetectionFallback: no document outline found in {}x{} image, "
                 "using full-frame layout",
                 context.enhanced.width(), context.enhanced.height());
  }
  context.regions = *regions;

  auto quality = analyze_image_quality(context.enhanced);
  if (!quality) {
    return std::unexpected(quality.error());
  }
  context.quality = *quality;
  return {};
}

}  // namespace bubblegrade::vision
