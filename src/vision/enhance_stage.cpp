#include <bubblegrade/vision/enhance_stage.hpp>

namespace bubblegrade::vision {

EnhanceStage::EnhanceStage(ImageEnhancer enhancer) : enhancer_(std::move(enhancer)) {}

std::expected<void, bubblegrade::core::ScanFailure> EnhanceStage::process(
    bubblegrade::core::ScanContext& context) {
  auto enhanced = enhancer_.enhance(context.decoded);
  if (!enhanced) {
    return std::unexpected(enhanced.error());
  }
  context.enhanced = std::move(*enhanced);
  return {};
}

}  // namespace bubblegrade::vision
