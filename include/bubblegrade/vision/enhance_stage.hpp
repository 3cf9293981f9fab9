#pragma once

#include <bubblegrade/core/pipeline_stage.hpp>
#include <bubblegrade/vision/image_enhancer.hpp>

namespace bubblegrade::vision {

/// ScanContext::decoded -> ScanContext::enhanced.
class EnhanceStage : public bubblegrade::core::IScanStage {
 public:
  explicit EnhanceStage(ImageEnhancer enhancer);

  [[nodiscard]] std::string_view name() const noexcept override { return "enhance"; }

  [[nodiscard]] std::expected<void, bubblegrade::core::ScanFailure>
  process(bubblegrade::core::ScanContext& context) override;

 private:
  ImageEnhancer enhancer_;
};

}  // namespace bubblegrade::vision
