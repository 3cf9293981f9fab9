#pragma once

#include <bubblegrade/core/pipeline_stage.hpp>
#include <bubblegrade/vision/image_codec.hpp>
#include <cstddef>

namespace bubblegrade::vision {

/// Decodes ScanContext::encoded into ScanContext::decoded (BGR8).
class DecodeStage : public bubblegrade::core::IScanStage {
 public:
  explicit DecodeStage(std::size_t max_upload_bytes = kMaxUploadBytes);

  [[nodiscard]] std::string_view name() const noexcept override { return "decode"; }

  [[nodiscard]] std::expected<void, bubblegrade::core::ScanFailure>
  process(bubblegrade::core::ScanContext& context) override;

 private:
  std::size_t max_upload_bytes_;
};

}  // namespace bubblegrade::vision
