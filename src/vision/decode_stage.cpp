#include <bubblegrade/vision/decode_stage.hpp>

namespace bubblegrade::vision {

DecodeStage::DecodeStage(std::size_t max_upload_bytes) : max_upload_bytes_(max_upload_bytes) {}

std::expected<void, bubblegrade::core::ScanFailure> DecodeStage::process(
    bubblegrade::core::ScanContext& context) {
  auto decoded = decode_frame(context.encoded, max_upload_bytes_);
  if (!decoded) {
    return std::unexpected(decoded.error());
  }
  context.decoded = std::move(*decoded);
  return {};
}

}  // namespace bubblegrade::vision
