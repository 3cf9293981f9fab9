#include <bubblegrade/vision/mock_ocr_engine.hpp>
#include <bubblegrade/core/error.hpp>

namespace bubblegrade::vision {

void MockOcrEngine::set_default_output(OcrOutput output) {
  std::lock_guard lock(mutex_);
  default_output_ = std::move(output);
}

void MockOcrEngine::push_output(OcrOutput output) {
  std::lock_guard lock(mutex_);
  queued_.push_back(std::move(output));
}

void MockOcrEngine::set_failure(std::optional<bubblegrade::core::ScanFailure> failure) {
  std::lock_guard lock(mutex_);
  failure_ = std::move(failure);
}

std::expected<OcrOutput, bubblegrade::core::ScanFailure>
MockOcrEngine::recognize_line(const bubblegrade::core::Frame& gray) {
  std::lock_guard lock(mutex_);
  ++calls_;
  if (failure_) {
    return std::unexpected(*failure_);
  }
  if (!gray.valid()) {
    return std::unexpected(bubblegrade::core::make_failure(
        bubblegrade::core::PipelineError::InvalidFrame, "mock OCR received an empty frame"));
  }
  if (!queued_.empty()) {
    OcrOutput next = std::move(queued_.front());
    queued_.pop_front();
    return next;
  }
  return default_output_;
}

std::size_t MockOcrEngine::call_count() const {
  std::lock_guard lock(mutex_);
  return calls_;
}

}  // namespace bubblegrade::vision
