#pragma once

#include <bubblegrade/vision/ocr_engine.hpp>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace bubblegrade::vision {

/// Scripted recognizer for tests and demos. Queued outputs are returned in call
/// order; once the queue is empty the default output is returned.
class MockOcrEngine : public IOcrEngine {
 public:
  void set_default_output(OcrOutput output);
  void push_output(OcrOutput output);
  /// Every following call fails with this error until cleared with std::nullopt.
  void set_failure(std::optional<bubblegrade::core::ScanFailure> failure);

  [[nodiscard]] std::expected<OcrOutput, bubblegrade::core::ScanFailure>
  recognize_line(const bubblegrade::core::Frame& gray) override;

  [[nodiscard]] std::size_t call_count() const;

 private:
  mutable std::mutex mutex_;
  OcrOutput default_output_;
  std::deque<OcrOutput> queued_;
  std::optional<bubblegrade::core::ScanFailure> failure_;
  std::size_t calls_{0};
};

}  // namespace bubblegrade::vision
