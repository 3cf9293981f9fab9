#pragma once

#include <bubblegrade/core/error.hpp>
#include <bubblegrade/core/frame.hpp>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace bubblegrade::vision {

/// One recognized word. confidence is the engine's 0..100 score; negative values
/// mark entries that carry no word-level confidence.
struct OcrToken {
  std::string text;
  float confidence{-1.f};
};

/// Raw recognizer output for a single text line.
struct OcrOutput {
  std::string text;
  std::vector<OcrToken> tokens;
};

/// Abstract text recognizer: single-line Grayscale8 Frame -> OcrOutput.
/// Implementations must be safe to call from several threads.
class IOcrEngine {
 public:
  virtual ~IOcrEngine() = default;

  [[nodiscard]] virtual std::expected<OcrOutput, bubblegrade::core::ScanFailure>
  recognize_line(const bubblegrade::core::Frame& gray) = 0;
};

/// Mean of the non-negative token confidences, scaled to [0, 1]; 0 when there are none.
[[nodiscard]] float mean_token_confidence(std::span<const OcrToken> tokens) noexcept;

}  // namespace bubblegrade::vision
