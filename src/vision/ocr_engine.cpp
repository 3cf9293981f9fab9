#include <bubblegrade/vision/ocr_engine.hpp>
#include <algorithm>

namespace bubblegrade::vision {

float mean_token_confidence(std::span<const OcrToken> tokens) noexcept {
  double sum = 0.0;
  std::size_t count = 0;
  for (const auto& token : tokens) {
    if (token.confidence >= 0.f) {
      sum += token.confidence;
      ++count;
    }
  }
  if (count == 0) return 0.f;
  const double mean = sum / static_cast<double>(count) / 100.0;
  return static_cast<float>(std::clamp(mean, 0.0, 1.0));
}

}  // namespace bubblegrade::vision
