#pragma once

#include <bubblegrade/core/error.hpp>
#include <bubblegrade/core/frame.hpp>
#include <expected>

namespace bubblegrade::vision {

/// Bilateral filter and CLAHE settings.
struct EnhancerParams {
  int bilateral_diameter{9};
  double bilateral_sigma_color{75.0};
  double bilateral_sigma_space{75.0};
  double clahe_clip_limit{2.0};
  int clahe_tile_size{8};
};

/// Normalizes a photographed sheet: edge-preserving denoise, then local contrast
/// equalization on the Lab luminance channel only. The input is not modified.
class ImageEnhancer {
 public:
  explicit ImageEnhancer(EnhancerParams params = {});

  /// BGR8 in, BGR8 out with the same size. Grayscale input is promoted to BGR first.
  [[nodiscard]] std::expected<bubblegrade::core::Frame, bubblegrade::core::ScanFailure>
  enhance(const bubblegrade::core::Frame& input) const;

  [[nodiscard]] const EnhancerParams& params() const noexcept { return params_; }

 private:
  EnhancerParams params_;
};

}  // namespace bubblegrade::vision
