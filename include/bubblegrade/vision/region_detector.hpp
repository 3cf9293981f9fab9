#pragma once

#include <bubblegrade/core/error.hpp>
#include <bubblegrade/core/frame.hpp>
#include <bubblegrade/core/region.hpp>
#include <expected>

namespace bubblegrade::vision {

/// Fractions of the document boundary occupied by each region of the printed template.
struct RegionLayout {
  double margin_x{0.05};
  double width{0.90};
  double nombre_top{0.05};
  double nombre_height{0.10};
  double curp_top{0.17};
  double curp_height{0.10};
  double omr_top{0.30};  // omr runs to the bottom of the boundary
};

struct RegionDetectorParams {
  RegionLayout layout{};
  int blur_kernel{5};
  double canny_low{50.0};
  double canny_high{150.0};
  double approx_epsilon{0.02};  // fraction of the contour perimeter
};

/// Derive the three ROIs from a document boundary. Each product is truncated to int,
/// then every box is clipped into the image with at least 1x1 pixels.
[[nodiscard]] bubblegrade::core::RegionSet layout_regions(
    const bubblegrade::core::RegionBoundingBox& boundary,
    int image_width,
    int image_height,
    const RegionLayout& layout);

/// Finds the sheet outline (largest contour simplified to a quadrilateral) and
/// splits it into the nombre / curp / omr regions. When no quadrilateral is found the
/// whole frame is used and RegionSet::fallback_layout is set; this is never an error.
class RegionDetector {
 public:
  explicit RegionDetector(RegionDetectorParams params = {});

  [[nodiscard]] std::expected<bubblegrade::core::RegionSet, bubblegrade::core::ScanFailure>
  detect(const bubblegrade::core::Frame& enhanced) const;

  [[nodiscard]] const RegionDetectorParams& params() const noexcept { return params_; }

 private:
  RegionDetectorParams params_;
};

}  // namespace bubblegrade::vision
