#pragma once

#include <bubblegrade/core/error.hpp>
#include <bubblegrade/core/frame.hpp>
#include <bubblegrade/core/scan_result.hpp>
#include <expected>

namespace bubblegrade::vision {

/// Resolution, clarity (variance of the Laplacian, higher is sharper) and skew
/// (mean angle in degrees of near-horizontal Hough lines, 0 when none are found).
[[nodiscard]] std::expected<bubblegrade::core::ImageQuality, bubblegrade::core::ScanFailure>
analyze_image_quality(const bubblegrade::core::Frame& image);

}  // namespace bubblegrade::vision
