#pragma once

#include <bubblegrade/core/frame.hpp>
#include <bubblegrade/core/region.hpp>
#include <opencv2/core.hpp>
#include <optional>

namespace bubblegrade::vision::detail {

/// Non-owning cv::Mat header over the frame buffer. The frame must outlive the Mat;
/// callers treat the result as read-only.
std::optional<cv::Mat> frame_to_mat(const bubblegrade::core::Frame& frame);

/// Deep copy of a continuous or non-continuous Mat into a packed Frame.
bubblegrade::core::Frame mat_to_frame(const cv::Mat& mat, bubblegrade::core::PixelFormat format);

cv::Rect to_rect(const bubblegrade::core::RegionBoundingBox& box);

/// Copy of the box area, clipped to the image. Empty Mat if nothing overlaps.
cv::Mat crop(const cv::Mat& image, const bubblegrade::core::RegionBoundingBox& box);

/// Single-channel 8-bit view or conversion of a BGR / gray image.
cv::Mat to_gray(const cv::Mat& image);

}  // namespace bubblegrade::vision::detail
