#include "frame_cv_utils.hpp"
#include <bubblegrade/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace bubblegrade::vision::detail {

namespace bc = bubblegrade::core;

std::optional<cv::Mat> frame_to_mat(const bc::Frame& frame) {
  if (!frame.valid()) return std::nullopt;
  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  auto* data = const_cast<std::byte*>(frame.data().data());
  switch (frame.format()) {
    case bc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data);
    case bc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data);
    case bc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

bc::Frame mat_to_frame(const cv::Mat& mat, bc::PixelFormat format) {
  if (mat.empty()) return bc::Frame();
  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return bc::Frame(w, h, format, std::move(buffer));
}

cv::Rect to_rect(const bc::RegionBoundingBox& box) {
  return cv::Rect(box.x, box.y, box.width, box.height);
}

cv::Mat crop(const cv::Mat& image, const bc::RegionBoundingBox& box) {
  const cv::Rect area = to_rect(box) & cv::Rect(0, 0, image.cols, image.rows);
  if (area.width <= 0 || area.height <= 0) return cv::Mat();
  return image(area).clone();
}

cv::Mat to_gray(const cv::Mat& image) {
  if (image.channels() == 1) return image;
  cv::Mat gray;
  cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  return gray;
}

}  // namespace bubblegrade::vision::detail
