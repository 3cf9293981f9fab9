#pragma once

#include <bubblegrade/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <string>
#include <vector>

// Synthetic images for tests; drawn with OpenCV so no fixture files are needed.
namespace bubblegrade::test {

inline bubblegrade::core::Frame to_frame(const cv::Mat& image) {
  const cv::Mat packed = image.isContinuous() ? image : image.clone();
  std::vector<std::byte> buffer(packed.total() * packed.elemSize());
  std::memcpy(buffer.data(), packed.data, buffer.size());
  const auto format = packed.channels() == 1 ? bubblegrade::core::PixelFormat::Grayscale8
                                             : bubblegrade::core::PixelFormat::BGR8;
  return bubblegrade::core::Frame(static_cast<std::uint32_t>(packed.cols),
                                  static_cast<std::uint32_t>(packed.rows), format,
                                  std::move(buffer));
}

inline std::vector<std::byte> encode(const cv::Mat& image, const std::string& ext = ".png") {
  std::vector<uchar> raw;
  cv::imencode(ext, image, raw);
  std::vector<std::byte> bytes(raw.size());
  std::memcpy(bytes.data(), raw.data(), raw.size());
  return bytes;
}

inline cv::Mat white_page(int width, int height) {
  return cv::Mat(height, width, CV_8UC3, cv::Scalar(255, 255, 255));
}

/// Dark page outline on a white background, like a sheet photographed on a table.
inline cv::Mat page_with_outline(int width, int height, const cv::Rect& outline) {
  cv::Mat img = white_page(width, height);
  cv::rectangle(img, outline, cv::Scalar(0, 0, 0), 3);
  return img;
}

/// Bubble rows: `rows` x `choices` outlined circles; filled[r] is the column to fill
/// (negative leaves the row blank).
inline cv::Mat bubble_grid(int rows, int choices, const std::vector<int>& filled,
                           int radius = 14, int spacing = 60) {
  cv::Mat img = white_page(spacing * (choices + 1), spacing * (rows + 1));
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < choices; ++c) {
      const cv::Point center(spacing * (c + 1), spacing * (r + 1));
      const bool fill = r < static_cast<int>(filled.size()) && filled[r] == c;
      cv::circle(img, center, radius, cv::Scalar(0, 0, 0), fill ? cv::FILLED : 3);
    }
  }
  return img;
}

}  // namespace bubblegrade::test
