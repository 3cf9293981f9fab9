#include <bubblegrade/vision/image_quality.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <string>
#include <vector>

namespace bubblegrade::vision {

namespace bc = bubblegrade::core;

namespace {

constexpr int kHoughVotes = 100;
constexpr double kHorizontalToleranceDeg = 10.0;

double estimate_skew(const cv::Mat& gray) {
  cv::Mat edges;
  cv::Canny(gray, edges, 50, 150, 3);
  std::vector<cv::Vec2f> lines;
  cv::HoughLines(edges, lines, 1, CV_PI / 180.0, kHoughVotes);

  double angle_sum = 0.0;
  int count = 0;
  for (const auto& line : lines) {
    const double angle_deg = static_cast<double>(line[1]) * 180.0 / CV_PI;
    if (angle_deg > 180.0 - kHorizontalToleranceDeg || angle_deg < kHorizontalToleranceDeg) {
      angle_sum += angle_deg;
      ++count;
    }
  }
  if (count == 0) return 0.0;

  double average = angle_sum / count;
  if (average > 90.0) average -= 180.0;
  return average;
}

}  // namespace

std::expected<bc::ImageQuality, bc::ScanFailure> analyze_image_quality(const bc::Frame& image) {
  auto mat = detail::frame_to_mat(image);
  if (!mat) {
    return std::unexpected(bc::make_failure(bc::PipelineError::InvalidFrame,
                                            "quality analysis received an empty frame"));
  }

  bc::ImageQuality quality;
  quality.width = mat->cols;
  quality.height = mat->rows;
  try {
    const cv::Mat gray = detail::to_gray(*mat);
    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);
    cv::Scalar mean;
    cv::Scalar stddev;
    cv::meanStdDev(laplacian, mean, stddev);
    quality.clarity = stddev[0] * stddev[0];
    quality.skew = estimate_skew(gray);
  } catch (const cv::Exception& e) {
    return std::unexpected(bc::make_failure(bc::PipelineError::ExtractionError,
                                            std::string("quality analysis failed: ") + e.what()));
  }
  return quality;
}

}  // namespace bubblegrade::vision
