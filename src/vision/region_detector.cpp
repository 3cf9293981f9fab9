#include <bubblegrade/vision/region_detector.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bubblegrade::vision {

namespace bc = bubblegrade::core;

namespace {

int fraction_of(double fraction, int extent) {
  return static_cast<int>(fraction * extent);
}

/// Bounding rect of the largest contour when it simplifies to four vertices.
std::optional<cv::Rect> find_document_boundary(const cv::Mat& edges, double approx_epsilon) {
  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(edges, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
  if (contours.empty()) return std::nullopt;

  std::size_t largest = 0;
  double largest_area = -1.0;
  for (std::size_t i = 0; i < contours.size(); ++i) {
    const double area = cv::contourArea(contours[i]);
    if (area > largest_area) {
      largest_area = area;
      largest = i;
    }
  }

  const double perimeter = cv::arcLength(contours[largest], true);
  std::vector<cv::Point> approx;
  cv::approxPolyDP(contours[largest], approx, approx_epsilon * perimeter, true);
  if (approx.size() != 4u) return std::nullopt;
  return cv::boundingRect(approx);
}

}  // namespace

bc::RegionSet layout_regions(const bc::RegionBoundingBox& boundary,
                             int image_width,
                             int image_height,
                             const RegionLayout& layout) {
  const int x = boundary.x;
  const int y = boundary.y;
  const int w = boundary.width;
  const int h = boundary.height;

  const int roi_x = x + fraction_of(layout.margin_x, w);
  const int roi_w = fraction_of(layout.width, w);
  const int nombre_y = y + fraction_of(layout.nombre_top, h);
  const int nombre_h = fraction_of(layout.nombre_height, h);
  const int curp_y = y + fraction_of(layout.curp_top, h);
  const int curp_h = fraction_of(layout.curp_height, h);
  const int omr_y = y + fraction_of(layout.omr_top, h);
  const int omr_h = h - (omr_y - y);

  bc::RegionSet regions;
  regions.nombre = bc::clip_to_image({roi_x, nombre_y, roi_w, nombre_h}, image_width, image_height);
  regions.curp = bc::clip_to_image({roi_x, curp_y, roi_w, curp_h}, image_width, image_height);
  regions.omr = bc::clip_to_image({roi_x, omr_y, roi_w, omr_h}, image_width, image_height);
  return regions;
}

RegionDetector::RegionDetector(RegionDetectorParams params) : params_(params) {}

std::expected<bc::RegionSet, bc::ScanFailure> RegionDetector::detect(
    const bc::Frame& enhanced) const {
  auto mat = detail::frame_to_mat(enhanced);
  if (!mat) {
    return std::unexpected(bc::make_failure(bc::PipelineError::InvalidFrame,
                                            "region detector received an empty frame"));
  }
  const int width = mat->cols;
  const int height = mat->rows;

  std::optional<cv::Rect> boundary;
  try {
    const cv::Mat gray = detail::to_gray(*mat);
    cv::Mat blurred;
    cv::GaussianBlur(gray, blurred, cv::Size(params_.blur_kernel, params_.blur_kernel), 0);
    cv::Mat edges;
    cv::Canny(blurred, edges, params_.canny_low, params_.canny_high);
    boundary = find_document_boundary(edges, params_.approx_epsilon);
  } catch (const cv::Exception& e) {
    return std::unexpected(bc::make_failure(bc::PipelineError::ExtractionError,
                                            std::string("region detection failed: ") + e.what()));
  }

  bc::RegionBoundingBox frame_box{0, 0, width, height};
  bool fallback = true;
  if (boundary) {
    const cv::Rect clipped = *boundary & cv::Rect(0, 0, width, height);
    if (clipped.width > 0 && clipped.height > 0) {
      frame_box = {clipped.x, clipped.y, clipped.width, clipped.height};
      fallback = false;
    }
  }

  bc::RegionSet regions = layout_regions(frame_box, width, height, params_.layout);
  regions.fallback_layout = fallback;
  return regions;
}

}  // namespace bubblegrade::vision
