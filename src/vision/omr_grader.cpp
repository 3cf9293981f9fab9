#include <bubblegrade/vision/omr_grader.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace bubblegrade::vision {

namespace bc = bubblegrade::core;

namespace {

struct Bubble {
  cv::Point2f center;
  float radius{0.f};
  double mean_intensity{0.0};
};

double mean_inside(const cv::Mat& gray, const cv::Point2f& center, float radius) {
  cv::Mat mask = cv::Mat::zeros(gray.size(), CV_8UC1);
  cv::circle(mask, cv::Point(cvRound(center.x), cvRound(center.y)), cvRound(radius),
             cv::Scalar(255), cv::FILLED);
  return cv::mean(gray, mask)[0];
}

/// Rows top to bottom, each sorted left to right. A bubble joins the current row
/// while its center stays within row_tolerance of the row's first bubble.
std::vector<std::vector<Bubble>> group_rows(std::vector<Bubble> bubbles, float row_tolerance) {
  std::sort(bubbles.begin(), bubbles.end(),
            [](const Bubble& a, const Bubble& b) { return a.center.y < b.center.y; });
  std::vector<std::vector<Bubble>> rows;
  for (auto& bubble : bubbles) {
    if (rows.empty() || std::abs(bubble.center.y - rows.back().front().center.y) > row_tolerance) {
      rows.emplace_back();
    }
    rows.back().push_back(bubble);
  }
  for (auto& row : rows) {
    std::sort(row.begin(), row.end(),
              [](const Bubble& a, const Bubble& b) { return a.center.x < b.center.x; });
  }
  return rows;
}

float row_center_y(const std::vector<Bubble>& row) {
  float sum = 0.f;
  for (const auto& b : row) sum += b.center.y;
  return sum / static_cast<float>(row.size());
}

/// Question slot for each detected row. Rows are placed by their offset from the first
/// row in units of the smallest row gap, so an undetected row leaves its question empty
/// instead of shifting later rows onto the wrong key entry.
std::vector<const std::vector<Bubble>*> rows_by_question(
    const std::vector<std::vector<Bubble>>& rows, std::size_t questions) {
  std::vector<const std::vector<Bubble>*> slots(questions, nullptr);
  if (rows.empty()) return slots;

  std::vector<float> ys;
  ys.reserve(rows.size());
  for (const auto& row : rows) ys.push_back(row_center_y(row));
  float pitch = 0.f;
  for (std::size_t i = 1; i < ys.size(); ++i) {
    const float gap = ys[i] - ys[i - 1];
    if (pitch == 0.f || gap < pitch) pitch = gap;
  }

  for (std::size_t i = 0; i < rows.size(); ++i) {
    const std::size_t q =
        pitch > 0.f ? static_cast<std::size_t>(std::lround((ys[i] - ys[0]) / pitch)) : i;
    if (q < questions && slots[q] == nullptr) slots[q] = &rows[i];
  }
  return slots;
}

std::optional<char> marked_choice(const std::vector<Bubble>& row, double min_contrast) {
  if (row.empty()) return std::nullopt;
  std::size_t darkest = 0;
  for (std::size_t i = 1; i < row.size(); ++i) {
    if (row[i].mean_intensity < row[darkest].mean_intensity) darkest = i;
  }
  double runner_up = 255.0;
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (i != darkest) runner_up = std::min(runner_up, row[i].mean_intensity);
  }
  if (runner_up - row[darkest].mean_intensity < min_contrast) return std::nullopt;
  return static_cast<char>('A' + static_cast<int>(darkest));
}

}  // namespace

OmrGrader::OmrGrader(OmrParams params, std::vector<char> answer_key)
    : params_(params), answer_key_(std::move(answer_key)) {}

std::expected<bc::OmrResult, bc::ScanFailure> OmrGrader::grade(
    const bc::Frame& enhanced,
    const bc::RegionBoundingBox& roi) const {
  auto mat = detail::frame_to_mat(enhanced);
  if (!mat) {
    return std::unexpected(bc::make_failure(bc::PipelineError::InvalidFrame,
                                            "omr grader received an empty frame"));
  }
  const cv::Mat region = detail::crop(*mat, roi);
  if (region.empty()) {
    return std::unexpected(bc::make_failure(bc::PipelineError::ExtractionError,
                                            "omr region lies outside the image"));
  }

  cv::Mat blurred;
  std::vector<cv::Vec3f> circles;
  try {
    const cv::Mat gray = detail::to_gray(region);
    cv::GaussianBlur(gray, blurred, cv::Size(params_.blur_kernel, params_.blur_kernel), 0);
    cv::HoughCircles(blurred, circles, cv::HOUGH_GRADIENT, params_.dp, params_.min_dist,
                     params_.canny_threshold, params_.accumulator_threshold,
                     params_.min_radius, params_.max_radius);
  } catch (const cv::Exception& e) {
    return std::unexpected(bc::make_failure(bc::PipelineError::ExtractionError,
                                            std::string("bubble detection failed: ") + e.what()));
  }

  bc::OmrResult result;
  if (answer_key_.empty()) {
    const int count = static_cast<int>(circles.size());
    result.total = count;
    result.score = count;
    result.answers.assign(circles.size(), bc::OmrAnswer{true, std::nullopt, std::nullopt});
    return result;
  }

  std::vector<Bubble> bubbles;
  bubbles.reserve(circles.size());
  for (const auto& c : circles) {
    const cv::Point2f center(c[0], c[1]);
    bubbles.push_back({center, c[2], mean_inside(blurred, center, c[2])});
  }
  const auto rows = group_rows(std::move(bubbles), static_cast<float>(params_.max_radius));

  const auto slots = rows_by_question(rows, answer_key_.size());

  result.total = static_cast<int>(answer_key_.size());
  result.answers.reserve(answer_key_.size());
  for (std::size_t q = 0; q < answer_key_.size(); ++q) {
    bc::OmrAnswer answer;
    answer.expected = answer_key_[q];
    if (slots[q] != nullptr) {
      answer.marked = marked_choice(*slots[q], params_.min_fill_contrast);
    }
    answer.correct = answer.marked.has_value() && *answer.marked == answer_key_[q];
    if (answer.correct) ++result.score;
    result.answers.push_back(answer);
  }
  return result;
}

}  // namespace bubblegrade::vision
