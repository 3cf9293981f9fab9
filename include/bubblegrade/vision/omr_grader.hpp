#pragma once

#include <bubblegrade/core/error.hpp>
#include <bubblegrade/core/frame.hpp>
#include <bubblegrade/core/region.hpp>
#include <bubblegrade/core/scan_result.hpp>
#include <expected>
#include <vector>

namespace bubblegrade::vision {

/// HoughCircles settings tuned for the printed bubble size.
struct OmrParams {
  int blur_kernel{5};
  double dp{1.2};
  double min_dist{20.0};
  double canny_threshold{50.0};
  double accumulator_threshold{30.0};
  int min_radius{10};
  int max_radius{20};
  /// Answer-key mode: the darkest bubble of a row counts as marked only if it is at
  /// least this many gray levels darker than the next darkest one.
  double min_fill_contrast{20.0};
};

/// Detects bubble marks inside the omr region.
///
/// Without an answer key every detected circle counts as one correct answer
/// (score == total == number of circles). With a key, circles are grouped into rows
/// (one row per question, top to bottom), the darkest bubble of a row is its marked
/// choice ('A' + column index), and the score is the number of rows matching the key.
/// Rows map to questions by their distance from the first detected row in units of
/// the row pitch, so a missed row leaves its question unmarked. The first row and
/// every bubble column must be detected for the mapping to hold.
class OmrGrader {
 public:
  explicit OmrGrader(OmrParams params = {}, std::vector<char> answer_key = {});

  [[nodiscard]] std::expected<bubblegrade::core::OmrResult, bubblegrade::core::ScanFailure>
  grade(const bubblegrade::core::Frame& enhanced,
        const bubblegrade::core::RegionBoundingBox& roi) const;

  [[nodiscard]] bool uses_answer_key() const noexcept { return !answer_key_.empty(); }
  [[nodiscard]] const OmrParams& params() const noexcept { return params_; }

 private:
  OmrParams params_;
  std::vector<char> answer_key_;
};

}  // namespace bubblegrade::vision
