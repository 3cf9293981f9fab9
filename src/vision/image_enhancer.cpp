#include <bubblegrade/vision/image_enhancer.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <string>
#include <vector>

namespace bubblegrade::vision {

namespace bc = bubblegrade::core;

ImageEnhancer::ImageEnhancer(EnhancerParams params) : params_(params) {}

std::expected<bc::Frame, bc::ScanFailure> ImageEnhancer::enhance(const bc::Frame& input) const {
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(bc::make_failure(bc::PipelineError::InvalidFrame,
                                            "enhancer received an empty frame"));
  }

  try {
    cv::Mat bgr;
    if (mat_in->channels() == 1) {
      cv::cvtColor(*mat_in, bgr, cv::COLOR_GRAY2BGR);
    } else {
      bgr = *mat_in;
    }

    // bilateralFilter does not work in place; dst is always a fresh buffer.
    cv::Mat denoised;
    cv::bilateralFilter(bgr, denoised, params_.bilateral_diameter,
                        params_.bilateral_sigma_color, params_.bilateral_sigma_space);

    cv::Mat lab;
    cv::cvtColor(denoised, lab, cv::COLOR_BGR2Lab);
    std::vector<cv::Mat> channels;
    cv::split(lab, channels);

    auto clahe = cv::createCLAHE(params_.clahe_clip_limit,
                                 cv::Size(params_.clahe_tile_size, params_.clahe_tile_size));
    cv::Mat equalized;
    clahe->apply(channels[0], equalized);
    channels[0] = equalized;

    cv::Mat merged;
    cv::merge(channels, merged);
    cv::Mat enhanced;
    cv::cvtColor(merged, enhanced, cv::COLOR_Lab2BGR);
    return detail::mat_to_frame(enhanced, bc::PixelFormat::BGR8);
  } catch (const cv::Exception& e) {
    return std::unexpected(bc::make_failure(bc::PipelineError::ExtractionError,
                                            std::string("image enhancement failed: ") + e.what()));
  }
}

}  // namespace bubblegrade::vision
