#include <bubblegrade/vision/image_enhancer.hpp>
#include "support/test_images.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

namespace bc = bubblegrade::core;
namespace bv = bubblegrade::vision;
namespace bt = bubblegrade::test;

TEST(ImageEnhancer, KeepsSizeAndFormat) {
  cv::Mat img = bt::white_page(120, 90);
  cv::putText(img, "JUAN", {10, 50}, cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(40, 40, 40), 2);
  const auto input = bt::to_frame(img);

  bv::ImageEnhancer enhancer;
  auto out = enhancer.enhance(input);
  ASSERT_TRUE(out.has_value()) << out.error().message;
  EXPECT_EQ(out->width(), 120u);
  EXPECT_EQ(out->height(), 90u);
  EXPECT_EQ(out->format(), bc::PixelFormat::BGR8);
}

TEST(ImageEnhancer, InputIsNotModified) {
  cv::Mat img(60, 60, CV_8UC3, cv::Scalar(90, 100, 110));
  cv::circle(img, {30, 30}, 12, cv::Scalar(10, 10, 10), cv::FILLED);
  const auto input = bt::to_frame(img);
  const std::vector<std::byte> before(input.data().begin(), input.data().end());

  ASSERT_TRUE(bv::ImageEnhancer{}.enhance(input).has_value());
  EXPECT_TRUE(std::equal(before.begin(), before.end(), input.data().begin()));
}

TEST(ImageEnhancer, GrayscaleIsPromoted) {
  const auto input = bt::to_frame(cv::Mat(40, 50, CV_8UC1, cv::Scalar(100)));
  auto out = bv::ImageEnhancer{}.enhance(input);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), bc::PixelFormat::BGR8);
  EXPECT_EQ(out->size_bytes(), 40u * 50u * 3u);
}

TEST(ImageEnhancer, EmptyFrameFails) {
  auto out = bv::ImageEnhancer{}.enhance(bc::Frame{});
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error().code, bc::PipelineError::InvalidFrame);
}

TEST(ImageEnhancer, ParamsAreKept) {
  bv::EnhancerParams params;
  params.clahe_clip_limit = 3.5;
  bv::ImageEnhancer enhancer(params);
  EXPECT_DOUBLE_EQ(enhancer.params().clahe_clip_limit, 3.5);
  EXPECT_EQ(enhancer.params().bilateral_diameter, 9);
}
