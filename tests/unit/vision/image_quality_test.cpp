#include <bubblegrade/vision/image_quality.hpp>
#include "support/test_images.hpp"
#include <gtest/gtest.h>

namespace bc = bubblegrade::core;
namespace bv = bubblegrade::vision;
namespace bt = bubblegrade::test;

TEST(ImageQuality, BlankPage) {
  auto q = bv::analyze_image_quality(bt::to_frame(bt::white_page(320, 240)));
  ASSERT_TRUE(q.has_value());
  EXPECT_EQ(q->width, 320);
  EXPECT_EQ(q->height, 240);
  EXPECT_DOUBLE_EQ(q->clarity, 0.0);
  EXPECT_DOUBLE_EQ(q->skew, 0.0);
}

TEST(ImageQuality, SharpDetailRaisesClarity) {
  cv::Mat img = bt::white_page(320, 240);
  for (int x = 10; x < 310; x += 20) {
    cv::line(img, {x, 10}, {x, 230}, cv::Scalar(0, 0, 0), 2);
  }
  auto sharp = bv::analyze_image_quality(bt::to_frame(img));
  cv::Mat blurred;
  cv::GaussianBlur(img, blurred, {15, 15}, 0);
  auto soft = bv::analyze_image_quality(bt::to_frame(blurred));
  ASSERT_TRUE(sharp.has_value());
  ASSERT_TRUE(soft.has_value());
  EXPECT_GT(sharp->clarity, soft->clarity);
}

TEST(ImageQuality, EmptyFrameFails) {
  auto q = bv::analyze_image_quality(bc::Frame{});
  ASSERT_FALSE(q.has_value());
  EXPECT_EQ(q.error().code, bc::PipelineError::InvalidFrame);
}
