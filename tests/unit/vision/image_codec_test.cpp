#include <bubblegrade/vision/image_codec.hpp>
#include "support/test_images.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <vector>

namespace bc = bubblegrade::core;
namespace bv = bubblegrade::vision;
namespace bt = bubblegrade::test;

TEST(ImageCodec, DecodesPngToBgr) {
  const auto bytes = bt::encode(bt::white_page(64, 48));
  auto frame = bv::decode_frame(bytes);
  ASSERT_TRUE(frame.has_value()) << frame.error().message;
  EXPECT_EQ(frame->width(), 64u);
  EXPECT_EQ(frame->height(), 48u);
  EXPECT_EQ(frame->format(), bc::PixelFormat::BGR8);
  EXPECT_TRUE(frame->valid());
}

TEST(ImageCodec, GrayscaleUploadIsPromotedToBgr) {
  const cv::Mat gray(20, 30, CV_8UC1, cv::Scalar(128));
  auto frame = bv::decode_frame(bt::encode(gray));
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->format(), bc::PixelFormat::BGR8);
  EXPECT_EQ(frame->size_bytes(), 20u * 30u * 3u);
}

TEST(ImageCodec, MalformedBytesFail) {
  const std::vector<std::byte> junk(256, std::byte{0x5a});
  auto frame = bv::decode_frame(junk);
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error().code, bc::PipelineError::DecodeError);
}

TEST(ImageCodec, EmptyUploadFails) {
  auto frame = bv::decode_frame({});
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error().code, bc::PipelineError::DecodeError);
}

TEST(ImageCodec, OversizedUploadFails) {
  const auto bytes = bt::encode(bt::white_page(64, 48));
  auto frame = bv::decode_frame(bytes, bytes.size() - 1);
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error().code, bc::PipelineError::DecodeError);
}

TEST(ImageCodec, EncodeRegionAsJpeg) {
  const auto frame = bt::to_frame(bt::white_page(100, 80));
  auto jpeg = bv::encode_jpeg(frame, bc::RegionBoundingBox{10, 10, 40, 20});
  ASSERT_TRUE(jpeg.has_value());
  auto back = bv::decode_frame(*jpeg);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(back->width(), 40u);
  EXPECT_EQ(back->height(), 20u);
}

TEST(ImageCodec, EncodeEmptyFrameFails) {
  auto jpeg = bv::encode_jpeg(bc::Frame{});
  ASSERT_FALSE(jpeg.has_value());
  EXPECT_EQ(jpeg.error().code, bc::PipelineError::InvalidFrame);
}

TEST(ImageCodec, ReadUploadFile) {
  const auto dir = std::filesystem::temp_directory_path();
  const auto sheet = dir / "bubblegrade_read_upload.png";
  const auto bytes = bt::encode(bt::white_page(16, 16));
  {
    std::ofstream out(sheet, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
  }
  auto read = bv::read_upload_file(sheet);
  ASSERT_TRUE(read.has_value()) << read.error().message;
  EXPECT_EQ(*read, bytes);
  std::filesystem::remove(sheet);
}

TEST(ImageCodec, ReadUploadFileMissingOrEmptyFails) {
  const auto dir = std::filesystem::temp_directory_path();
  auto missing = bv::read_upload_file(dir / "bubblegrade_no_such_sheet.jpg");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, bc::PipelineError::DecodeError);

  const auto empty_file = dir / "bubblegrade_empty_sheet.jpg";
  { std::ofstream out(empty_file, std::ios::binary); }
  auto empty = bv::read_upload_file(empty_file);
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().code, bc::PipelineError::DecodeError);
  std::filesystem::remove(empty_file);
}
