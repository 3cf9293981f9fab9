#include <bubblegrade/core/frame.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace bc = bubblegrade::core;

TEST(Frame, DefaultEmpty) {
  bc::Frame f;
  EXPECT_EQ(f.width(), 0u);
  EXPECT_EQ(f.height(), 0u);
  EXPECT_TRUE(f.empty());
  EXPECT_FALSE(f.valid());
  EXPECT_EQ(f.size_bytes(), 0u);
}

TEST(Frame, ConstructFromBuffer) {
  std::vector<std::byte> buf(100 * 80 * 3);
  bc::Frame f(100, 80, bc::PixelFormat::BGR8, std::move(buf));
  EXPECT_EQ(f.width(), 100u);
  EXPECT_EQ(f.height(), 80u);
  EXPECT_EQ(f.format(), bc::PixelFormat::BGR8);
  EXPECT_TRUE(f.valid());
  EXPECT_EQ(f.data().size(), 100u * 80 * 3);
}

TEST(Frame, ShortBufferIsInvalid) {
  std::vector<std::byte> buf(10);
  bc::Frame f(100, 80, bc::PixelFormat::Grayscale8, std::move(buf));
  EXPECT_FALSE(f.empty());
  EXPECT_FALSE(f.valid());
}

TEST(Frame, UnknownFormatIsInvalid) {
  std::vector<std::byte> buf(16);
  bc::Frame f(4, 4, bc::PixelFormat::Unknown, std::move(buf));
  EXPECT_FALSE(f.valid());
}

TEST(Frame, MinBytes) {
  EXPECT_EQ(bc::Frame::min_bytes(10, 10, bc::PixelFormat::Grayscale8), 100u);
  EXPECT_EQ(bc::Frame::min_bytes(10, 10, bc::PixelFormat::BGR8), 300u);
  EXPECT_EQ(bc::Frame::channels(bc::PixelFormat::BGR8), 3u);
}
