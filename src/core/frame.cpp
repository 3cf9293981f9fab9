#include <bubblegrade/core/frame.hpp>
#include <cstddef>

namespace bubblegrade::core {

std::uint32_t Frame::channels(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  return pixels * channels(format);
}

bool Frame::valid() const noexcept {
  if (width_ == 0 || height_ == 0 || format_ == PixelFormat::Unknown) {
    return false;
  }
  return buffer_.size() >= min_bytes(width_, height_, format_);
}

}  // namespace bubblegrade::core
