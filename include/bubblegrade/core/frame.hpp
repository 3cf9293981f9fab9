#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace bubblegrade::core {

/// Pixel layout of a decoded document image.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  BGR8,
};

/// Decoded image: dimensions, format and owned pixel buffer.
///
/// Memory: Frame owns a single contiguous, tightly packed buffer
/// (std::vector<std::byte>); rows follow each other without padding.
/// Use data() for std::span views (non-owning).
/// Thread-safety: concurrent reads of one Frame are safe; writes need
/// external synchronization.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True when dimensions are non-zero and the buffer holds every pixel.
  [[nodiscard]] bool valid() const noexcept;

  [[nodiscard]] static std::uint32_t channels(PixelFormat format) noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace bubblegrade::core
