#pragma once

#include <cstdint>
#include <string_view>

namespace bubblegrade::core {

/// Axis-aligned box in pixel coordinates of the enhanced image.
struct RegionBoundingBox {
  int x{0};
  int y{0};
  int width{0};
  int height{0};

  friend bool operator==(const RegionBoundingBox&, const RegionBoundingBox&) = default;
};

/// Named areas of the printed answer sheet.
enum class RegionName : std::uint8_t {
  Omr,
  Nombre,
  Curp,
};

[[nodiscard]] std::string_view to_string(RegionName name) noexcept;

/// One box per named region; never partially populated.
struct RegionSet {
  RegionBoundingBox omr{};
  RegionBoundingBox nombre{};
  RegionBoundingBox curp{};
  /// Set when no 4-corner document outline was found and the full frame was used.
  bool fallback_layout{false};

  [[nodiscard]] const RegionBoundingBox& at(RegionName name) const noexcept;
};

/// True when the box has positive size and lies inside a width x height image.
[[nodiscard]] bool is_within(const RegionBoundingBox& box,
                             int image_width,
                             int image_height) noexcept;

/// Clamp box into the image, keeping at least one pixel in each dimension.
/// Image dimensions must be positive.
[[nodiscard]] RegionBoundingBox clip_to_image(RegionBoundingBox box,
                                              int image_width,
                                              int image_height) noexcept;

}  // namespace bubblegrade::core
