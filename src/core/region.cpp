#include <bubblegrade/core/region.hpp>
#include <algorithm>

namespace bubblegrade::core {

std::string_view to_string(RegionName name) noexcept {
  switch (name) {
    case RegionName::Omr:
      return "omr";
    case RegionName::Nombre:
      return "nombre";
    case RegionName::Curp:
      return "curp";
  }
  return "unknown";
}

const RegionBoundingBox& RegionSet::at(RegionName name) const noexcept {
  switch (name) {
    case RegionName::Nombre:
      return nombre;
    case RegionName::Curp:
      return curp;
    case RegionName::Omr:
    default:
      return omr;
  }
}

bool is_within(const RegionBoundingBox& box,
               int image_width,
               int image_height) noexcept {
  if (box.width <= 0 || box.height <= 0) return false;
  if (box.x < 0 || box.y < 0) return false;
  return box.x + box.width <= image_width && box.y + box.height <= image_height;
}

RegionBoundingBox clip_to_image(RegionBoundingBox box,
                                int image_width,
                                int image_height) noexcept {
  box.x = std::clamp(box.x, 0, image_width - 1);
  box.y = std::clamp(box.y, 0, image_height - 1);
  box.width = std::clamp(box.width, 1, image_width - box.x);
  box.height = std::clamp(box.height, 1, image_height - box.y);
  return box;
}

}  // namespace bubblegrade::core
