#include <bubblegrade/core/scan_result.hpp>
#include <array>
#include <cstdint>
#include <random>

namespace bubblegrade::core {

std::string_view to_string(ScanStatus status) noexcept {
  switch (status) {
    case ScanStatus::Queued:
      return "QUEUED";
    case ScanStatus::Processing:
      return "PROCESSING";
    case ScanStatus::Completed:
      return "COMPLETED";
    case ScanStatus::Error:
      return "ERROR";
    case ScanStatus::NeedsReview:
      return "NEEDS_REVIEW";
  }
  return "UNKNOWN";
}

std::string_view to_string(FieldKind kind) noexcept {
  return kind == FieldKind::Nombre ? "nombre" : "curp";
}

std::optional<FieldKind> parse_field_kind(std::string_view name) noexcept {
  if (name == "nombre") return FieldKind::Nombre;
  if (name == "curp") return FieldKind::Curp;
  return std::nullopt;
}

RegionName region_of(FieldKind kind) noexcept {
  return kind == FieldKind::Nombre ? RegionName::Nombre : RegionName::Curp;
}

std::string generate_scan_id() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::array<std::uint8_t, 16> bytes{};
  for (std::size_t i = 0; i < bytes.size(); i += 8) {
    const std::uint64_t v = rng();
    for (std::size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<std::uint8_t>(v >> (j * 8));
    }
  }
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // variant 10xx

  static constexpr char kHex[] = "0123456789abcdef";
  std::string id;
  id.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) id.push_back('-');
    id.push_back(kHex[bytes[i] >> 4]);
    id.push_back(kHex[bytes[i] & 0x0F]);
  }
  return id;
}

ScanResult make_queued_scan(std::string filename, Timestamp upload_time) {
  ScanResult scan;
  scan.id = generate_scan_id();
  scan.filename = std::move(filename);
  scan.status = ScanStatus::Queued;
  scan.upload_time = upload_time;
  return scan;
}

}  // namespace bubblegrade::core
