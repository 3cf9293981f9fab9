#pragma once

#include <bubblegrade/core/region.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bubblegrade::core {

using Timestamp = std::chrono::system_clock::time_point;

/// Lifecycle: Queued -> Processing -> {Completed | NeedsReview | Error};
/// NeedsReview -> Completed through corrections. Error is terminal.
enum class ScanStatus : std::uint8_t {
  Queued,
  Processing,
  Completed,
  Error,
  NeedsReview,
};

[[nodiscard]] std::string_view to_string(ScanStatus status) noexcept;

/// OCR-extracted fields of the sheet.
enum class FieldKind : std::uint8_t {
  Nombre,  // handwritten name
  Curp,    // printed identity code
};

[[nodiscard]] std::string_view to_string(FieldKind kind) noexcept;
[[nodiscard]] std::optional<FieldKind> parse_field_kind(std::string_view name) noexcept;
[[nodiscard]] RegionName region_of(FieldKind kind) noexcept;

/// Extracted text with its normalized confidence and review state.
struct FieldResult {
  std::string text;
  float confidence{0.f};  // [0, 1]
  bool needs_review{true};
  std::optional<std::string> corrected_by;
  std::optional<Timestamp> corrected_at;
};

/// One graded question. marked/expected are filled only in answer-key mode.
struct OmrAnswer {
  bool correct{false};
  std::optional<char> marked;
  std::optional<char> expected;
};

/// Resolution, sharpness (Laplacian variance) and skew in degrees.
struct ImageQuality {
  int width{0};
  int height{0};
  double clarity{0.0};
  double skew{0.0};
};

struct OmrResult {
  int score{0};
  std::vector<OmrAnswer> answers;
  int total{0};
  /// Quality metrics as reported by a remote grading service, if any.
  std::optional<ImageQuality> quality;
};

/// Aggregate root for one uploaded sheet.
struct ScanResult {
  std::string id;
  std::string filename;
  ScanStatus status{ScanStatus::Queued};
  std::optional<RegionSet> regions;
  std::optional<OmrResult> omr;
  std::optional<FieldResult> nombre;
  std::optional<FieldResult> curp;
  std::optional<ImageQuality> quality;
  Timestamp upload_time{};
  std::optional<Timestamp> processed_time;
  std::optional<std::string> error_message;

  [[nodiscard]] const std::optional<FieldResult>& field(FieldKind kind) const noexcept {
    return kind == FieldKind::Nombre ? nombre : curp;
  }
  [[nodiscard]] std::optional<FieldResult>& field(FieldKind kind) noexcept {
    return kind == FieldKind::Nombre ? nombre : curp;
  }
};

/// Random RFC 4122 version-4 identifier, lowercase hex with dashes.
[[nodiscard]] std::string generate_scan_id();

/// New record in Queued state with a fresh id.
[[nodiscard]] ScanResult make_queued_scan(std::string filename, Timestamp upload_time);

}  // namespace bubblegrade::core
