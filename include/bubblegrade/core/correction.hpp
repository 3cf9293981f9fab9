#pragma once

#include <bubblegrade/core/error.hpp>
#include <bubblegrade/core/scan_result.hpp>
#include <expected>
#include <optional>
#include <span>
#include <string>

namespace bubblegrade::core {

/// Manual fix for one field, supplied by a reviewer.
struct FieldCorrection {
  FieldKind field{FieldKind::Nombre};
  std::string text;
  std::string corrected_by;
  std::optional<float> confidence;  // keep the OCR confidence when unset
  bool needs_review{false};
};

/// Apply one correction to a NeedsReview or Completed record.
/// Fails with InvalidTransition for Queued/Processing/Error records (or when
/// trying to reopen a field of a Completed record) and with
/// InvalidCorrection for a curp text that does not match the CURP pattern.
/// Status becomes Completed only once both fields are cleared.
[[nodiscard]] std::expected<void, ScanFailure> apply_correction(ScanResult& scan,
                                                                const FieldCorrection& correction,
                                                                Timestamp corrected_at);

/// All-or-nothing: the record is left untouched if any correction is rejected.
[[nodiscard]] std::expected<void, ScanFailure> apply_corrections(
    ScanResult& scan,
    std::span<const FieldCorrection> corrections,
    Timestamp corrected_at);

}  // namespace bubblegrade::core
