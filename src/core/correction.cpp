#include <bubblegrade/core/correction.hpp>
#include <bubblegrade/core/curp.hpp>
#include <algorithm>

namespace bubblegrade::core {

std::expected<void, ScanFailure> apply_correction(ScanResult& scan,
                                                  const FieldCorrection& correction,
                                                  Timestamp corrected_at) {
  if (scan.status != ScanStatus::NeedsReview && scan.status != ScanStatus::Completed) {
    return std::unexpected(make_failure(
        PipelineError::InvalidTransition,
        "scan " + scan.id + " cannot be corrected in status " +
            std::string(to_string(scan.status))));
  }

  if (scan.status == ScanStatus::Completed && correction.needs_review) {
    return std::unexpected(make_failure(PipelineError::InvalidTransition,
                                        "scan " + scan.id + " is completed; fields cannot be reopened"));
  }

  std::string text = correction.text;
  if (correction.field == FieldKind::Curp) {
    text = normalize_curp_text(text);
    if (!matches_curp_pattern(text)) {
      return std::unexpected(make_failure(PipelineError::InvalidCorrection,
                                          "curp '" + text + "' does not match the CURP format"));
    }
  }

  auto& slot = scan.field(correction.field);
  if (!slot) slot.emplace();
  slot->text = std::move(text);
  slot->needs_review = correction.needs_review;
  slot->corrected_by = correction.corrected_by;
  slot->corrected_at = corrected_at;
  if (correction.confidence) {
    slot->confidence = std::clamp(*correction.confidence, 0.f, 1.f);
  }

  const bool nombre_open = !scan.nombre || scan.nombre->needs_review;
  const bool curp_open = !scan.curp || scan.curp->needs_review;
  scan.status = (nombre_open || curp_open) ? ScanStatus::NeedsReview : ScanStatus::Completed;
  return {};
}

std::expected<void, ScanFailure> apply_corrections(
    ScanResult& scan,
    std::span<const FieldCorrection> corrections,
    Timestamp corrected_at) {
  ScanResult working = scan;
  for (const auto& correction : corrections) {
    auto applied = apply_correction(working, correction, corrected_at);
    if (!applied) {
      return std::unexpected(applied.error());
    }
  }
  scan = std::move(working);
  return {};
}

}  // namespace bubblegrade::core
