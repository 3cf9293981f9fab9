#pragma once

#include <bubblegrade/core/error.hpp>
#include <bubblegrade/core/scan_result.hpp>
#include <string_view>

namespace bubblegrade::core {

/// Confidence below which a field is routed to human review.
struct ReviewThresholds {
  float nombre{0.8f};
  float curp{0.9f};
};

/// Build a FieldResult from raw OCR output.
/// nombre: text trimmed. curp: whitespace removed, and confidence forced to 0
/// when the text does not match the CURP pattern. Confidence is clamped to [0, 1].
[[nodiscard]] FieldResult make_field_result(FieldKind kind,
                                            std::string_view raw_text,
                                            float raw_confidence);

[[nodiscard]] bool nombre_needs_review(const FieldResult& nombre,
                                       const ReviewThresholds& thresholds) noexcept;

/// Low confidence or pattern mismatch.
[[nodiscard]] bool curp_needs_review(const FieldResult& curp,
                                     const ReviewThresholds& thresholds) noexcept;

/// NeedsReview when any field is flagged or nothing was scored.
[[nodiscard]] ScanStatus resolve_status(const OmrResult& omr,
                                        const FieldResult& nombre,
                                        const FieldResult& curp) noexcept;

/// Store grading output on the record, flag fields and decide the final status.
/// A curp whose text fails the identity-code pattern is stored with confidence 0.
void merge_scan_results(ScanResult& scan,
                        OmrResult omr,
                        FieldResult nombre,
                        FieldResult curp,
                        const ReviewThresholds& thresholds,
                        Timestamp processed_at);

/// Move the record to Error. Whatever partial results it already holds are kept.
void mark_scan_failed(ScanResult& scan, const ScanFailure& failure, Timestamp failed_at);

}  // namespace bubblegrade::core
