#include <bubblegrade/core/result_merger.hpp>
#include <bubblegrade/core/curp.hpp>
#include <algorithm>
#include <string>

namespace bubblegrade::core {

namespace {

std::string trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n\f\v");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n\f\v");
  return std::string(s.substr(start, end - start + 1));
}

}  // namespace

FieldResult make_field_result(FieldKind kind,
                              std::string_view raw_text,
                              float raw_confidence) {
  FieldResult field;
  field.confidence = std::clamp(raw_confidence, 0.f, 1.f);
  if (kind == FieldKind::Nombre) {
    field.text = trim(raw_text);
  } else {
    field.text = normalize_curp_text(raw_text);
    if (!matches_curp_pattern(field.text)) {
      field.confidence = 0.f;
    }
  }
  return field;
}

bool nombre_needs_review(const FieldResult& nombre,
                         const ReviewThresholds& thresholds) noexcept {
  return nombre.confidence < thresholds.nombre;
}

bool curp_needs_review(const FieldResult& curp,
                       const ReviewThresholds& thresholds) noexcept {
  return curp.confidence < thresholds.curp || !matches_curp_pattern(curp.text);
}

ScanStatus resolve_status(const OmrResult& omr,
                          const FieldResult& nombre,
                          const FieldResult& curp) noexcept {
  if (nombre.needs_review || curp.needs_review || omr.score == 0) {
    return ScanStatus::NeedsReview;
  }
  return ScanStatus::Completed;
}

void merge_scan_results(ScanResult& scan,
                        OmrResult omr,
                        FieldResult nombre,
                        FieldResult curp,
                        const ReviewThresholds& thresholds,
                        Timestamp processed_at) {
  if (!matches_curp_pattern(curp.text)) {
    curp.confidence = 0.f;
  }
  nombre.needs_review = nombre_needs_review(nombre, thresholds);
  curp.needs_review = curp_needs_review(curp, thresholds);
  scan.status = resolve_status(omr, nombre, curp);
  if (omr.quality) {
    scan.quality = omr.quality;
  }
  scan.omr = std::move(omr);
  scan.nombre = std::move(nombre);
  scan.curp = std::move(curp);
  scan.processed_time = processed_at;
  scan.error_message.reset();
}

void mark_scan_failed(ScanResult& scan, const ScanFailure& failure, Timestamp failed_at) {
  scan.status = ScanStatus::Error;
  scan.error_message = failure.message.empty() ? std::string(to_string(failure.code))
                                               : failure.message;
  scan.processed_time = failed_at;
}

}  // namespace bubblegrade::core
