#pragma once

#include <bubblegrade/vision/grading_backend.hpp>
#include <atomic>
#include <optional>
#include <stdexcept>
#include <string>

namespace bubblegrade::test {

/// Grading backend with fixed answers, for tests that do not exercise OpenCV/OCR.
class ScriptedBackend : public bubblegrade::vision::IGradingBackend {
 public:
  std::string_view name() const noexcept override { return "scripted"; }

  std::expected<bubblegrade::core::OmrResult, bubblegrade::core::ScanFailure> grade_omr(
      const bubblegrade::core::Frame&, const bubblegrade::core::RegionBoundingBox&) override {
    ++omr_calls;
    if (omr_throws) throw std::runtime_error("omr engine crashed");
    if (omr_failure) return std::unexpected(*omr_failure);
    bubblegrade::core::OmrResult r;
    r.score = score;
    r.total = score;
    r.answers.assign(static_cast<std::size_t>(score),
                     bubblegrade::core::OmrAnswer{true, std::nullopt, std::nullopt});
    return r;
  }

  std::expected<bubblegrade::core::FieldResult, bubblegrade::core::ScanFailure> extract_field(
      const bubblegrade::core::Frame&, const bubblegrade::core::RegionBoundingBox&,
      bubblegrade::core::FieldKind kind) override {
    ++field_calls;
    if (kind == bubblegrade::core::FieldKind::Curp && curp_failure) {
      return std::unexpected(*curp_failure);
    }
    bubblegrade::core::FieldResult f;
    const bool nombre = kind == bubblegrade::core::FieldKind::Nombre;
    f.text = nombre ? nombre_text : curp_text;
    f.confidence = nombre ? nombre_confidence : curp_confidence;
    return f;
  }

  int score{4};
  std::string nombre_text{"ANA"};
  float nombre_confidence{0.9f};
  std::string curp_text{"GODE561231HDFRRN06"};
  float curp_confidence{0.95f};
  std::atomic<int> omr_calls{0};
  std::atomic<int> field_calls{0};
  bool omr_throws{false};
  std::optional<bubblegrade::core::ScanFailure> omr_failure;
  std::optional<bubblegrade::core::ScanFailure> curp_failure;
};

}  // namespace bubblegrade::test
