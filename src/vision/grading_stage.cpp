#include <bubblegrade/vision/grading_stage.hpp>
#include <spdlog/spdlog.h>
#include <future>

namespace bubblegrade::vision {

namespace bc = bubblegrade::core;

GradingStage::GradingStage(IGradingBackend& backend, bool parallel)
    : backend_(backend), parallel_(parallel) {}

std::expected<void, bc::ScanFailure> GradingStage::process(bc::ScanContext& context) {
  if (!context.regions || !context.enhanced.valid()) {
    return std::unexpected(bc::make_failure(bc::PipelineError::InvalidFrame,
                                            "grading requires an enhanced frame and regions"));
  }
  const bc::RegionSet regions = *context.regions;
  const bc::Frame& enhanced = context.enhanced;

  auto extract_fields = [&]() -> std::expected<void, bc::ScanFailure> {
    auto nombre = backend_.extract_field(enhanced, regions.nombre, bc::FieldKind::Nombre);
    if (!nombre) return std::unexpected(nombre.error());
    context.nombre = std::move(*nombre);

    auto curp = backend_.extract_field(enhanced, regions.curp, bc::FieldKind::Curp);
    if (!curp) return std::unexpected(curp.error());
    context.curp = std::move(*curp);
    return {};
  };

  std::expected<bc::OmrResult, bc::ScanFailure> omr;
  std::expected<void, bc::ScanFailure> fields;
  if (parallel_) {
    auto pending = std::async(std::launch::async,
                              [this, &enhanced, &regions] {
                                return backend_.grade_omr(enhanced, regions.omr);
                              });
    fields = extract_fields();
    omr = pending.get();
  } else {
    omr = backend_.grade_omr(enhanced, regions.omr);
    fields = extract_fields();
  }

  if (omr) {
    spdlog::debug("{} backend: {} of {} bubbles scored", backend_.name(), omr->score, omr->total);
    context.omr = std::move(*omr);
  } else {
    return std::unexpected(std::move(omr.error()));
  }
  if (!fields) {
    return std::unexpected(std::move(fields.error()));
  }
  return {};
}

}  // namespace bubblegrade::vision
