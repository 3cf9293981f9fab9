#include <bubblegrade/core/pipeline.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

namespace bubblegrade::core {

void Pipeline::add_stage(std::unique_ptr<IScanStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<void, ScanFailure> Pipeline::run(
    ScanContext& context,
    StageTimingCallback* timing_cb) {
  if (stages_.empty()) {
    return std::unexpected(make_failure(PipelineError::InvalidConfig, "pipeline has no stages"));
  }

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(context);
    const auto stage_end = std::chrono::steady_clock::now();
    const double ms = 1e-6 * static_cast<double>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(stage_end - stage_start).count());
    if (timing_cb) {
      (*timing_cb)(i, ms);
    }

    if (!result) {
      spdlog::debug("stage {} ({}) failed after {:.2f} ms: {}", i, stages_[i]->name(), ms,
                    result.error().message);
      return std::unexpected(std::move(result.error()));
    }
    spdlog::debug("stage {} ({}) done in {:.2f} ms", i, stages_[i]->name(), ms);
  }
  return {};
}

}  // namespace bubblegrade::core
