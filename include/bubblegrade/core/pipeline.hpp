#pragma once

#include <bubblegrade/core/error.hpp>
#include <bubblegrade/core/pipeline_stage.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace bubblegrade::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a fixed sequence of stages over one ScanContext; stops at the first failure.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IScanStage> stage);

  /// Run every stage in order. On failure the context keeps the partial results
  /// written so far and the failing stage's error is returned.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  /// Thread-safe: safe to call run() from multiple threads concurrently
  /// (stages are not modified during process()).
  [[nodiscard]] std::expected<void, ScanFailure> run(
      ScanContext& context,
      StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IScanStage>> stages_;
};

}  // namespace bubblegrade::core
