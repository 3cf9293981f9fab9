#pragma once

#include <bubblegrade/core/pipeline_stage.hpp>
#include <bubblegrade/vision/grading_backend.hpp>

namespace bubblegrade::vision {

/// Runs bubble grading and both field extractions over the detected regions.
/// With parallel enabled, OMR runs on its own task while the fields are read on the
/// calling thread; both are joined before returning. The backend is not owned.
class GradingStage : public bubblegrade::core::IScanStage {
 public:
  GradingStage(IGradingBackend& backend, bool parallel);

  [[nodiscard]] std::string_view name() const noexcept override { return "grade"; }

  [[nodiscard]] std::expected<void, bubblegrade::core::ScanFailure>
  process(bubblegrade::core::ScanContext& context) override;

 private:
  IGradingBackend& backend_;
  bool parallel_;
};

}  // namespace bubblegrade::vision
