#pragma once

#include <bubblegrade/core/pipeline_stage.hpp>
#include <bubblegrade/vision/region_detector.hpp>

namespace bubblegrade::vision {

/// Fills ScanContext::regions and ScanContext::quality from the enhanced frame.
class RegionDetectionStage : public bubblegrade::core::IScanStage {
 public:
  explicit RegionDetectionStage(RegionDetector detector);

  [[nodiscard]] std::string_view name() const noexcept override { return "detect_regions"; }

  [[nodiscard]] std::expected<void, bubblegrade::core::ScanFailure>
  process(bubblegrade::core::ScanContext& context) override;

 private:
  RegionDetector detector_;
};

}  // namespace bubblegrade::vision
