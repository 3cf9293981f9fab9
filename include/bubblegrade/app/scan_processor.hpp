#pragma once

#include <bubblegrade/app/config.hpp>
#include <bubblegrade/app/scan_repository.hpp>
#include <bubblegrade/app/status_publisher.hpp>
#include <bubblegrade/core/correction.hpp>
#include <bubblegrade/core/pipeline.hpp>
#include <bubblegrade/vision/grading_backend.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>

namespace bubblegrade::app {

/// Drives one uploaded sheet through decode -> enhance -> detect regions -> grade,
/// merges the results and keeps the stored record and subscribers up to date.
///
/// Record lifecycle: created QUEUED, moved to PROCESSING before the first stage,
/// then COMPLETED / NEEDS_REVIEW, or ERROR with whatever partial results were
/// produced. process() may be called from several threads at once; the backend,
/// repository and publisher are borrowed and must outlive the processor.
class ScanProcessor {
 public:
  ScanProcessor(const AppConfig& config,
                bubblegrade::vision::IGradingBackend& backend,
                IScanRepository& repository,
                IStatusPublisher& publisher);

  /// Returns the final record. On failure the stored record is ERROR and the
  /// returned ScanFailure carries its scan_id (empty if no record could be created).
  [[nodiscard]] std::expected<bubblegrade::core::ScanResult, bubblegrade::core::ScanFailure>
  process(std::span<const std::byte> image_bytes,
          std::string filename,
          bubblegrade::core::StageTimingCallback* timing_cb = nullptr);

  /// Apply reviewer corrections (all or nothing) and store the updated record.
  [[nodiscard]] std::expected<bubblegrade::core::ScanResult, bubblegrade::core::ScanFailure>
  correct(const std::string& scan_id,
          std::span<const bubblegrade::core::FieldCorrection> corrections);

  [[nodiscard]] std::expected<bubblegrade::core::ScanResult, bubblegrade::core::ScanFailure>
  correct(const std::string& scan_id, const bubblegrade::core::FieldCorrection& correction);

  [[nodiscard]] std::expected<bubblegrade::core::ScanResult, bubblegrade::core::ScanFailure>
  get(const std::string& scan_id) const;

  [[nodiscard]] std::size_t stage_count() const noexcept { return pipeline_.stage_count(); }

 private:
  [[nodiscard]] bubblegrade::core::ScanFailure fail(bubblegrade::core::ScanResult& scan,
                                                    const bubblegrade::core::ScanContext& context,
                                                    bubblegrade::core::ScanFailure failure);

  bubblegrade::core::ReviewThresholds thresholds_;
  bubblegrade::core::Pipeline pipeline_;
  IScanRepository& repository_;
  IStatusPublisher& publisher_;
};

}  // namespace bubblegrade::app
