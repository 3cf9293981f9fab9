#include <bubblegrade/app/scan_processor.hpp>
#include <bubblegrade/core/result_merger.hpp>
#include <bubblegrade/vision/decode_stage.hpp>
#include <bubblegrade/vision/enhance_stage.hpp>
#include <bubblegrade/vision/grading_stage.hpp>
#include <bubblegrade/vision/region_detection_stage.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <string>

namespace bubblegrade::app {

namespace bc = bubblegrade::core;
namespace bv = bubblegrade::vision;

namespace {

bc::Timestamp now() { return std::chrono::system_clock::now(); }

}  // namespace

ScanProcessor::ScanProcessor(const AppConfig& config,
                             bv::IGradingBackend& backend,
                             IScanRepository& repository,
                             IStatusPublisher& publisher)
    : thresholds_(config.thresholds), repository_(repository), publisher_(publisher) {
  pipeline_.add_stage(std::make_unique<bv::DecodeStage>());
  pipeline_.add_stage(std::make_unique<bv::EnhanceStage>(bv::ImageEnhancer(config.enhancer)));
  pipeline_.add_stage(std::make_unique<bv::RegionDetectionStage>(bv::RegionDetector()));
  pipeline_.add_stage(std::make_unique<bv::GradingStage>(backend, config.parallel_grading));
}

std::expected<bc::ScanResult, bc::ScanFailure> ScanProcessor::process(
    std::span<const std::byte> image_bytes,
    std::string filename,
    bc::StageTimingCallback* timing_cb) {
  bc::ScanResult scan = bc::make_queued_scan(std::move(filename), now());
  if (auto created = repository_.create(scan); !created) {
    return std::unexpected(created.error());
  }

  scan.status = bc::ScanStatus::Processing;
  if (auto stored = repository_.update(scan); !stored) {
    bc::ScanContext empty;
    return std::unexpected(fail(scan, empty, stored.error()));
  }
  spdlog::info("scan {} ({}) processing, {} bytes", scan.id, scan.filename, image_bytes.size());
  publisher_.publish({StatusEventType::ScanUpdate, scan.id, scan.status, std::nullopt, std::nullopt});

  bc::ScanContext context;
  context.encoded = image_bytes;
  try {
    if (auto ran = pipeline_.run(context, timing_cb); !ran) {
      return std::unexpected(fail(scan, context, ran.error()));
    }
  } catch (const std::exception& e) {
    return std::unexpected(fail(
        scan, context,
        bc::make_failure(bc::PipelineError::ExtractionError,
                         std::string("unexpected failure in pipeline: ") + e.what())));
  }

  scan.regions = context.regions;
  scan.quality = context.quality;
  bc::merge_scan_results(scan, std::move(*context.omr), std::move(*context.nombre),
                         std::move(*context.curp), thresholds_, now());

  if (auto stored = repository_.update(scan); !stored) {
    return std::unexpected(fail(scan, context, stored.error()));
  }
  spdlog::info("scan {} -> {} (score {}/{})", scan.id, bc::to_string(scan.status),
               scan.omr->score, scan.omr->total);
  publisher_.publish({StatusEventType::ScanComplete, scan.id, scan.status, scan.omr->score,
                      std::nullopt});
  return scan;
}

bc::ScanFailure ScanProcessor::fail(bc::ScanResult& scan,
                                    const bc::ScanContext& context,
                                    bc::ScanFailure failure) {
  failure.scan_id = scan.id;
  scan.regions = context.regions;
  scan.quality = context.quality;
  scan.omr = context.omr;
  scan.nombre = context.nombre;
  scan.curp = context.curp;
  bc::mark_scan_failed(scan, failure, now());

  spdlog::error("scan {} failed: {} ({})", scan.id, failure.message, bc::to_string(failure.code));
  if (auto stored = repository_.update(scan); !stored) {
    spdlog::error("scan {}: could not store ERROR record: {}", scan.id, stored.error().message);
  }
  publisher_.publish({StatusEventType::ScanError, scan.id, scan.status, std::nullopt,
                      failure.message});
  return failure;
}

std::expected<bc::ScanResult, bc::ScanFailure> ScanProcessor::correct(
    const std::string& scan_id,
    std::span<const bc::FieldCorrection> corrections) {
  auto scan = repository_.get(scan_id);
  if (!scan) return std::unexpected(scan.error());

  if (auto applied = bc::apply_corrections(*scan, corrections, now()); !applied) {
    auto failure = applied.error();
    failure.scan_id = scan_id;
    spdlog::warn("scan {}: correction rejected: {}", scan_id, failure.message);
    return std::unexpected(failure);
  }
  if (auto stored = repository_.update(*scan); !stored) {
    return std::unexpected(stored.error());
  }
  spdlog::info("scan {} corrected -> {}", scan_id, bc::to_string(scan->status));
  const auto type = scan->status == bc::ScanStatus::Completed ? StatusEventType::ScanComplete
                                                              : StatusEventType::ScanUpdate;
  std::optional<int> score;
  if (scan->omr) score = scan->omr->score;
  publisher_.publish({type, scan_id, scan->status, score, std::nullopt});
  return *scan;
}

std::expected<bc::ScanResult, bc::ScanFailure> ScanProcessor::correct(
    const std::string& scan_id,
    const bc::FieldCorrection& correction) {
  return correct(scan_id, std::span<const bc::FieldCorrection>(&correction, 1));
}

std::expected<bc::ScanResult, bc::ScanFailure> ScanProcessor::get(
    const std::string& scan_id) const {
  return repository_.get(scan_id);
}

}  // namespace bubblegrade::app
