#include <bubblegrade/app/service_context.hpp>
#include <bubblegrade/remote/curl_http_transport.hpp>
#include <bubblegrade/vision/field_extractor.hpp>
#include <bubblegrade/vision/local_grading_backend.hpp>
#include <bubblegrade/vision/omr_grader.hpp>
#include <bubblegrade/vision/tesseract_ocr_engine.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace bubblegrade::app {

namespace bv = bubblegrade::vision;
namespace br = bubblegrade::remote;

std::unique_ptr<ServiceContext> make_service_context(
    const AppConfig& config,
    std::unique_ptr<bv::IGradingBackend> backend) {
  if (!backend) throw std::runtime_error("make_service_context: null grading backend");
  auto ctx = std::make_unique<ServiceContext>();
  ctx->config = config;
  ctx->backend = std::move(backend);
  ctx->repository = std::make_unique<InMemoryScanRepository>();
  ctx->publisher = std::make_unique<LoggingStatusPublisher>();
  ctx->processor = std::make_unique<ScanProcessor>(ctx->config, *ctx->backend, *ctx->repository,
                                                   *ctx->publisher);
  return ctx;
}

std::unique_ptr<ServiceContext> make_service_context(const AppConfig& config) {
  if (config.backend_type == BackendType::Remote) {
    auto remote = std::make_unique<br::RemoteGradingBackend>(
        config.endpoints, std::make_unique<br::CurlHttpTransport>());
    auto* view = remote.get();
    spdlog::info("grading backend: remote (omr {}, ocr {})", view->endpoints().omr_url,
                 view->endpoints().ocr_url);
    auto ctx = make_service_context(config, std::move(remote));
    ctx->remote = view;
    return ctx;
  }

  auto engine = std::make_unique<bv::TesseractOcrEngine>(config.tessdata_path, config.ocr_language);
  bv::OmrGrader grader(bv::OmrParams{}, config.answer_key);
  bv::FieldExtractor extractor(std::move(engine), config.extractor);
  spdlog::info("grading backend: local (ocr language {}, {})", config.ocr_language,
               grader.uses_answer_key() ? "answer-key grading" : "detection-count grading");
  return make_service_context(
      config, std::make_unique<bv::LocalGradingBackend>(std::move(grader), std::move(extractor)));
}

}  // namespace bubblegrade::app
