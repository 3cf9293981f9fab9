#pragma once

#include <bubblegrade/app/config.hpp>
#include <bubblegrade/app/scan_processor.hpp>
#include <bubblegrade/app/scan_repository.hpp>
#include <bubblegrade/app/status_publisher.hpp>
#include <bubblegrade/remote/remote_grading_backend.hpp>
#include <bubblegrade/vision/grading_backend.hpp>
#include <memory>

namespace bubblegrade::app {

/// Everything a running service shares between scans. Built once from the config
/// and passed by reference; the processor borrows the other members.
struct ServiceContext {
  AppConfig config;
  std::unique_ptr<bubblegrade::vision::IGradingBackend> backend;
  std::unique_ptr<IScanRepository> repository;
  std::unique_ptr<IStatusPublisher> publisher;
  std::unique_ptr<ScanProcessor> processor;
  /// Non-owning view of backend when backend_type is Remote, for health checks.
  bubblegrade::remote::RemoteGradingBackend* remote{nullptr};
};

/// Build the backend selected by config (local: OpenCV + Tesseract, remote: HTTP
/// services), an in-memory repository and a logging publisher.
/// Throws std::runtime_error if the backend cannot be created (e.g. missing tessdata).
std::unique_ptr<ServiceContext> make_service_context(const AppConfig& config);

/// Same as above with a caller-supplied grading backend (used by tests and embedders).
std::unique_ptr<ServiceContext> make_service_context(
    const AppConfig& config,
    std::unique_ptr<bubblegrade::vision::IGradingBackend> backend);

}  // namespace bubblegrade::app
