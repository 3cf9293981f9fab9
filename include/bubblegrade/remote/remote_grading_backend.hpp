#pragma once

#include <bubblegrade/remote/http_transport.hpp>
#include <bubblegrade/vision/grading_backend.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace bubblegrade::remote {

/// Base URLs of the delegated services (trailing slashes are ignored).
struct RemoteEndpoints {
  std::string omr_url{"http://omr:8090"};
  std::string ocr_url{"http://ocr:8091"};
  std::chrono::seconds timeout{60};
};

struct ServiceHealth {
  bool omr{false};
  bool ocr{false};

  [[nodiscard]] bool all_healthy() const noexcept { return omr && ocr; }
};

/// Grading delegated over HTTP: the enhanced image goes to the OMR service
/// (POST {omr_url}/grade) and each field crop to the OCR service (POST {ocr_url}/ocr).
/// Unreachable services or non-2xx answers fail with BackendUnavailable; bodies that
/// are not the expected JSON fail with ExtractionError.
class RemoteGradingBackend : public bubblegrade::vision::IGradingBackend {
 public:
  RemoteGradingBackend(RemoteEndpoints endpoints, std::unique_ptr<IHttpTransport> transport);

  [[nodiscard]] std::string_view name() const noexcept override { return "remote"; }

  [[nodiscard]] std::expected<bubblegrade::core::OmrResult, bubblegrade::core::ScanFailure>
  grade_omr(const bubblegrade::core::Frame& enhanced,
            const bubblegrade::core::RegionBoundingBox& roi) override;

  [[nodiscard]] std::expected<bubblegrade::core::FieldResult, bubblegrade::core::ScanFailure>
  extract_field(const bubblegrade::core::Frame& enhanced,
                const bubblegrade::core::RegionBoundingBox& roi,
                bubblegrade::core::FieldKind kind) override;

  /// GET /health on both services; healthy means 200 with {"status":"healthy"}.
  [[nodiscard]] ServiceHealth check_health();

  [[nodiscard]] const RemoteEndpoints& endpoints() const noexcept { return endpoints_; }

 private:
  [[nodiscard]] bool service_healthy(const std::string& base_url);

  RemoteEndpoints endpoints_;
  std::unique_ptr<IHttpTransport> transport_;
};

}  // namespace bubblegrade::remote
