#pragma once

#include <bubblegrade/core/error.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace bubblegrade::remote {

/// One part of a multipart/form-data body.
struct MultipartPart {
  std::string name;
  std::string filename;      // empty for plain form fields
  std::string content_type;  // empty lets the transport decide
  std::vector<std::byte> data;
};

struct HttpResponse {
  long status{0};
  std::string body;

  [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

/// Minimal blocking HTTP client used to reach the delegated grading services.
/// Connection failures and timeouts are reported as BackendUnavailable; any HTTP
/// status (including 4xx/5xx) is a successful transport result.
class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;

  [[nodiscard]] virtual std::expected<HttpResponse, bubblegrade::core::ScanFailure>
  post_multipart(const std::string& url,
                 const std::vector<MultipartPart>& parts,
                 std::chrono::seconds timeout) = 0;

  [[nodiscard]] virtual std::expected<HttpResponse, bubblegrade::core::ScanFailure>
  get(const std::string& url, std::chrono::seconds timeout) = 0;
};

}  // namespace bubblegrade::remote
