#pragma once

#include <bubblegrade/remote/http_transport.hpp>

namespace bubblegrade::remote {

/// libcurl implementation of IHttpTransport. One easy handle per request, so a
/// single instance can be shared between threads.
class CurlHttpTransport : public IHttpTransport {
 public:
  CurlHttpTransport();
  ~CurlHttpTransport() override;

  CurlHttpTransport(const CurlHttpTransport&) = delete;
  CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

  [[nodiscard]] std::expected<HttpResponse, bubblegrade::core::ScanFailure>
  post_multipart(const std::string& url,
                 const std::vector<MultipartPart>& parts,
                 std::chrono::seconds timeout) override;

  [[nodiscard]] std::expected<HttpResponse, bubblegrade::core::ScanFailure>
  get(const std::string& url, std::chrono::seconds timeout) override;
};

}  // namespace bubblegrade::remote
