#include <bubblegrade/remote/curl_http_transport.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>

namespace bubblegrade::remote {

namespace bc = bubblegrade::core;

namespace {

struct EasyDeleter {
  void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};
struct MimeDeleter {
  void operator()(curl_mime* m) const noexcept { curl_mime_free(m); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using MimeHandle = std::unique_ptr<curl_mime, MimeDeleter>;

std::size_t write_body(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

EasyHandle make_handle(const std::string& url, std::chrono::seconds timeout, std::string& body) {
  EasyHandle h(curl_easy_init());
  if (!h) return h;
  curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(h.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
  curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, &write_body);
  curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &body);
  return h;
}

std::expected<HttpResponse, bc::ScanFailure> perform(CURL* h,
                                                     const std::string& url,
                                                     std::string& body) {
  const CURLcode rc = curl_easy_perform(h);
  if (rc != CURLE_OK) {
    spdlog::warn("HTTP request to {} failed: {}", url, curl_easy_strerror(rc));
    return std::unexpected(bc::make_failure(
        bc::PipelineError::BackendUnavailable,
        url + ": " + curl_easy_strerror(rc)));
  }
  HttpResponse response;
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
  response.body = std::move(body);
  return response;
}

bc::ScanFailure init_failure(const std::string& url) {
  return bc::make_failure(bc::PipelineError::BackendUnavailable,
                          url + ": could not create HTTP handle");
}

}  // namespace

CurlHttpTransport::CurlHttpTransport() {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("curl_global_init failed");
  }
}

CurlHttpTransport::~CurlHttpTransport() { curl_global_cleanup(); }

std::expected<HttpResponse, bc::ScanFailure> CurlHttpTransport::post_multipart(
    const std::string& url,
    const std::vector<MultipartPart>& parts,
    std::chrono::seconds timeout) {
  std::string body;
  EasyHandle h = make_handle(url, timeout, body);
  if (!h) return std::unexpected(init_failure(url));

  MimeHandle mime(curl_mime_init(h.get()));
  for (const auto& part : parts) {
    curl_mimepart* field = curl_mime_addpart(mime.get());
    curl_mime_name(field, part.name.c_str());
    curl_mime_data(field, reinterpret_cast<const char*>(part.data.data()), part.data.size());
    if (!part.filename.empty()) curl_mime_filename(field, part.filename.c_str());
    if (!part.content_type.empty()) curl_mime_type(field, part.content_type.c_str());
  }
  curl_easy_setopt(h.get(), CURLOPT_MIMEPOST, mime.get());

  return perform(h.get(), url, body);
}

std::expected<HttpResponse, bc::ScanFailure> CurlHttpTransport::get(const std::string& url,
                                                                   std::chrono::seconds timeout) {
  std::string body;
  EasyHandle h = make_handle(url, timeout, body);
  if (!h) return std::unexpected(init_failure(url));
  curl_easy_setopt(h.get(), CURLOPT_HTTPGET, 1L);
  return perform(h.get(), url, body);
}

}  // namespace bubblegrade::remote
