#include <bubblegrade/remote/remote_grading_backend.hpp>
#include <bubblegrade/core/result_merger.hpp>
#include <bubblegrade/vision/image_codec.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace bubblegrade::remote {

namespace bc = bubblegrade::core;
using nlohmann::json;

namespace {

std::string strip_trailing_slash(std::string url) {
  while (!url.empty() && url.back() == '/') url.pop_back();
  return url;
}

std::vector<std::byte> to_bytes(const std::string& s) {
  const auto* p = reinterpret_cast<const std::byte*>(s.data());
  return {p, p + s.size()};
}

bc::ScanFailure status_failure(const std::string& url, const HttpResponse& response) {
  return bc::make_failure(bc::PipelineError::BackendUnavailable,
                          url + " answered HTTP " + std::to_string(response.status));
}

/// Answers come back either as booleans (correct/incorrect) or as marked letters.
bc::OmrAnswer parse_answer(const json& value) {
  bc::OmrAnswer answer;
  if (value.is_boolean()) {
    answer.correct = value.get<bool>();
  } else if (value.is_string()) {
    const auto letter = value.get<std::string>();
    if (!letter.empty()) {
      answer.marked = letter.front();
      answer.correct = true;
    }
  } else {
    throw std::invalid_argument("unsupported answer entry");
  }
  return answer;
}

bc::ImageQuality parse_quality(const json& q) {
  bc::ImageQuality quality;
  if (q.contains("resolution")) {
    quality.width = q.at("resolution").value("width", 0);
    quality.height = q.at("resolution").value("height", 0);
  }
  quality.clarity = q.value("clarity", 0.0);
  quality.skew = q.value("skew", 0.0);
  return quality;
}

/// Request payload understood by the OCR service for each field.
json ocr_request(bc::FieldKind kind, const bc::RegionBoundingBox& roi) {
  const bool curp = kind == bc::FieldKind::Curp;
  return json{
      {"region", std::string(bc::to_string(kind))},
      {"boundingBox", {{"x", roi.x}, {"y", roi.y}, {"width", roi.width}, {"height", roi.height}}},
      {"preprocessing",
       {{"denoise", true},
        {"sharpen", curp},
        {"contrast", curp ? 1.0 : 1.2},
        {"brightness", curp ? 0.0 : 0.1}}},
  };
}

}  // namespace

RemoteGradingBackend::RemoteGradingBackend(RemoteEndpoints endpoints,
                                           std::unique_ptr<IHttpTransport> transport)
    : endpoints_(std::move(endpoints)), transport_(std::move(transport)) {
  if (!transport_) throw std::invalid_argument("RemoteGradingBackend: null transport");
  endpoints_.omr_url = strip_trailing_slash(endpoints_.omr_url);
  endpoints_.ocr_url = strip_trailing_slash(endpoints_.ocr_url);
}

std::expected<bc::OmrResult, bc::ScanFailure> RemoteGradingBackend::grade_omr(
    const bc::Frame& enhanced,
    const bc::RegionBoundingBox& /*roi*/) {
  // The OMR service locates the bubble area itself, so it receives the whole sheet.
  auto jpeg = bubblegrade::vision::encode_jpeg(enhanced);
  if (!jpeg) return std::unexpected(jpeg.error());

  const std::string url = endpoints_.omr_url + "/grade";
  std::vector<MultipartPart> parts{{"file", "scan.jpg", "image/jpeg", std::move(*jpeg)}};
  auto response = transport_->post_multipart(url, parts, endpoints_.timeout);
  if (!response) return std::unexpected(response.error());
  if (!response->ok()) return std::unexpected(status_failure(url, *response));

  try {
    const json body = json::parse(response->body);
    bc::OmrResult result;
    result.score = body.value("score", 0);
    result.total = body.value("total", 0);
    if (result.score < 0 || result.total < 0) {
      return std::unexpected(bc::make_failure(
          bc::PipelineError::ExtractionError,
          fmt::format("OMR service returned a negative count (score {}, total {})",
                      result.score, result.total)));
    }
    if (body.contains("answers")) {
      for (const auto& entry : body.at("answers")) {
        result.answers.push_back(parse_answer(entry));
      }
    }
    if (body.contains("quality") && body.at("quality").is_object()) {
      result.quality = parse_quality(body.at("quality"));
    }
    return result;
  } catch (const std::exception& e) {
    spdlog::error("OMR service at {} returned an unreadable body: {}", url, e.what());
    return std::unexpected(bc::make_failure(bc::PipelineError::ExtractionError,
                                            std::string("malformed OMR response: ") + e.what()));
  }
}

std::expected<bc::FieldResult, bc::ScanFailure> RemoteGradingBackend::extract_field(
    const bc::Frame& enhanced,
    const bc::RegionBoundingBox& roi,
    bc::FieldKind kind) {
  auto jpeg = bubblegrade::vision::encode_jpeg(enhanced, roi);
  if (!jpeg) return std::unexpected(jpeg.error());

  const std::string region(bc::to_string(kind));
  const std::string url = endpoints_.ocr_url + "/ocr";
  std::vector<MultipartPart> parts{
      {"image", region + ".jpg", "image/jpeg", std::move(*jpeg)},
      {"request", "", "", to_bytes(ocr_request(kind, roi).dump())},
  };
  auto response = transport_->post_multipart(url, parts, endpoints_.timeout);
  if (!response) return std::unexpected(response.error());
  if (!response->ok()) return std::unexpected(status_failure(url, *response));

  try {
    const json body = json::parse(response->body);
    const auto text = body.value("text", std::string{});
    const auto confidence = body.value("confidence", 0.0);
    return bc::make_field_result(kind, text, static_cast<float>(confidence));
  } catch (const std::exception& e) {
    spdlog::error("OCR service at {} returned an unreadable body for {}: {}", url, region,
                  e.what());
    return std::unexpected(bc::make_failure(bc::PipelineError::ExtractionError,
                                            std::string("malformed OCR response: ") + e.what()));
  }
}

bool RemoteGradingBackend::service_healthy(const std::string& base_url) {
  const std::string url = base_url + "/health";
  auto response = transport_->get(url, endpoints_.timeout);
  if (!response || response->status != 200) {
    spdlog::warn("health check failed at {}", url);
    return false;
  }
  const json body = json::parse(response->body, nullptr, /*allow_exceptions=*/false);
  if (!body.is_object() || !body.contains("status") || !body.at("status").is_string()) {
    spdlog::warn("health check at {} returned no status string", url);
    return false;
  }
  return body.at("status").get<std::string>() == "healthy";
}

ServiceHealth RemoteGradingBackend::check_health() {
  return {service_healthy(endpoints_.omr_url), service_healthy(endpoints_.ocr_url)};
}

}  // namespace bubblegrade::remote
