#include <bubblegrade/vision/image_codec.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace bubblegrade::vision {

namespace bc = bubblegrade::core;

std::expected<std::vector<std::byte>, bc::ScanFailure> read_upload_file(
    const std::filesystem::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return std::unexpected(bc::make_failure(bc::PipelineError::DecodeError,
                                            "cannot open " + path.string()));
  }
  const std::vector<char> raw((std::istreambuf_iterator<char>(f)),
                              std::istreambuf_iterator<char>());
  if (raw.empty()) {
    return std::unexpected(bc::make_failure(bc::PipelineError::DecodeError,
                                            path.string() + " is empty"));
  }
  std::vector<std::byte> bytes(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) bytes[i] = static_cast<std::byte>(raw[i]);
  return bytes;
}

std::expected<bc::Frame, bc::ScanFailure> decode_frame(std::span<const std::byte> encoded,
                                                       std::size_t max_bytes) {
  if (encoded.empty()) {
    return std::unexpected(bc::make_failure(bc::PipelineError::DecodeError, "empty upload"));
  }
  if (encoded.size() > max_bytes) {
    return std::unexpected(bc::make_failure(
        bc::PipelineError::DecodeError,
        "upload of " + std::to_string(encoded.size()) + " bytes exceeds limit of " +
            std::to_string(max_bytes)));
  }

  cv::Mat decoded;
  try {
    const cv::Mat raw(1, static_cast<int>(encoded.size()), CV_8UC1,
                      const_cast<std::byte*>(encoded.data()));
    decoded = cv::imdecode(raw, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    return std::unexpected(bc::make_failure(bc::PipelineError::DecodeError,
                                            std::string("failed to decode image: ") + e.what()));
  }
  if (decoded.empty()) {
    return std::unexpected(bc::make_failure(bc::PipelineError::DecodeError,
                                            "failed to decode image"));
  }
  return detail::mat_to_frame(decoded, bc::PixelFormat::BGR8);
}

std::expected<std::vector<std::byte>, bc::ScanFailure> encode_jpeg(
    const bc::Frame& frame,
    std::optional<bc::RegionBoundingBox> region,
    int quality) {
  auto mat = detail::frame_to_mat(frame);
  if (!mat) {
    return std::unexpected(bc::make_failure(bc::PipelineError::InvalidFrame,
                                            "cannot encode an empty frame"));
  }
  const cv::Mat source = region ? detail::crop(*mat, *region) : *mat;
  if (source.empty()) {
    return std::unexpected(bc::make_failure(bc::PipelineError::InvalidFrame,
                                            "region lies outside the frame"));
  }

  std::vector<uchar> buffer;
  try {
    if (!cv::imencode(".jpg", source, buffer, {cv::IMWRITE_JPEG_QUALITY, quality})) {
      return std::unexpected(bc::make_failure(bc::PipelineError::ExtractionError,
                                              "JPEG encoding failed"));
    }
  } catch (const cv::Exception& e) {
    return std::unexpected(bc::make_failure(bc::PipelineError::ExtractionError,
                                            std::string("JPEG encoding failed: ") + e.what()));
  }
  std::vector<std::byte> out(buffer.size());
  for (std::size_t i = 0; i < buffer.size(); ++i) {
    out[i] = static_cast<std::byte>(buffer[i]);
  }
  return out;
}

}  // namespace bubblegrade::vision
