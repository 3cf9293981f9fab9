#pragma once

#include <bubblegrade/core/result_merger.hpp>
#include <bubblegrade/remote/remote_grading_backend.hpp>
#include <bubblegrade/vision/field_extractor.hpp>
#include <bubblegrade/vision/image_enhancer.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace bubblegrade::app {

/// Grading backend type: local (OpenCV + Tesseract) or remote (HTTP services).
enum class BackendType {
  Local,
  Remote,
};

/// Service configuration: backend choice, image parameters, review thresholds.
struct AppConfig {
  BackendType backend_type{BackendType::Local};
  bubblegrade::remote::RemoteEndpoints endpoints{};
  std::string tessdata_path;  // empty = Tesseract default
  std::string ocr_language{"spa"};
  bubblegrade::vision::EnhancerParams enhancer{};
  bubblegrade::vision::FieldExtractorParams extractor{};
  bubblegrade::core::ReviewThresholds thresholds{};
  std::vector<char> answer_key;  // empty = detection-count grading
  bool parallel_grading{true};
  std::string log_level{"info"};
};

/// Load config from a simple key=value file (one per line) on top of defaults.
/// A missing file yields the defaults. Throws ConfigError on a malformed value.
AppConfig load_config(const std::string& path);

/// Default config when no file is provided.
AppConfig default_config();

/// "A,B,C" (case-insensitive, spaces allowed) -> {'A','B','C'}. Throws ConfigError.
std::vector<char> parse_answer_key(std::string_view text);

/// Parse "local" / "remote". Throws ConfigError on anything else.
BackendType parse_backend_type(std::string_view text);

/// Raised for unreadable configuration values; carries PipelineError::InvalidConfig.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}

  [[nodiscard]] bubblegrade::core::PipelineError code() const noexcept {
    return bubblegrade::core::PipelineError::InvalidConfig;
  }
};

}  // namespace bubblegrade::app
