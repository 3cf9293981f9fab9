#pragma once

#include <string>
#include <string_view>

namespace bubblegrade::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  DecodeError,         // upload is not a readable image
  InvalidFrame,        // a stage received an empty or malformed frame
  ExtractionError,     // OCR / OMR engine failure
  BackendUnavailable,  // delegated service timed out or answered non-2xx
  PersistenceError,
  NotFound,
  InvalidTransition,   // operation not allowed in the record's current status
  InvalidCorrection,
  InvalidConfig,
};

/// Error code plus the human-readable description stored on ERROR records.
struct ScanFailure {
  PipelineError code{PipelineError::None};
  std::string message;
  std::string scan_id;  // set once the failing scan has a stored record
};

[[nodiscard]] std::string_view to_string(PipelineError error) noexcept;

[[nodiscard]] inline ScanFailure make_failure(PipelineError code, std::string message) {
  return ScanFailure{code, std::move(message), {}};
}

}  // namespace bubblegrade::core
