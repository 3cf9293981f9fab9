#include <bubblegrade/core/error.hpp>

namespace bubblegrade::core {

std::string_view to_string(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::None:
      return "None";
    case PipelineError::DecodeError:
      return "DecodeError";
    case PipelineError::InvalidFrame:
      return "InvalidFrame";
    case PipelineError::ExtractionError:
      return "ExtractionError";
    case PipelineError::BackendUnavailable:
      return "BackendUnavailable";
    case PipelineError::PersistenceError:
      return "PersistenceError";
    case PipelineError::NotFound:
      return "NotFound";
    case PipelineError::InvalidTransition:
      return "InvalidTransition";
    case PipelineError::InvalidCorrection:
      return "InvalidCorrection";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
  }
  return "Unknown";
}

}  // namespace bubblegrade::core
