#include <bubblegrade/app/status_publisher.hpp>
#include <spdlog/spdlog.h>

namespace bubblegrade::app {

std::string_view to_string(StatusEventType type) noexcept {
  switch (type) {
    case StatusEventType::ScanUpdate: return "scan_update";
    case StatusEventType::ScanComplete: return "scan_complete";
    case StatusEventType::ScanError: return "scan_error";
  }
  return "unknown";
}

void LoggingStatusPublisher::publish(const StatusChangeEvent& event) noexcept {
  if (event.type == StatusEventType::ScanError) {
    spdlog::error("[{}] scan {} -> {}: {}", to_string(event.type), event.scan_id,
                  bubblegrade::core::to_string(event.status), event.error.value_or(""));
  } else if (event.score) {
    spdlog::info("[{}] scan {} -> {} (score {})", to_string(event.type), event.scan_id,
                 bubblegrade::core::to_string(event.status), *event.score);
  } else {
    spdlog::info("[{}] scan {} -> {}", to_string(event.type), event.scan_id,
                 bubblegrade::core::to_string(event.status));
  }
}

}  // namespace bubblegrade::app
