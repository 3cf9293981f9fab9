#pragma once

#include <bubblegrade/core/scan_result.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace bubblegrade::app {

enum class StatusEventType {
  ScanUpdate,
  ScanComplete,
  ScanError,
};

/// "scan_update", "scan_complete", "scan_error".
[[nodiscard]] std::string_view to_string(StatusEventType type) noexcept;

/// Status change notification for progress subscribers.
struct StatusChangeEvent {
  StatusEventType type{StatusEventType::ScanUpdate};
  std::string scan_id;
  bubblegrade::core::ScanStatus status{bubblegrade::core::ScanStatus::Queued};
  std::optional<int> score;
  std::optional<std::string> error;
};

/// Must not throw; publication failures never affect the scan.
class IStatusPublisher {
 public:
  virtual ~IStatusPublisher() = default;
  virtual void publish(const StatusChangeEvent& event) noexcept = 0;
};

/// Writes every event to the log.
class LoggingStatusPublisher : public IStatusPublisher {
 public:
  void publish(const StatusChangeEvent& event) noexcept override;
};

}  // namespace bubblegrade::app
