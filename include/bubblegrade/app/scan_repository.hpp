#pragma once

#include <bubblegrade/core/error.hpp>
#include <bubblegrade/core/scan_result.hpp>
#include <expected>
#include <mutex>
#include <string>
#include <unordered_map>

namespace bubblegrade::app {

/// Storage for scan records. Implementations must be safe to call concurrently.
class IScanRepository {
 public:
  virtual ~IScanRepository() = default;

  /// Fails with PersistenceError if a record with the same id exists.
  [[nodiscard]] virtual std::expected<void, bubblegrade::core::ScanFailure>
  create(const bubblegrade::core::ScanResult& scan) = 0;

  /// Fails with NotFound for an unknown id.
  [[nodiscard]] virtual std::expected<bubblegrade::core::ScanResult, bubblegrade::core::ScanFailure>
  get(const std::string& id) const = 0;

  /// Replaces the stored record. Fails with NotFound for an unknown id.
  [[nodiscard]] virtual std::expected<void, bubblegrade::core::ScanFailure>
  update(const bubblegrade::core::ScanResult& scan) = 0;
};

class InMemoryScanRepository : public IScanRepository {
 public:
  [[nodiscard]] std::expected<void, bubblegrade::core::ScanFailure>
  create(const bubblegrade::core::ScanResult& scan) override;

  [[nodiscard]] std::expected<bubblegrade::core::ScanResult, bubblegrade::core::ScanFailure>
  get(const std::string& id) const override;

  [[nodiscard]] std::expected<void, bubblegrade::core::ScanFailure>
  update(const bubblegrade::core::ScanResult& scan) override;

  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, bubblegrade::core::ScanResult> scans_;
};

}  // namespace bubblegrade::app
