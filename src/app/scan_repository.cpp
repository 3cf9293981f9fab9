#include <bubblegrade/app/scan_repository.hpp>

namespace bubblegrade::app {

namespace bc = bubblegrade::core;

std::expected<void, bc::ScanFailure> InMemoryScanRepository::create(const bc::ScanResult& scan) {
  std::lock_guard lock(mutex_);
  if (!scans_.emplace(scan.id, scan).second) {
    return std::unexpected(
        bc::make_failure(bc::PipelineError::PersistenceError, "scan " + scan.id + " already exists"));
  }
  return {};
}

std::expected<bc::ScanResult, bc::ScanFailure> InMemoryScanRepository::get(
    const std::string& id) const {
  std::lock_guard lock(mutex_);
  const auto it = scans_.find(id);
  if (it == scans_.end()) {
    return std::unexpected(bc::make_failure(bc::PipelineError::NotFound, "scan " + id + " not found"));
  }
  return it->second;
}

std::expected<void, bc::ScanFailure> InMemoryScanRepository::update(const bc::ScanResult& scan) {
  std::lock_guard lock(mutex_);
  const auto it = scans_.find(scan.id);
  if (it == scans_.end()) {
    return std::unexpected(
        bc::make_failure(bc::PipelineError::NotFound, "scan " + scan.id + " not found"));
  }
  it->second = scan;
  return {};
}

std::size_t InMemoryScanRepository::size() const {
  std::lock_guard lock(mutex_);
  return scans_.size();
}

}  // namespace bubblegrade::app
