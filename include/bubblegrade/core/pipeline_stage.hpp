#pragma once

#include <bubblegrade/core/error.hpp>
#include <bubblegrade/core/frame.hpp>
#include <bubblegrade/core/region.hpp>
#include <bubblegrade/core/scan_result.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string_view>

namespace bubblegrade::core {

/// Per-scan working state. Each stage fills its own slot, so whatever earlier
/// stages produced is still available after a later stage fails.
/// Owned by one pipeline invocation; frames are released when it goes away.
struct ScanContext {
  std::span<const std::byte> encoded;  // uploaded bytes, not owned
  Frame decoded;
  Frame enhanced;
  std::optional<RegionSet> regions;
  std::optional<ImageQuality> quality;
  std::optional<OmrResult> omr;
  std::optional<FieldResult> nombre;
  std::optional<FieldResult> curp;
};

/// Abstract pipeline stage: read what it needs from the context, write its output back.
/// Implementations must allow concurrent process() calls on distinct contexts.
class IScanStage {
 public:
  virtual ~IScanStage() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  [[nodiscard]] virtual std::expected<void, ScanFailure> process(ScanContext& context) = 0;
};

}  // namespace bubblegrade::core
