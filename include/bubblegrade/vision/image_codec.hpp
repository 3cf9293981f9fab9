#pragma once

#include <bubblegrade/core/error.hpp>
#include <bubblegrade/core/frame.hpp>
#include <bubblegrade/core/region.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

namespace bubblegrade::vision {

/// Uploads above this size are rejected before decoding.
inline constexpr std::size_t kMaxUploadBytes = 10u * 1024u * 1024u;

/// Read an upload from disk. A missing, unreadable or empty file fails with
/// PipelineError::DecodeError.
[[nodiscard]] std::expected<std::vector<std::byte>, bubblegrade::core::ScanFailure>
read_upload_file(const std::filesystem::path& path);

/// Decode an uploaded image (JPEG, PNG, ...) into a BGR8 Frame.
/// Empty, oversized or unreadable input fails with PipelineError::DecodeError.
[[nodiscard]] std::expected<bubblegrade::core::Frame, bubblegrade::core::ScanFailure>
decode_frame(std::span<const std::byte> encoded, std::size_t max_bytes = kMaxUploadBytes);

/// Encode a frame (or the given region of it) as JPEG for delegated services.
[[nodiscard]] std::expected<std::vector<std::byte>, bubblegrade::core::ScanFailure>
encode_jpeg(const bubblegrade::core::Frame& frame,
            std::optional<bubblegrade::core::RegionBoundingBox> region = std::nullopt,
            int quality = 95);

}  // namespace bubblegrade::vision
