#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace chunkup::upload {

/// Half-open window [start, end) of the content source
struct ByteRange {
    std::uint64_t start = 0;
    std::uint64_t end = 0;

    std::uint64_t size() const noexcept { return end - start; }
    bool empty() const noexcept { return start == end; }

    bool operator==(const ByteRange& other) const noexcept {
        return start == other.start && end == other.end;
    }
    bool operator!=(const ByteRange& other) const noexcept { return !(*this == other); }
};

/**
 * @brief Window for the next chunk
 *
 * start is the source position for seekable sources and the write offset
 * otherwise; end = min(start + chunk_size, total_length). Callers must not
 * ask for a window once bytes_written == total_length.
 */
ByteRange compute_chunk_range(std::uint64_t bytes_written,
                              std::uint64_t chunk_size,
                              std::uint64_t total_length,
                              bool seekable,
                              std::uint64_t source_position) noexcept;

/// Inclusive pair reported in a "Range: bytes=<start>-<end>" header
struct RangeHeader {
    std::uint64_t start = 0;
    std::uint64_t end = 0;

    /// Bytes the server reports as written
    std::uint64_t bytes_written() const noexcept { return end - start; }
};

/**
 * @brief Strict parser for "bytes=<start>-<end>"
 *
 * Accepts surrounding whitespace and a case-insensitive unit. Rejects signs,
 * missing bounds, lists, overflow and start > end.
 */
std::optional<RangeHeader> parse_range_header(std::string_view text) noexcept;

} // namespace chunkup::upload
