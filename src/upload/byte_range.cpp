#include "chunkup/upload/byte_range.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace chunkup::upload {
namespace {

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Whole-string unsigned decimal; from_chars alone would accept a trailing suffix
std::optional<std::uint64_t> parse_decimal(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

ByteRange compute_chunk_range(std::uint64_t bytes_written,
                              std::uint64_t chunk_size,
                              std::uint64_t total_length,
                              bool seekable,
                              std::uint64_t source_position) noexcept {
    const std::uint64_t start = std::min(seekable ? source_position : bytes_written, total_length);
    const std::uint64_t remaining = total_length - start;
    return ByteRange{start, start + std::min(chunk_size, remaining)};
}

std::optional<RangeHeader> parse_range_header(std::string_view text) noexcept {
    text = trim(text);

    const auto equals = text.find('=');
    if (equals == std::string_view::npos || !iequals(trim(text.substr(0, equals)), "bytes")) {
        return std::nullopt;
    }

    const std::string_view range_spec = text.substr(equals + 1);
    const auto dash = range_spec.find('-');
    if (dash == std::string_view::npos) {
        return std::nullopt;
    }

    const auto start = parse_decimal(range_spec.substr(0, dash));
    const auto end = parse_decimal(range_spec.substr(dash + 1));
    if (!start || !end || *start > *end) {
        return std::nullopt;
    }
    return RangeHeader{*start, *end};
}

} // namespace chunkup::upload
