#include "chunkup/upload/content_source.hpp"

#include <string>

namespace chunkup::upload {
namespace fs = std::filesystem;

namespace {

Result<void> check_range(std::uint64_t start, std::uint64_t end, std::uint64_t length) {
    if (start > end || end > length) {
        return Err("Invalid byte range [" + std::to_string(start) + ", " + std::to_string(end) +
                   ") for source of length " + std::to_string(length));
    }
    return Ok();
}

} // namespace

// ──────────────────────────────────────────────────────────
// FileContentSource
// ──────────────────────────────────────────────────────────

FileContentSource::FileContentSource(fs::path path, std::ifstream stream, std::uint64_t length)
    : path_(std::move(path))
    , stream_(std::move(stream))
    , length_(length) {
}

Result<std::unique_ptr<FileContentSource>> FileContentSource::open(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err(std::string("Not a regular file: ") + path.string());
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err(std::string("Failed to stat file: ") + path.string() + ": " + ec.message());
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return Err(std::string("Failed to open source file: ") + path.string());
    }

    return Ok(std::unique_ptr<FileContentSource>(
        new FileContentSource(path, std::move(stream), static_cast<std::uint64_t>(size))));
}

Result<void> FileContentSource::seek(std::uint64_t offset) {
    if (offset > length_) {
        return Err("Seek past end of " + path_.string());
    }
    position_ = offset;
    return Ok();
}

Result<std::vector<std::uint8_t>> FileContentSource::read_range(std::uint64_t start, std::uint64_t end) {
    if (!is_readable()) {
        return Err(std::string("Source file is not readable: ") + path_.string());
    }
    if (auto res = check_range(start, end, length_); res.is_error()) {
        return Err(res.error());
    }

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(end - start));
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(start));
    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (static_cast<std::size_t>(stream_.gcount()) != buffer.size()) {
        return Err("Short read from " + path_.string() + " at offset " + std::to_string(start));
    }

    position_ = end;
    return Ok(std::move(buffer));
}

void FileContentSource::close() {
    stream_.close();
}

// ──────────────────────────────────────────────────────────
// MemoryContentSource
// ──────────────────────────────────────────────────────────

MemoryContentSource::MemoryContentSource(std::vector<std::uint8_t> data, bool seekable)
    : data_(std::move(data))
    , seekable_(seekable) {
}

Result<void> MemoryContentSource::seek(std::uint64_t offset) {
    if (!seekable_) {
        return Err("Source is not seekable");
    }
    if (offset > data_.size()) {
        return Err("Seek past end of source");
    }
    position_ = offset;
    return Ok();
}

Result<std::vector<std::uint8_t>> MemoryContentSource::read_range(std::uint64_t start, std::uint64_t end) {
    if (!readable_) {
        return Err("Source is closed");
    }
    if (auto res = check_range(start, end, data_.size()); res.is_error()) {
        return Err(res.error());
    }
    if (!seekable_ && start != position_) {
        return Err("Non-seekable source is at offset " + std::to_string(position_) +
                   ", cannot read from " + std::to_string(start));
    }

    std::vector<std::uint8_t> bytes(data_.begin() + static_cast<std::ptrdiff_t>(start),
                                    data_.begin() + static_cast<std::ptrdiff_t>(end));
    position_ = end;
    return Ok(std::move(bytes));
}

} // namespace chunkup::upload
