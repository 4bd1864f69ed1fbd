#pragma once

#include "chunkup/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace chunkup::upload {

/**
 * @brief Readable byte source with a known total length
 *
 * Owned by the caller. The upload code reads ranges from it and, when it is
 * seekable, repositions it; it never closes it. Not thread safe: one upload
 * reads a source at a time.
 *
 * read_range(start, end) returns bytes [start, end) and leaves position()
 * at end. A non-seekable source can only continue from its current
 * position.
 */
class ContentSource {
public:
    virtual ~ContentSource() = default;

    virtual std::uint64_t length() const = 0;
    virtual bool is_readable() const = 0;
    virtual bool is_seekable() const = 0;
    virtual std::uint64_t position() const = 0;

    virtual Result<void> seek(std::uint64_t offset) = 0;
    virtual Result<std::vector<std::uint8_t>> read_range(std::uint64_t start, std::uint64_t end) = 0;
};

class FileContentSource : public ContentSource {
public:
    static Result<std::unique_ptr<FileContentSource>> open(const std::filesystem::path& path);

    std::uint64_t length() const override { return length_; }
    bool is_readable() const override { return stream_.is_open() && !stream_.bad(); }
    bool is_seekable() const override { return true; }
    std::uint64_t position() const override { return position_; }

    Result<void> seek(std::uint64_t offset) override;
    Result<std::vector<std::uint8_t>> read_range(std::uint64_t start, std::uint64_t end) override;

    void close();

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    FileContentSource(std::filesystem::path path, std::ifstream stream, std::uint64_t length);

    std::filesystem::path path_;
    std::ifstream stream_;
    std::uint64_t length_;
    std::uint64_t position_ = 0;
};

/**
 * @brief In-memory source; seekability is selectable so both read paths can be exercised
 */
class MemoryContentSource : public ContentSource {
public:
    explicit MemoryContentSource(std::vector<std::uint8_t> data, bool seekable = true);

    std::uint64_t length() const override { return data_.size(); }
    bool is_readable() const override { return readable_; }
    bool is_seekable() const override { return seekable_; }
    std::uint64_t position() const override { return position_; }

    Result<void> seek(std::uint64_t offset) override;
    Result<std::vector<std::uint8_t>> read_range(std::uint64_t start, std::uint64_t end) override;

    void close() { readable_ = false; }

private:
    std::vector<std::uint8_t> data_;
    bool seekable_;
    bool readable_ = true;
    std::uint64_t position_ = 0;
};

} // namespace chunkup::upload
