/**
 * @file byte_source.h
 * @brief Readable, sized byte sequences that uploads are planned from
 */

#ifndef CHUNKED_UPLOAD_CORE_BYTE_SOURCE_H
#define CHUNKED_UPLOAD_CORE_BYTE_SOURCE_H

#include <chunked_upload/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace chunked_upload {

/**
 * @brief Random-access source of upload bytes
 *
 * Implementations must be safe to read from several threads at once; the
 * planner and the completion check both read from the same source.
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * @brief Name reported to the endpoint and in callbacks
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /**
     * @brief Total length in bytes
     */
    [[nodiscard]] virtual auto size() const -> uint64_t = 0;

    /**
     * @brief Read up to out.size() bytes starting at offset
     * @return Number of bytes actually read
     */
    [[nodiscard]] virtual auto read(uint64_t offset, std::span<std::byte> out) const
        -> result<std::size_t> = 0;
};

/**
 * @brief Byte source backed by a file on disk
 */
class file_byte_source : public byte_source {
public:
    /**
     * @brief Open a regular file
     * @return Source, or file_not_found / file_read_error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::shared_ptr<file_byte_source>>;

    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto size() const -> uint64_t override;
    [[nodiscard]] auto read(uint64_t offset, std::span<std::byte> out) const
        -> result<std::size_t> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    file_byte_source(std::filesystem::path path, uint64_t size, std::ifstream stream);

    std::filesystem::path path_;
    uint64_t size_;
    mutable std::ifstream stream_;
    mutable std::mutex mutex_;
};

/**
 * @brief Byte source backed by an in-memory buffer
 */
class memory_byte_source : public byte_source {
public:
    memory_byte_source(std::string name, std::vector<std::byte> data);

    [[nodiscard]] auto name() const -> std::string override { return name_; }
    [[nodiscard]] auto size() const -> uint64_t override { return data_.size(); }
    [[nodiscard]] auto read(uint64_t offset, std::span<std::byte> out) const
        -> result<std::size_t> override;

private:
    std::string name_;
    std::vector<std::byte> data_;
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_CORE_BYTE_SOURCE_H
