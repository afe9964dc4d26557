/**
 * @file byte_source.cpp
 * @brief File and memory byte sources
 */

#include "chunked_upload/core/byte_source.h"

#include <algorithm>
#include <cstring>

namespace chunked_upload {

auto file_byte_source::open(const std::filesystem::path& path)
    -> result<std::shared_ptr<file_byte_source>> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return unexpected{error{error_code::file_not_found,
                                "file not found: " + path.string()}};
    }

    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected{error{error_code::file_read_error,
                                "not a regular file: " + path.string()}};
    }

    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected{error{error_code::file_read_error,
                                "failed to get file size: " + ec.message()}};
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return unexpected{error{error_code::file_access_denied,
                                "failed to open file: " + path.string()}};
    }

    return std::shared_ptr<file_byte_source>(
        new file_byte_source(path, file_size, std::move(stream)));
}

file_byte_source::file_byte_source(std::filesystem::path path, uint64_t size,
                                   std::ifstream stream)
    : path_(std::move(path)), size_(size), stream_(std::move(stream)) {}

auto file_byte_source::name() const -> std::string {
    return path_.filename().string();
}

auto file_byte_source::size() const -> uint64_t {
    return size_;
}

auto file_byte_source::read(uint64_t offset, std::span<std::byte> out) const
    -> result<std::size_t> {
    if (offset > size_) {
        return unexpected{error{error_code::file_read_error,
                                "read offset beyond end of file"}};
    }

    auto wanted = static_cast<std::size_t>(
        std::min<uint64_t>(out.size(), size_ - offset));
    if (wanted == 0) {
        return std::size_t{0};
    }

    std::lock_guard<std::mutex> lock(mutex_);

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    if (!stream_) {
        return unexpected{error{error_code::file_read_error,
                                "failed to seek in " + path_.string()}};
    }

    stream_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(wanted));
    auto got = static_cast<std::size_t>(stream_.gcount());
    if (got != wanted) {
        return unexpected{error{error_code::file_read_error,
                                "short read from " + path_.string() + ": expected " +
                                    std::to_string(wanted) + ", got " + std::to_string(got)}};
    }

    return got;
}

memory_byte_source::memory_byte_source(std::string name, std::vector<std::byte> data)
    : name_(std::move(name)), data_(std::move(data)) {}

auto memory_byte_source::read(uint64_t offset, std::span<std::byte> out) const
    -> result<std::size_t> {
    if (offset > data_.size()) {
        return unexpected{error{error_code::file_read_error,
                                "read offset beyond end of buffer"}};
    }

    auto count = static_cast<std::size_t>(
        std::min<uint64_t>(out.size(), data_.size() - offset));
    if (count > 0) {
        std::memcpy(out.data(), data_.data() + offset, count);
    }
    return count;
}

}  // namespace chunked_upload
