/**
 * @file types.h
 * @brief Core type definitions for chunked_upload_system
 */

#ifndef CHUNKED_UPLOAD_CORE_TYPES_H
#define CHUNKED_UPLOAD_CORE_TYPES_H

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace chunked_upload {

/**
 * @brief Error codes for upload operations
 */
enum class error_code {
    success = 0,

    // Source errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    file_too_large = -103,
    file_read_error = -105,

    // Integrity errors (-120 to -139)
    chunk_checksum_mismatch = -120,
    file_hash_mismatch = -123,
    invalid_chunk_index = -124,

    // Configuration errors (-140 to -159)
    invalid_chunk_size = -140,
    invalid_configuration = -141,

    // Transport errors (-160 to -179)
    transport_error = -160,
    connection_timeout = -161,
    upload_rejected = -162,
    not_available = -163,

    // Session errors (-180 to -199)
    transfer_cancelled = -180,
    session_not_found = -181,
    invalid_state = -182,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_too_large:
            return "file too large";
        case error_code::file_read_error:
            return "file read error";
        case error_code::chunk_checksum_mismatch:
            return "chunk checksum mismatch";
        case error_code::file_hash_mismatch:
            return "file hash mismatch";
        case error_code::invalid_chunk_index:
            return "invalid chunk index";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::transport_error:
            return "transport error";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::upload_rejected:
            return "upload rejected";
        case error_code::not_available:
            return "not available";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::session_not_found:
            return "session not found";
        case error_code::invalid_state:
            return "invalid state";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check whether a failed chunk attempt may be retried
 *
 * Transport faults, endpoint rejections and checksum mismatches reported by
 * the endpoint are retryable. Cancellation and local errors are not.
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) -> bool {
    switch (code) {
        case error_code::transport_error:
        case error_code::connection_timeout:
        case error_code::upload_rejected:
        case error_code::chunk_checksum_mismatch:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Unique identifier for an upload session (UUID v4)
 */
struct session_id {
    std::array<uint8_t, 16> bytes{};

    session_id() = default;

    /**
     * @brief Generate a new random session id
     */
    [[nodiscard]] static auto generate() -> session_id;

    /**
     * @brief Format as xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Parse the canonical textual form
     * @return Parsed id, or nullopt when the text is not 32 hex digits
     */
    [[nodiscard]] static auto from_string(std::string_view str) -> std::optional<session_id>;

    [[nodiscard]] auto is_null() const noexcept -> bool {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] auto operator==(const session_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const session_id& other) const -> bool {
        return bytes < other.bytes;
    }
};

}  // namespace chunked_upload

// Hash support for session_id
template <>
struct std::hash<chunked_upload::session_id> {
    auto operator()(const chunked_upload::session_id& id) const noexcept -> std::size_t {
        std::size_t h = 0;
        for (auto b : id.bytes) {
            h = h * 31 + b;
        }
        return h;
    }
};

#endif  // CHUNKED_UPLOAD_CORE_TYPES_H
