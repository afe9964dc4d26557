/**
 * @file upload_config.h
 * @brief Configuration for chunked uploads
 */

#ifndef CHUNKED_UPLOAD_CORE_UPLOAD_CONFIG_H
#define CHUNKED_UPLOAD_CORE_UPLOAD_CONFIG_H

#include <chunked_upload/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace chunked_upload {

/**
 * @brief Per-chunk retry budget and exponential backoff
 */
struct retry_policy {
    /// Retries allowed after the first attempt of a chunk
    uint32_t max_retries = 3;

    /// Delay before the first retry
    std::chrono::milliseconds initial_backoff{1000};

    /// Upper bound on any single delay
    std::chrono::milliseconds max_backoff{30000};

    /// Multiplier applied per further retry
    double backoff_multiplier = 2.0;

    [[nodiscard]] auto validate() const -> result<void> {
        if (initial_backoff.count() < 0 || max_backoff.count() < 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "backoff delays must not be negative"});
        }
        if (max_backoff < initial_backoff) {
            return unexpected(error{error_code::invalid_configuration,
                                    "max backoff must not be below initial backoff"});
        }
        if (backoff_multiplier < 1.0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "backoff multiplier must be at least 1.0"});
        }
        return {};
    }
};

/**
 * @brief How a session confirms the whole-file digest before completing
 */
enum class verification_mode {
    reread_source,   ///< Recompute from the source and compare with the planned digest
    planned_digest,  ///< Report the digest accumulated during planning
};

/**
 * @brief Engine configuration
 */
struct upload_config {
    /// Default chunk size (1MB)
    static constexpr std::size_t default_chunk_size = 1024 * 1024;

    /// Minimum allowed chunk size (1KB)
    static constexpr std::size_t min_chunk_size = 1024;

    /// Maximum allowed chunk size (64MB)
    static constexpr std::size_t max_chunk_size = 64 * 1024 * 1024;

    /// Default number of chunks in flight per session
    static constexpr std::size_t default_max_concurrent = 3;

    std::size_t chunk_size = default_chunk_size;
    std::size_t max_concurrent = default_max_concurrent;

    /// Files larger than this are rejected before planning
    std::optional<uint64_t> max_file_size;

    retry_policy retry;

    /// Timeout of one chunk request
    std::chrono::milliseconds request_timeout{30000};

    verification_mode verification = verification_mode::reread_source;

    /// Worker threads for chunk tasks (0 = hardware concurrency)
    std::size_t worker_threads = 0;

    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size < min_chunk_size) {
            return unexpected(error{
                error_code::invalid_chunk_size,
                "chunk size too small (minimum: " + std::to_string(min_chunk_size) + ")"});
        }
        if (chunk_size > max_chunk_size) {
            return unexpected(error{
                error_code::invalid_chunk_size,
                "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"});
        }
        if (max_concurrent == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "max concurrent chunks must be at least 1"});
        }
        if (max_file_size && *max_file_size == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "max file size must be positive when set"});
        }
        if (request_timeout.count() <= 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "request timeout must be positive"});
        }
        return retry.validate();
    }

    /**
     * @brief Number of chunks needed for a file of the given size
     */
    [[nodiscard]] auto calculate_chunk_count(uint64_t file_size) const -> uint64_t {
        if (file_size == 0) return 0;
        return (file_size + chunk_size - 1) / chunk_size;
    }
};

/**
 * @brief Per-submission overrides
 */
struct upload_options {
    /// Name sent to the endpoint (defaults to the source name)
    std::optional<std::string> file_name;
    std::optional<std::size_t> chunk_size;
    std::optional<std::size_t> max_concurrent;
    std::optional<uint32_t> max_retries;

    /**
     * @brief Apply overrides on top of a base configuration
     */
    [[nodiscard]] auto apply(upload_config base) const -> upload_config {
        if (chunk_size) base.chunk_size = *chunk_size;
        if (max_concurrent) base.max_concurrent = *max_concurrent;
        if (max_retries) base.retry.max_retries = *max_retries;
        return base;
    }
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_CORE_UPLOAD_CONFIG_H
