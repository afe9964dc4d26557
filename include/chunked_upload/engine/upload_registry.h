/**
 * @file upload_registry.h
 * @brief Owner of concurrent upload sessions and their control surface
 */

#ifndef CHUNKED_UPLOAD_ENGINE_UPLOAD_REGISTRY_H
#define CHUNKED_UPLOAD_ENGINE_UPLOAD_REGISTRY_H

#include <chunked_upload/engine/upload_types.h>
#include <chunked_upload/core/byte_source.h>
#include <chunked_upload/core/types.h>
#include <chunked_upload/core/upload_config.h>
#include <chunked_upload/transport/chunk_transport.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

namespace chunked_upload {

namespace adapters {
class upload_thread_pool_interface;
}

/**
 * @brief Registry of upload sessions keyed by session id
 *
 * @code
 * auto registry_result = upload_registry::builder()
 *     .with_chunk_size(1024 * 1024)
 *     .with_max_concurrent(3)
 *     .with_transport(std::make_shared<http_chunk_transport>(http_config))
 *     .build();
 *
 * if (registry_result.has_value()) {
 *     auto& registry = registry_result.value();
 *     registry.on_progress([](const progress_report& p) {
 *         std::cout << p.percent << "%\n";
 *     });
 *     auto id = registry.submit("/data/large.bin");
 *     if (id) {
 *         auto status = registry.wait(id.value(), std::chrono::minutes(5));
 *     }
 * }
 * @endcode
 */
class upload_registry {
public:
    /**
     * @brief Builder for upload_registry
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set chunk size
         * @param size Chunk size in bytes (default: 1MB)
         * @return Reference to builder for chaining
         */
        auto with_chunk_size(std::size_t size) -> builder&;

        /**
         * @brief Set the number of chunks in flight per session
         * @param count Permit count (default: 3)
         * @return Reference to builder for chaining
         */
        auto with_max_concurrent(std::size_t count) -> builder&;

        /**
         * @brief Set the per-chunk retry budget
         * @param retries Retries after the first attempt (default: 3)
         * @return Reference to builder for chaining
         */
        auto with_max_retries(uint32_t retries) -> builder&;

        /**
         * @brief Reject files above this size
         * @return Reference to builder for chaining
         */
        auto with_max_file_size(uint64_t bytes) -> builder&;

        /**
         * @brief Set the backoff schedule
         * @param initial Delay before the first retry (default: 1s)
         * @param maximum Cap on any delay (default: 30s)
         * @param multiplier Growth per retry (default: 2.0)
         * @return Reference to builder for chaining
         */
        auto with_backoff(std::chrono::milliseconds initial,
                          std::chrono::milliseconds maximum,
                          double multiplier = 2.0) -> builder&;

        /**
         * @brief Set the timeout of one chunk request
         * @return Reference to builder for chaining
         */
        auto with_request_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Choose how completion is verified
         * @return Reference to builder for chaining
         */
        auto with_verification(verification_mode mode) -> builder&;

        /**
         * @brief Set the chunk transport (required)
         * @return Reference to builder for chaining
         */
        auto with_transport(std::shared_ptr<chunk_transport> transport) -> builder&;

        /**
         * @brief Share an existing thread pool
         * @return Reference to builder for chaining
         */
        auto with_thread_pool(
            std::shared_ptr<adapters::upload_thread_pool_interface> pool) -> builder&;

        /**
         * @brief Worker threads of the pool created by build()
         * @param count Thread count (0 = hardware concurrency)
         * @return Reference to builder for chaining
         */
        auto with_worker_threads(std::size_t count) -> builder&;

        /**
         * @brief Build the registry
         * @return Registry, or invalid_configuration / invalid_chunk_size
         */
        [[nodiscard]] auto build() -> result<upload_registry>;

    private:
        upload_config config_;
        std::shared_ptr<chunk_transport> transport_;
        std::shared_ptr<adapters::upload_thread_pool_interface> pool_;
    };

    // Non-copyable, movable
    upload_registry(const upload_registry&) = delete;
    auto operator=(const upload_registry&) -> upload_registry& = delete;
    upload_registry(upload_registry&&) noexcept;
    auto operator=(upload_registry&&) noexcept -> upload_registry&;

    /**
     * @brief Cancels every session that is still registered
     */
    ~upload_registry();

    /**
     * @brief Plan and start uploading a file
     * @param path File to upload
     * @param options Per-submission overrides
     * @return New session id, or file_not_found / file_too_large / config errors
     */
    [[nodiscard]] auto submit(const std::filesystem::path& path,
                              const upload_options& options = {}) -> result<session_id>;

    /**
     * @brief Plan and start uploading an arbitrary byte source
     */
    [[nodiscard]] auto submit(std::shared_ptr<byte_source> source,
                              const upload_options& options = {}) -> result<session_id>;

    [[nodiscard]] auto pause(const session_id& id) -> result<void>;
    [[nodiscard]] auto resume(const session_id& id) -> result<void>;

    /**
     * @brief Cancel and remove a session
     */
    [[nodiscard]] auto cancel(const session_id& id) -> result<void>;

    /**
     * @brief Reset a failed session's failed chunks and upload them again
     */
    [[nodiscard]] auto retry(const session_id& id) -> result<void>;

    /**
     * @brief Drop a session that is not running
     *
     * Paused and failed sessions are cancelled first. A session that is
     * still uploading or verifying is refused with invalid_state.
     */
    [[nodiscard]] auto clear(const session_id& id) -> result<void>;

    /**
     * @brief Drop every completed session
     * @return Number of sessions removed
     */
    auto clear_finished() -> std::size_t;

    [[nodiscard]] auto status(const session_id& id) const -> result<upload_status>;
    [[nodiscard]] auto snapshot(const session_id& id) const -> result<session_snapshot>;
    [[nodiscard]] auto progress(const session_id& id) const -> result<progress_report>;

    /**
     * @brief Block until the session settles
     * @return Settled status, or connection_timeout if it is still running
     */
    [[nodiscard]] auto wait(const session_id& id, std::chrono::milliseconds timeout) const
        -> result<upload_status>;

    [[nodiscard]] auto statistics() const -> global_statistics;
    [[nodiscard]] auto session_ids() const -> std::vector<session_id>;
    [[nodiscard]] auto config() const -> const upload_config&;

    // Callbacks
    void on_progress(std::function<void(const progress_report&)> callback);
    void on_complete(std::function<void(const completion_report&)> callback);
    void on_error(std::function<void(const error_report&)> callback);

    /**
     * @brief Called with fresh global counters after every session event
     */
    void on_statistics(std::function<void(const global_statistics&)> callback);

private:
    upload_registry(upload_config config,
                    std::shared_ptr<chunk_transport> transport,
                    std::shared_ptr<adapters::upload_thread_pool_interface> pool);

    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_ENGINE_UPLOAD_REGISTRY_H
