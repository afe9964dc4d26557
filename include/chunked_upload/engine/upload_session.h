/**
 * @file upload_session.h
 * @brief One file being uploaded: dispatch loop, chunk tasks and verification
 */

#ifndef CHUNKED_UPLOAD_ENGINE_UPLOAD_SESSION_H
#define CHUNKED_UPLOAD_ENGINE_UPLOAD_SESSION_H

#include <chunked_upload/engine/upload_types.h>
#include <chunked_upload/core/byte_source.h>
#include <chunked_upload/core/cancellation_token.h>
#include <chunked_upload/core/chunk_types.h>
#include <chunked_upload/core/concurrency_limiter.h>
#include <chunked_upload/core/progress_aggregator.h>
#include <chunked_upload/core/retry_controller.h>
#include <chunked_upload/core/upload_config.h>
#include <chunked_upload/core/upload_state_machine.h>
#include <chunked_upload/transport/chunk_transport.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace chunked_upload {

namespace adapters {
class upload_thread_pool_interface;
}

/**
 * @brief Upload session for one planned file
 *
 * A session-owned dispatch thread takes limiter permits and hands chunks to
 * the thread pool, one task per chunk. Chunk state, the state machine and the
 * progress aggregator change only under the session mutex. Callbacks are
 * delivered under a separate callback mutex; cancel() takes it too, so no
 * callback starts after cancel() returns.
 *
 * Sessions are always held by shared_ptr; chunk tasks keep their session
 * alive until they finish.
 */
class upload_session : public std::enable_shared_from_this<upload_session> {
public:
    /**
     * @brief Create a session (not started)
     * @param id Session identifier sent with every chunk
     * @param source Source the plan was made from, re-read for verification
     * @param plan Chunk plan
     * @param config Effective configuration for this session
     * @param transport Chunk transport
     * @param pool Pool running chunk tasks
     * @param callbacks Event sinks
     */
    [[nodiscard]] static auto create(
        session_id id,
        std::shared_ptr<byte_source> source,
        upload_plan plan,
        upload_config config,
        std::shared_ptr<chunk_transport> transport,
        std::shared_ptr<adapters::upload_thread_pool_interface> pool,
        upload_callbacks callbacks) -> std::shared_ptr<upload_session>;

    ~upload_session();

    upload_session(const upload_session&) = delete;
    auto operator=(const upload_session&) -> upload_session& = delete;

    /**
     * @brief Start dispatching chunks
     *
     * An empty file goes straight to verification.
     */
    void start();

    /**
     * @brief Stop new dispatch; in-flight chunks finish
     */
    [[nodiscard]] auto pause() -> result<void>;

    /**
     * @brief Dispatch the chunks that are not uploaded yet
     */
    [[nodiscard]] auto resume() -> result<void>;

    /**
     * @brief Reset failed chunks and dispatch them again
     * @return invalid_state unless in error; file_hash_mismatch after an
     *         integrity failure
     */
    [[nodiscard]] auto retry() -> result<void>;

    /**
     * @brief Abort in-flight transfers and stop for good
     */
    [[nodiscard]] auto cancel() -> result<void>;

    /**
     * @brief Block until nothing is running and no progress is possible
     *        without a control command
     * @return true if the session settled within the timeout
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) const -> bool;

    [[nodiscard]] auto id() const noexcept -> const session_id& { return id_; }
    [[nodiscard]] auto file_name() const -> const std::string& { return file_name_; }
    [[nodiscard]] auto file_size() const noexcept -> uint64_t { return file_size_; }

    [[nodiscard]] auto status() const -> upload_status;
    [[nodiscard]] auto uploaded_bytes() const -> uint64_t;
    [[nodiscard]] auto progress() const -> progress_report;
    [[nodiscard]] auto snapshot() const -> session_snapshot;

private:
    upload_session(session_id id,
                   std::shared_ptr<byte_source> source,
                   upload_plan plan,
                   upload_config config,
                   std::shared_ptr<chunk_transport> transport,
                   std::shared_ptr<adapters::upload_thread_pool_interface> pool,
                   upload_callbacks callbacks);

    void ensure_dispatcher_locked();
    void dispatch_loop();
    [[nodiscard]] auto has_dispatchable_chunk_locked() const -> bool;

    /**
     * @brief Read one chunk from the source and check it against its planned digest
     */
    [[nodiscard]] auto load_chunk(uint64_t offset, uint64_t length,
                                  const std::string& planned_digest) const
        -> result<std::vector<std::byte>>;
    void abandon_chunk(uint64_t index, const error& cause);
    void run_chunk(uint64_t index);
    void run_verification();
    void finish_task();

    [[nodiscard]] auto summary_locked() const -> chunk_summary;
    [[nodiscard]] auto progress_locked() const -> progress_report;
    [[nodiscard]] auto settled_locked() const -> bool;

    void emit_progress();
    void emit_error(const error_report& report);
    void emit_complete(const completion_report& report);

    const session_id id_;
    const std::string file_name_;
    const uint64_t file_size_;

    std::shared_ptr<byte_source> source_;
    upload_plan plan_;
    upload_config config_;
    std::shared_ptr<adapters::upload_thread_pool_interface> pool_;
    upload_callbacks callbacks_;

    retry_controller retry_;
    concurrency_limiter limiter_;
    cancellation_token token_;

    upload_state_machine machine_;
    progress_aggregator progress_;
    std::optional<error> last_error_;

    bool dispatching_{false};
    std::size_t running_tasks_{0};
    std::thread dispatcher_;

    mutable std::mutex mutex_;
    mutable std::condition_variable settled_cv_;
    std::recursive_mutex callback_mutex_;
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_ENGINE_UPLOAD_SESSION_H
