/**
 * @file upload_types.h
 * @brief Reports, snapshots and callbacks exposed by the upload engine
 */

#ifndef CHUNKED_UPLOAD_ENGINE_UPLOAD_TYPES_H
#define CHUNKED_UPLOAD_ENGINE_UPLOAD_TYPES_H

#include <chunked_upload/core/chunk_types.h>
#include <chunked_upload/core/types.h>
#include <chunked_upload/core/upload_state_machine.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chunked_upload {

/**
 * @brief Progress event, emitted after every chunk transition
 */
struct progress_report {
    session_id id;
    std::string file_name;
    upload_status status = upload_status::uploading;
    uint64_t uploaded_bytes = 0;
    uint64_t total_bytes = 0;
    double percent = 0.0;
    double bytes_per_second = 0.0;
    std::optional<std::chrono::milliseconds> eta;
    uint64_t uploaded_chunks = 0;
    uint64_t total_chunks = 0;
    uint64_t failed_chunks = 0;
    uint64_t total_retries = 0;
};

/**
 * @brief Emitted once when a session completes and its digest checks out
 */
struct completion_report {
    session_id id;
    std::string file_name;
    uint64_t size = 0;
    uint64_t chunk_count = 0;
    std::string whole_file_digest;
    uint64_t duration_ms = 0;
};

/**
 * @brief Emitted for an exhausted chunk or a failed whole-file check
 */
struct error_report {
    session_id id;
    std::string file_name;
    error_code code = error_code::internal_error;
    std::string message;
    std::optional<uint64_t> chunk_index;
    std::optional<uint32_t> retry_count;
};

/**
 * @brief Aggregate counters over every registered session
 */
struct global_statistics {
    uint64_t total_sessions = 0;
    uint64_t active_sessions = 0;     ///< uploading or verifying
    uint64_t paused_sessions = 0;
    uint64_t completed_sessions = 0;
    uint64_t failed_sessions = 0;
    uint64_t total_bytes = 0;
    uint64_t uploaded_bytes = 0;
};

/**
 * @brief State of one chunk inside a session snapshot
 */
struct chunk_snapshot {
    uint64_t index = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
    std::string digest;
    chunk_state state = chunk_state::pending;
    uint32_t retries = 0;
};

/**
 * @brief Inspectable view of a session
 */
struct session_snapshot {
    session_id id;
    std::string file_name;
    upload_status status = upload_status::uploading;
    uint64_t file_size = 0;
    uint64_t uploaded_bytes = 0;
    std::string planned_digest;
    uint64_t buffered_bytes = 0;  ///< Chunk bytes read and not yet released
    std::vector<chunk_snapshot> chunks;
    std::optional<error> last_error;

    /**
     * @brief Indices of permanently failed chunks
     */
    [[nodiscard]] auto failed_chunks() const -> std::vector<uint64_t> {
        std::vector<uint64_t> failed;
        for (const auto& chunk : chunks) {
            if (chunk.state == chunk_state::failed) {
                failed.push_back(chunk.index);
            }
        }
        return failed;
    }
};

/**
 * @brief Event sinks of a session
 */
struct upload_callbacks {
    std::function<void(const progress_report&)> on_progress;
    std::function<void(const completion_report&)> on_complete;
    std::function<void(const error_report&)> on_error;
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_ENGINE_UPLOAD_TYPES_H
