/**
 * @file upload_state_machine.h
 * @brief Session status and the rules that derive it from chunk states
 */

#ifndef CHUNKED_UPLOAD_CORE_UPLOAD_STATE_MACHINE_H
#define CHUNKED_UPLOAD_CORE_UPLOAD_STATE_MACHINE_H

#include <chunked_upload/core/types.h>

#include <cstdint>
#include <string_view>

namespace chunked_upload {

/**
 * @brief Aggregate status of an upload session
 */
enum class upload_status : uint8_t {
    uploading,  ///< Dispatching chunks
    paused,     ///< No new dispatch; in-flight chunks may still finish
    verifying,  ///< All chunks uploaded; checking the whole-file digest
    completed,  ///< Terminal success
    error,      ///< A chunk exhausted its retries, or whole-file integrity failed
    cancelled,  ///< Terminal; session is torn down
};

[[nodiscard]] constexpr auto to_string(upload_status status) -> std::string_view {
    switch (status) {
        case upload_status::uploading: return "uploading";
        case upload_status::paused: return "paused";
        case upload_status::verifying: return "verifying";
        case upload_status::completed: return "completed";
        case upload_status::error: return "error";
        case upload_status::cancelled: return "cancelled";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal_status(upload_status status) -> bool {
    return status == upload_status::completed || status == upload_status::cancelled;
}

/**
 * @brief Chunk counts the evaluation rules look at
 */
struct chunk_summary {
    uint64_t total = 0;
    uint64_t uploaded = 0;
    uint64_t failed = 0;
    uint64_t in_flight = 0;
};

/**
 * @brief Status transition produced by an operation
 */
struct status_transition {
    upload_status from;
    upload_status to;

    [[nodiscard]] auto changed() const noexcept -> bool { return from != to; }
};

/**
 * @brief Session state machine
 *
 * Not thread-safe; the owning session serializes access under its mutex.
 *
 * Evaluation order after every chunk event:
 * any failed chunk -> error; all uploaded -> verifying;
 * pause requested -> paused; otherwise uploading.
 */
class upload_state_machine {
public:
    upload_state_machine() = default;

    [[nodiscard]] auto status() const noexcept -> upload_status { return status_; }
    [[nodiscard]] auto pause_requested() const noexcept -> bool { return pause_requested_; }
    [[nodiscard]] auto integrity_failed() const noexcept -> bool { return integrity_failed_; }

    /**
     * @brief Re-derive the status from chunk counts
     *
     * Terminal states and verifying are left untouched. An integrity
     * failure keeps the session in error.
     */
    auto evaluate(const chunk_summary& summary) -> status_transition;

    /**
     * @brief Allowed from uploading; a paused session accepts it as a no-op
     */
    [[nodiscard]] auto pause() -> result<status_transition>;

    /**
     * @brief Allowed from paused; an uploading session accepts it as a no-op
     */
    [[nodiscard]] auto resume() -> result<status_transition>;

    /**
     * @brief Allowed from error unless the whole-file check failed
     */
    [[nodiscard]] auto retry() -> result<status_transition>;

    /**
     * @brief Allowed from any non-terminal state
     */
    [[nodiscard]] auto cancel() -> result<status_transition>;

    /**
     * @brief verifying -> completed
     */
    [[nodiscard]] auto complete() -> result<status_transition>;

    /**
     * @brief Any non-terminal state -> error (file_hash_mismatch)
     *
     * Used when the whole-file digest disagrees at verification, or when a
     * chunk re-read before sending no longer matches its planned digest.
     * Retry is refused afterwards.
     */
    [[nodiscard]] auto fail_integrity() -> result<status_transition>;

    /**
     * @brief Check a direct transition against the transition table
     */
    [[nodiscard]] static auto is_valid_transition(upload_status from, upload_status to) -> bool;

private:
    auto move_to(upload_status next) -> status_transition;

    upload_status status_{upload_status::uploading};
    bool pause_requested_{false};
    bool integrity_failed_{false};
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_CORE_UPLOAD_STATE_MACHINE_H
