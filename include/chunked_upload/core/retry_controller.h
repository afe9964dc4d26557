/**
 * @file retry_controller.h
 * @brief Bounded retry loop with exponential backoff around a chunk transport
 */

#ifndef CHUNKED_UPLOAD_CORE_RETRY_CONTROLLER_H
#define CHUNKED_UPLOAD_CORE_RETRY_CONTROLLER_H

#include <chunked_upload/core/cancellation_token.h>
#include <chunked_upload/core/types.h>
#include <chunked_upload/core/upload_config.h>
#include <chunked_upload/transport/chunk_transport.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace chunked_upload {

/**
 * @brief How a chunk's retry loop ended
 */
enum class retry_outcome_kind {
    uploaded,     ///< Endpoint acknowledged the chunk
    exhausted,    ///< Retry budget used up; chunk is permanently failed
    cancelled,    ///< Session cancellation token fired
    interrupted,  ///< Stop requested (pause) before the next attempt
};

[[nodiscard]] constexpr auto to_string(retry_outcome_kind kind) -> std::string_view {
    switch (kind) {
        case retry_outcome_kind::uploaded: return "uploaded";
        case retry_outcome_kind::exhausted: return "exhausted";
        case retry_outcome_kind::cancelled: return "cancelled";
        case retry_outcome_kind::interrupted: return "interrupted";
        default: return "unknown";
    }
}

/**
 * @brief Result of running one chunk through the retry loop
 */
struct retry_outcome {
    retry_outcome_kind kind = retry_outcome_kind::exhausted;

    /// Retry counter after the loop (never above max_retries)
    uint32_t retries = 0;

    std::optional<chunk_ack> ack;
    std::optional<error> last_error;
};

/**
 * @brief Drives one chunk's attempts against the transport
 *
 * On a retryable failure with retries < max_retries the counter is
 * incremented, on_failure is notified, and the loop waits
 * backoff_delay(retries) before the next attempt. The wait ends early on
 * cancellation. A non-retryable error ends the loop as exhausted.
 */
class retry_controller {
public:
    /// Called after each failed attempt that will be retried
    using failure_callback = std::function<void(uint32_t retries, const error& err)>;

    /// Polled before every attempt; true stops the loop as interrupted
    using stop_predicate = std::function<bool()>;

    retry_controller(retry_policy policy, std::shared_ptr<chunk_transport> transport);

    /**
     * @brief Run the retry loop for one chunk
     * @param request Chunk to send
     * @param retries_so_far Counter carried over from earlier dispatches
     * @param token Session cancellation token
     * @param on_failure Optional failure observer
     * @param should_stop Optional pause check
     */
    [[nodiscard]] auto execute(const chunk_request& request,
                               uint32_t retries_so_far,
                               const cancellation_token& token,
                               const failure_callback& on_failure = {},
                               const stop_predicate& should_stop = {}) const -> retry_outcome;

    /**
     * @brief Delay before retry number `retries` (1-based)
     *
     * initial_backoff * multiplier^(retries-1), capped at max_backoff.
     */
    [[nodiscard]] auto backoff_delay(uint32_t retries) const -> std::chrono::milliseconds;

    [[nodiscard]] auto policy() const -> const retry_policy& { return policy_; }

private:
    [[nodiscard]] static auto ack_to_error(const chunk_ack& ack) -> error;

    retry_policy policy_;
    std::shared_ptr<chunk_transport> transport_;
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_CORE_RETRY_CONTROLLER_H
