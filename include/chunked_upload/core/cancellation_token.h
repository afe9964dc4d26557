/**
 * @file cancellation_token.h
 * @brief Shared cancellation signal for a session's suspension points
 */

#ifndef CHUNKED_UPLOAD_CORE_CANCELLATION_TOKEN_H
#define CHUNKED_UPLOAD_CORE_CANCELLATION_TOKEN_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace chunked_upload {

/**
 * @brief Cancellation signal shared between a session and its chunk tasks
 *
 * Copies share one state. Once cancelled a token stays cancelled.
 * Subscribed callbacks run exactly once, on the thread calling cancel(),
 * or immediately on subscription when the token is already cancelled.
 */
class cancellation_token {
public:
    using callback_id = uint64_t;

    cancellation_token();

    /**
     * @brief Fire the signal; idempotent
     */
    void cancel() const;

    [[nodiscard]] auto is_cancelled() const noexcept -> bool;

    /**
     * @brief Sleep for up to timeout, returning early on cancellation
     * @return true if the token was cancelled before or during the wait
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) const -> bool;

    /**
     * @brief Subscribe to cancellation
     * @return Id for unsubscribe(), or 0 when the callback already ran
     */
    auto subscribe(std::function<void()> callback) const -> callback_id;

    void unsubscribe(callback_id id) const;

private:
    struct state;
    std::shared_ptr<state> state_;
};

/**
 * @brief RAII subscription to a cancellation_token
 */
class cancellation_subscription {
public:
    cancellation_subscription(const cancellation_token& token, std::function<void()> callback)
        : token_(token), id_(token.subscribe(std::move(callback))) {}

    ~cancellation_subscription() {
        if (id_ != 0) {
            token_.unsubscribe(id_);
        }
    }

    cancellation_subscription(const cancellation_subscription&) = delete;
    cancellation_subscription& operator=(const cancellation_subscription&) = delete;

private:
    cancellation_token token_;
    cancellation_token::callback_id id_;
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_CORE_CANCELLATION_TOKEN_H
