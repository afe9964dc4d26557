/**
 * @file concurrency_limiter.h
 * @brief FIFO counting semaphore bounding chunks in flight
 */

#ifndef CHUNKED_UPLOAD_CORE_CONCURRENCY_LIMITER_H
#define CHUNKED_UPLOAD_CORE_CONCURRENCY_LIMITER_H

#include <chunked_upload/core/cancellation_token.h>
#include <chunked_upload/core/types.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

namespace chunked_upload {

/**
 * @brief Counting semaphore with strict FIFO hand-off
 *
 * acquire() takes a permit immediately only when one is free and nobody is
 * queued. release() gives the permit straight to the longest waiter, so a
 * newcomer can never overtake a queued acquirer.
 *
 * @code
 * concurrency_limiter limiter(3);
 * auto permit = limiter.acquire(token);
 * if (permit) {
 *     // ... transfer ...
 *     limiter.release();
 * }
 * @endcode
 */
class concurrency_limiter {
public:
    explicit concurrency_limiter(std::size_t permits = 3);
    ~concurrency_limiter();

    concurrency_limiter(const concurrency_limiter&) = delete;
    concurrency_limiter& operator=(const concurrency_limiter&) = delete;

    /**
     * @brief Block until a permit is handed over
     * @return transfer_cancelled if the token fires while waiting,
     *         invalid_state after shutdown()
     */
    [[nodiscard]] auto acquire(const cancellation_token& token) -> result<void>;

    /**
     * @brief Block until a permit is handed over (no cancellation)
     */
    [[nodiscard]] auto acquire() -> result<void>;

    /**
     * @brief Take a permit only if one is free and nobody is queued
     */
    [[nodiscard]] auto try_acquire() -> bool;

    /**
     * @brief Return a permit, handing it to the front waiter if any
     */
    void release();

    /**
     * @brief Reject all current and future acquirers
     */
    void shutdown();

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }
    [[nodiscard]] auto available() const -> std::size_t;
    [[nodiscard]] auto waiting() const -> std::size_t;
    [[nodiscard]] auto in_use() const -> std::size_t;

private:
    struct waiter {
        bool granted = false;
        bool rejected = false;
    };

    [[nodiscard]] auto acquire_impl(const cancellation_token* token) -> result<void>;

    const std::size_t capacity_;
    std::size_t available_;
    std::deque<std::shared_ptr<waiter>> wait_list_;
    bool shutdown_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

/**
 * @brief RAII holder of one limiter permit
 */
class scoped_permit {
public:
    scoped_permit() = default;
    explicit scoped_permit(concurrency_limiter& limiter) : limiter_(&limiter) {}

    ~scoped_permit() { reset(); }

    scoped_permit(const scoped_permit&) = delete;
    scoped_permit& operator=(const scoped_permit&) = delete;

    scoped_permit(scoped_permit&& other) noexcept : limiter_(other.limiter_) {
        other.limiter_ = nullptr;
    }

    scoped_permit& operator=(scoped_permit&& other) noexcept {
        if (this != &other) {
            reset();
            limiter_ = other.limiter_;
            other.limiter_ = nullptr;
        }
        return *this;
    }

    /**
     * @brief Release the permit now
     */
    void reset() {
        if (limiter_) {
            limiter_->release();
            limiter_ = nullptr;
        }
    }

    [[nodiscard]] auto owns_permit() const noexcept -> bool { return limiter_ != nullptr; }

private:
    concurrency_limiter* limiter_{nullptr};
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_CORE_CONCURRENCY_LIMITER_H
