/**
 * @file concurrency_limiter.cpp
 * @brief Implementation of the FIFO counting semaphore
 */

#include "chunked_upload/core/concurrency_limiter.h"

#include "chunked_upload/core/logging.h"

#include <algorithm>

namespace chunked_upload {

concurrency_limiter::concurrency_limiter(std::size_t permits)
    : capacity_(permits), available_(permits) {}

concurrency_limiter::~concurrency_limiter() {
    shutdown();
}

auto concurrency_limiter::acquire(const cancellation_token& token) -> result<void> {
    return acquire_impl(&token);
}

auto concurrency_limiter::acquire() -> result<void> {
    return acquire_impl(nullptr);
}

auto concurrency_limiter::acquire_impl(const cancellation_token* token) -> result<void> {
    if (token && token->is_cancelled()) {
        return unexpected{error{error_code::transfer_cancelled,
                                "cancelled before acquiring a permit"}};
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (shutdown_) {
        return unexpected{error{error_code::invalid_state, "limiter is shut down"}};
    }

    if (available_ > 0 && wait_list_.empty()) {
        --available_;
        return {};
    }

    auto entry = std::make_shared<waiter>();
    wait_list_.push_back(entry);
    CU_LOG_TRACE(log_category::limiter,
                 "Queued for permit, position " + std::to_string(wait_list_.size()));

    lock.unlock();
    std::unique_ptr<cancellation_subscription> subscription;
    if (token) {
        subscription = std::make_unique<cancellation_subscription>(*token, [this]() {
            { std::lock_guard<std::mutex> guard(mutex_); }
            cv_.notify_all();
        });
    }
    lock.lock();

    cv_.wait(lock, [&] {
        return entry->granted || entry->rejected || (token && token->is_cancelled());
    });

    if (entry->granted) {
        if (token && token->is_cancelled()) {
            // Handed a permit while cancelling: pass it on.
            lock.unlock();
            release();
            return unexpected{error{error_code::transfer_cancelled,
                                    "cancelled while waiting for a permit"}};
        }
        return {};
    }

    if (!entry->rejected) {
        wait_list_.erase(std::remove(wait_list_.begin(), wait_list_.end(), entry),
                         wait_list_.end());
        return unexpected{error{error_code::transfer_cancelled,
                                "cancelled while waiting for a permit"}};
    }

    return unexpected{error{error_code::invalid_state, "limiter is shut down"}};
}

auto concurrency_limiter::try_acquire() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ || available_ == 0 || !wait_list_.empty()) {
        return false;
    }
    --available_;
    return true;
}

void concurrency_limiter::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!wait_list_.empty()) {
            wait_list_.front()->granted = true;
            wait_list_.pop_front();
        } else if (available_ < capacity_) {
            ++available_;
        }
    }
    cv_.notify_all();
}

void concurrency_limiter::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        for (auto& entry : wait_list_) {
            entry->rejected = true;
        }
        wait_list_.clear();
    }
    cv_.notify_all();
}

auto concurrency_limiter::available() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

auto concurrency_limiter::waiting() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return wait_list_.size();
}

auto concurrency_limiter::in_use() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_ - available_;
}

}  // namespace chunked_upload
