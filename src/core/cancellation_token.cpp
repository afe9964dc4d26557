/**
 * @file cancellation_token.cpp
 * @brief Implementation of the shared cancellation signal
 */

#include "chunked_upload/core/cancellation_token.h"

#include <atomic>
#include <map>
#include <vector>

namespace chunked_upload {

struct cancellation_token::state {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
    std::map<callback_id, std::function<void()>> callbacks;
    callback_id next_id{1};
};

cancellation_token::cancellation_token() : state_(std::make_shared<state>()) {}

void cancellation_token::cancel() const {
    std::vector<std::function<void()>> to_run;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.exchange(true)) {
            return;
        }
        to_run.reserve(state_->callbacks.size());
        for (auto& [id, callback] : state_->callbacks) {
            to_run.push_back(std::move(callback));
        }
        state_->callbacks.clear();
    }
    state_->cv.notify_all();

    for (auto& callback : to_run) {
        callback();
    }
}

auto cancellation_token::is_cancelled() const noexcept -> bool {
    return state_->cancelled.load(std::memory_order_acquire);
}

auto cancellation_token::wait_for(std::chrono::milliseconds timeout) const -> bool {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] {
        return state_->cancelled.load(std::memory_order_acquire);
    });
}

auto cancellation_token::subscribe(std::function<void()> callback) const -> callback_id {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled.load()) {
            auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void cancellation_token::unsubscribe(callback_id id) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
}

}  // namespace chunked_upload
