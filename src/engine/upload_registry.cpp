/**
 * @file upload_registry.cpp
 * @brief Implementation of upload_registry
 */

#include "chunked_upload/engine/upload_registry.h"

#include "chunked_upload/adapters/thread_pool_adapter.h"
#include "chunked_upload/core/chunk_planner.h"
#include "chunked_upload/core/logging.h"
#include "chunked_upload/engine/upload_session.h"

#include <map>
#include <mutex>

namespace chunked_upload {

namespace {

auto session_not_found(const session_id& id) -> unexpected {
    return unexpected{error{error_code::session_not_found, "unknown session " + id.to_string()}};
}

}  // namespace

// ============================================================================
// impl
// ============================================================================

struct upload_registry::impl {
    upload_config config;
    std::shared_ptr<chunk_transport> transport;
    std::shared_ptr<adapters::upload_thread_pool_interface> pool;

    mutable std::mutex sessions_mutex;
    std::map<session_id, std::shared_ptr<upload_session>> sessions;

    // Taken before any session or registry lock, never while holding one.
    mutable std::mutex stats_mutex;
    global_statistics stats;
    uint64_t stats_version{0};
    bool delivering_statistics{false};

    std::mutex callbacks_mutex;
    std::function<void(const progress_report&)> progress_callback;
    std::function<void(const completion_report&)> complete_callback;
    std::function<void(const error_report&)> error_callback;
    std::function<void(const global_statistics&)> statistics_callback;

    impl(upload_config cfg,
         std::shared_ptr<chunk_transport> t,
         std::shared_ptr<adapters::upload_thread_pool_interface> p)
        : config(std::move(cfg)), transport(std::move(t)), pool(std::move(p)) {}

    auto find(const session_id& id) const -> std::shared_ptr<upload_session> {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        auto it = sessions.find(id);
        return it == sessions.end() ? nullptr : it->second;
    }

    auto all_sessions() const -> std::vector<std::shared_ptr<upload_session>> {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        std::vector<std::shared_ptr<upload_session>> list;
        list.reserve(sessions.size());
        for (const auto& [id, session] : sessions) {
            list.push_back(session);
        }
        return list;
    }

    void remove(const session_id& id) {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        sessions.erase(id);
    }

    /**
     * @brief Recompute the global counters from the registered sessions
     *
     * Recompute and publish happen under stats_mutex, so a slower refresh can
     * never overwrite a newer one. Sessions are queried without holding the
     * registry mutex. One caller at a time delivers to the statistics callback
     * and keeps going until the newest snapshot has been delivered.
     */
    void refresh_statistics() {
        std::unique_lock<std::mutex> lock(stats_mutex);

        global_statistics fresh;
        for (const auto& session : all_sessions()) {
            ++fresh.total_sessions;
            fresh.total_bytes += session->file_size();
            fresh.uploaded_bytes += session->uploaded_bytes();

            switch (session->status()) {
                case upload_status::uploading:
                case upload_status::verifying:
                    ++fresh.active_sessions;
                    break;
                case upload_status::paused:
                    ++fresh.paused_sessions;
                    break;
                case upload_status::completed:
                    ++fresh.completed_sessions;
                    break;
                case upload_status::error:
                    ++fresh.failed_sessions;
                    break;
                case upload_status::cancelled:
                    break;
            }
        }
        stats = fresh;
        ++stats_version;

        if (delivering_statistics) {
            return;
        }
        delivering_statistics = true;

        while (true) {
            const auto version = stats_version;
            const auto snapshot = stats;
            lock.unlock();

            std::function<void(const global_statistics&)> callback;
            {
                std::lock_guard<std::mutex> callbacks_lock(callbacks_mutex);
                callback = statistics_callback;
            }
            if (callback) {
                callback(snapshot);
            }

            lock.lock();
            if (version == stats_version) {
                delivering_statistics = false;
                return;
            }
        }
    }

    /**
     * @brief Session callbacks forwarding to the registry's sinks
     */
    static auto make_callbacks(const std::shared_ptr<impl>& state) -> upload_callbacks {
        std::weak_ptr<impl> weak = state;
        upload_callbacks callbacks;

        callbacks.on_progress = [weak](const progress_report& report) {
            auto self = weak.lock();
            if (!self) return;
            std::function<void(const progress_report&)> callback;
            {
                std::lock_guard<std::mutex> lock(self->callbacks_mutex);
                callback = self->progress_callback;
            }
            if (callback) {
                callback(report);
            }
            self->refresh_statistics();
        };

        callbacks.on_complete = [weak](const completion_report& report) {
            auto self = weak.lock();
            if (!self) return;
            std::function<void(const completion_report&)> callback;
            {
                std::lock_guard<std::mutex> lock(self->callbacks_mutex);
                callback = self->complete_callback;
            }
            if (callback) {
                callback(report);
            }
            self->refresh_statistics();
        };

        callbacks.on_error = [weak](const error_report& report) {
            auto self = weak.lock();
            if (!self) return;
            std::function<void(const error_report&)> callback;
            {
                std::lock_guard<std::mutex> lock(self->callbacks_mutex);
                callback = self->error_callback;
            }
            if (callback) {
                callback(report);
            }
            self->refresh_statistics();
        };

        return callbacks;
    }
};

// ============================================================================
// builder
// ============================================================================

upload_registry::builder::builder() = default;

auto upload_registry::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto upload_registry::builder::with_max_concurrent(std::size_t count) -> builder& {
    config_.max_concurrent = count;
    return *this;
}

auto upload_registry::builder::with_max_retries(uint32_t retries) -> builder& {
    config_.retry.max_retries = retries;
    return *this;
}

auto upload_registry::builder::with_max_file_size(uint64_t bytes) -> builder& {
    config_.max_file_size = bytes;
    return *this;
}

auto upload_registry::builder::with_backoff(std::chrono::milliseconds initial,
                                            std::chrono::milliseconds maximum,
                                            double multiplier) -> builder& {
    config_.retry.initial_backoff = initial;
    config_.retry.max_backoff = maximum;
    config_.retry.backoff_multiplier = multiplier;
    return *this;
}

auto upload_registry::builder::with_request_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.request_timeout = timeout;
    return *this;
}

auto upload_registry::builder::with_verification(verification_mode mode) -> builder& {
    config_.verification = mode;
    return *this;
}

auto upload_registry::builder::with_transport(std::shared_ptr<chunk_transport> transport)
    -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto upload_registry::builder::with_thread_pool(
    std::shared_ptr<adapters::upload_thread_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto upload_registry::builder::with_worker_threads(std::size_t count) -> builder& {
    config_.worker_threads = count;
    return *this;
}

auto upload_registry::builder::build() -> result<upload_registry> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected{valid.error()};
    }
    if (!transport_) {
        return unexpected{error{error_code::invalid_configuration, "a chunk transport is required"}};
    }

    auto pool = pool_ ? pool_ : adapters::upload_pool_factory::create(config_.worker_threads);
    return upload_registry{config_, transport_, std::move(pool)};
}

// ============================================================================
// upload_registry
// ============================================================================

upload_registry::upload_registry(upload_config config,
                                 std::shared_ptr<chunk_transport> transport,
                                 std::shared_ptr<adapters::upload_thread_pool_interface> pool)
    : impl_(std::make_shared<impl>(std::move(config), std::move(transport), std::move(pool))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

upload_registry::upload_registry(upload_registry&&) noexcept = default;
auto upload_registry::operator=(upload_registry&&) noexcept -> upload_registry& = default;

upload_registry::~upload_registry() {
    if (!impl_) {
        return;
    }

    std::map<session_id, std::shared_ptr<upload_session>> remaining;
    {
        std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
        remaining.swap(impl_->sessions);
    }

    for (auto& [id, session] : remaining) {
        if (is_terminal_status(session->status())) {
            continue;
        }
        if (auto cancelled = session->cancel(); !cancelled) {
            CU_LOG_DEBUG(log_category::registry,
                         "Session " + id.to_string() + " not cancelled: " +
                             cancelled.error().message);
        }
    }
}

auto upload_registry::submit(const std::filesystem::path& path, const upload_options& options)
    -> result<session_id> {
    auto source = file_byte_source::open(path);
    if (!source) {
        return unexpected{source.error()};
    }
    return submit(std::shared_ptr<byte_source>(source.value()), options);
}

auto upload_registry::submit(std::shared_ptr<byte_source> source, const upload_options& options)
    -> result<session_id> {
    if (!source) {
        return unexpected{error{error_code::invalid_configuration, "byte source is null"}};
    }

    auto effective = options.apply(impl_->config);
    if (auto valid = effective.validate(); !valid) {
        return unexpected{valid.error()};
    }

    chunk_planner planner(effective, impl_->pool);
    auto plan = planner.plan(*source, options.file_name);
    if (!plan) {
        CU_LOG_WARN(log_category::registry,
                    "Rejected upload of " + source->name() + ": " + plan.error().message);
        return unexpected{plan.error()};
    }

    auto id = session_id::generate();
    auto session = upload_session::create(id, std::move(source), std::move(plan.value()),
                                          effective, impl_->transport, impl_->pool,
                                          impl::make_callbacks(impl_));

    {
        std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
        impl_->sessions.emplace(id, session);
    }

    CU_LOG_INFO(log_category::registry,
                "Submitted " + session->file_name() + " as session " + id.to_string());

    session->start();
    impl_->refresh_statistics();
    return id;
}

auto upload_registry::pause(const session_id& id) -> result<void> {
    auto session = impl_->find(id);
    if (!session) {
        return session_not_found(id);
    }
    auto paused = session->pause();
    impl_->refresh_statistics();
    return paused;
}

auto upload_registry::resume(const session_id& id) -> result<void> {
    auto session = impl_->find(id);
    if (!session) {
        return session_not_found(id);
    }
    auto resumed = session->resume();
    impl_->refresh_statistics();
    return resumed;
}

auto upload_registry::cancel(const session_id& id) -> result<void> {
    auto session = impl_->find(id);
    if (!session) {
        return session_not_found(id);
    }
    if (auto cancelled = session->cancel(); !cancelled) {
        return cancelled;
    }

    impl_->remove(id);
    impl_->refresh_statistics();
    return {};
}

auto upload_registry::retry(const session_id& id) -> result<void> {
    auto session = impl_->find(id);
    if (!session) {
        return session_not_found(id);
    }
    auto retried = session->retry();
    impl_->refresh_statistics();
    return retried;
}

auto upload_registry::clear(const session_id& id) -> result<void> {
    auto session = impl_->find(id);
    if (!session) {
        return session_not_found(id);
    }

    auto current = session->status();
    if (current == upload_status::uploading || current == upload_status::verifying) {
        return unexpected{error{error_code::invalid_state,
                                "session " + id.to_string() + " is still running"}};
    }
    if (!is_terminal_status(current)) {
        if (auto cancelled = session->cancel(); !cancelled) {
            return cancelled;
        }
    }

    impl_->remove(id);
    impl_->refresh_statistics();
    return {};
}

auto upload_registry::clear_finished() -> std::size_t {
    std::vector<session_id> finished;
    for (const auto& session : impl_->all_sessions()) {
        if (session->status() == upload_status::completed) {
            finished.push_back(session->id());
        }
    }

    for (const auto& id : finished) {
        impl_->remove(id);
    }
    if (!finished.empty()) {
        impl_->refresh_statistics();
    }
    return finished.size();
}

auto upload_registry::status(const session_id& id) const -> result<upload_status> {
    auto session = impl_->find(id);
    if (!session) {
        return session_not_found(id);
    }
    return session->status();
}

auto upload_registry::snapshot(const session_id& id) const -> result<session_snapshot> {
    auto session = impl_->find(id);
    if (!session) {
        return session_not_found(id);
    }
    return session->snapshot();
}

auto upload_registry::progress(const session_id& id) const -> result<progress_report> {
    auto session = impl_->find(id);
    if (!session) {
        return session_not_found(id);
    }
    return session->progress();
}

auto upload_registry::wait(const session_id& id, std::chrono::milliseconds timeout) const
    -> result<upload_status> {
    auto session = impl_->find(id);
    if (!session) {
        return session_not_found(id);
    }
    if (!session->wait_for(timeout)) {
        return unexpected{error{error_code::connection_timeout,
                                "session " + id.to_string() + " did not settle in time"}};
    }
    return session->status();
}

auto upload_registry::statistics() const -> global_statistics {
    std::lock_guard<std::mutex> lock(impl_->stats_mutex);
    return impl_->stats;
}

auto upload_registry::session_ids() const -> std::vector<session_id> {
    std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
    std::vector<session_id> ids;
    ids.reserve(impl_->sessions.size());
    for (const auto& [id, session] : impl_->sessions) {
        ids.push_back(id);
    }
    return ids;
}

auto upload_registry::config() const -> const upload_config& {
    return impl_->config;
}

void upload_registry::on_progress(std::function<void(const progress_report&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->callbacks_mutex);
    impl_->progress_callback = std::move(callback);
}

void upload_registry::on_complete(std::function<void(const completion_report&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->callbacks_mutex);
    impl_->complete_callback = std::move(callback);
}

void upload_registry::on_error(std::function<void(const error_report&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->callbacks_mutex);
    impl_->error_callback = std::move(callback);
}

void upload_registry::on_statistics(std::function<void(const global_statistics&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->callbacks_mutex);
    impl_->statistics_callback = std::move(callback);
}

}  // namespace chunked_upload
