/**
 * @file upload_session.cpp
 * @brief Implementation of upload_session
 */

#include "chunked_upload/engine/upload_session.h"

#include "chunked_upload/adapters/thread_pool_adapter.h"
#include "chunked_upload/core/digest.h"
#include "chunked_upload/core/logging.h"

#include <algorithm>

namespace chunked_upload {

namespace {

auto make_log_context(const session_id& id, const std::string& file_name, uint64_t size)
    -> upload_log_context {
    upload_log_context ctx;
    ctx.session_id = id.to_string();
    ctx.filename = file_name;
    ctx.file_size = size;
    return ctx;
}

}  // namespace

auto upload_session::create(session_id id,
                            std::shared_ptr<byte_source> source,
                            upload_plan plan,
                            upload_config config,
                            std::shared_ptr<chunk_transport> transport,
                            std::shared_ptr<adapters::upload_thread_pool_interface> pool,
                            upload_callbacks callbacks) -> std::shared_ptr<upload_session> {
    return std::shared_ptr<upload_session>(new upload_session(
        id, std::move(source), std::move(plan), std::move(config), std::move(transport),
        std::move(pool), std::move(callbacks)));
}

upload_session::upload_session(session_id id,
                               std::shared_ptr<byte_source> source,
                               upload_plan plan,
                               upload_config config,
                               std::shared_ptr<chunk_transport> transport,
                               std::shared_ptr<adapters::upload_thread_pool_interface> pool,
                               upload_callbacks callbacks)
    : id_(id),
      file_name_(plan.file_name),
      file_size_(plan.file_size),
      source_(std::move(source)),
      plan_(std::move(plan)),
      config_(std::move(config)),
      pool_(std::move(pool)),
      callbacks_(std::move(callbacks)),
      retry_(config_.retry, std::move(transport)),
      limiter_(config_.max_concurrent),
      progress_(file_size_) {}

upload_session::~upload_session() {
    token_.cancel();
    limiter_.shutdown();

    if (dispatcher_.joinable()) {
        if (dispatcher_.get_id() == std::this_thread::get_id()) {
            dispatcher_.detach();
        } else {
            dispatcher_.join();
        }
    }
}

// ============================================================================
// Control operations
// ============================================================================

void upload_session::start() {
    bool verify_now = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_.restart_clock();

        auto ctx = make_log_context(id_, file_name_, file_size_);
        ctx.total_chunks = plan_.total_chunks();
        CU_LOG_INFO_CTX(log_category::session, "Upload session started", ctx);

        auto transition = machine_.evaluate(summary_locked());
        if (transition.to == upload_status::verifying) {
            ++running_tasks_;
            verify_now = true;
        } else {
            ensure_dispatcher_locked();
        }
    }

    if (verify_now) {
        run_verification();
        finish_task();
    }
}

auto upload_session::pause() -> result<void> {
    status_transition transition{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto paused = machine_.pause();
        if (!paused) {
            return unexpected{paused.error()};
        }
        transition = paused.value();
    }

    if (transition.changed()) {
        CU_LOG_INFO(log_category::session, "Upload session paused: " + id_.to_string());
        emit_progress();
    }
    return {};
}

auto upload_session::resume() -> result<void> {
    status_transition transition{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto resumed = machine_.resume();
        if (!resumed) {
            return unexpected{resumed.error()};
        }
        transition = resumed.value();
        ensure_dispatcher_locked();
    }

    if (transition.changed()) {
        CU_LOG_INFO(log_category::session, "Upload session resumed: " + id_.to_string());
        emit_progress();
    }
    return {};
}

auto upload_session::retry() -> result<void> {
    std::size_t reset_count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto retried = machine_.retry();
        if (!retried) {
            return unexpected{retried.error()};
        }

        for (auto& chunk : plan_.chunks) {
            if (chunk.state == chunk_state::failed) {
                chunk.state = chunk_state::pending;
                chunk.retries = 0;
                ++reset_count;
            }
        }
        last_error_.reset();
        ensure_dispatcher_locked();
    }

    CU_LOG_INFO(log_category::session,
                "Retrying " + std::to_string(reset_count) + " failed chunk(s) of session " +
                    id_.to_string());
    emit_progress();
    return {};
}

auto upload_session::cancel() -> result<void> {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cancelled = machine_.cancel();
        if (!cancelled) {
            return unexpected{cancelled.error()};
        }
    }

    token_.cancel();
    limiter_.shutdown();

    // Wait out any callback that is already running.
    { std::lock_guard<std::recursive_mutex> barrier(callback_mutex_); }

    settled_cv_.notify_all();
    CU_LOG_INFO(log_category::session, "Upload session cancelled: " + id_.to_string());
    return {};
}

auto upload_session::wait_for(std::chrono::milliseconds timeout) const -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return settled_cv_.wait_for(lock, timeout, [this] { return settled_locked(); });
}

// ============================================================================
// Accessors
// ============================================================================

auto upload_session::status() const -> upload_status {
    std::lock_guard<std::mutex> lock(mutex_);
    return machine_.status();
}

auto upload_session::uploaded_bytes() const -> uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_.uploaded_bytes();
}

auto upload_session::progress() const -> progress_report {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_locked();
}

auto upload_session::snapshot() const -> session_snapshot {
    std::lock_guard<std::mutex> lock(mutex_);

    session_snapshot snap;
    snap.id = id_;
    snap.file_name = file_name_;
    snap.status = machine_.status();
    snap.file_size = file_size_;
    snap.uploaded_bytes = progress_.uploaded_bytes();
    snap.planned_digest = plan_.file_digest;
    snap.last_error = last_error_;
    snap.chunks.reserve(plan_.chunks.size());
    for (const auto& chunk : plan_.chunks) {
        snap.buffered_bytes += chunk.payload.size();
        snap.chunks.push_back(chunk_snapshot{chunk.index, chunk.offset, chunk.size(),
                                             chunk.digest, chunk.state, chunk.retries});
    }
    return snap;
}

// ============================================================================
// Dispatch
// ============================================================================

auto upload_session::has_dispatchable_chunk_locked() const -> bool {
    if (token_.is_cancelled() || machine_.status() != upload_status::uploading) {
        return false;
    }
    return std::any_of(plan_.chunks.begin(), plan_.chunks.end(), [](const chunk_record& c) {
        return c.state == chunk_state::pending;
    });
}

void upload_session::ensure_dispatcher_locked() {
    if (dispatching_ || !has_dispatchable_chunk_locked()) {
        return;
    }

    // A previous dispatcher has already cleared dispatching_ and is exiting.
    if (dispatcher_.joinable()) {
        if (dispatcher_.get_id() == std::this_thread::get_id()) {
            dispatcher_.detach();
        } else {
            dispatcher_.join();
        }
    }

    dispatching_ = true;
    dispatcher_ = std::thread([self = shared_from_this()]() { self->dispatch_loop(); });
}

void upload_session::dispatch_loop() {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!has_dispatchable_chunk_locked()) {
                dispatching_ = false;
                settled_cv_.notify_all();
                return;
            }
        }

        auto acquired = limiter_.acquire(token_);

        uint64_t index = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!acquired || !has_dispatchable_chunk_locked()) {
                if (acquired) {
                    limiter_.release();
                }
                dispatching_ = false;
                settled_cv_.notify_all();
                return;
            }

            auto next = std::find_if(plan_.chunks.begin(), plan_.chunks.end(),
                                     [](const chunk_record& c) {
                                         return c.state == chunk_state::pending;
                                     });
            next->state = chunk_state::in_flight;
            index = next->index;
            ++running_tasks_;
        }

        CU_LOG_TRACE(log_category::session,
                     "Dispatching chunk " + std::to_string(index) + " of " + id_.to_string());

        if (!pool_ || !pool_->is_running()) {
            limiter_.release();

            error_report report;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto& chunk = plan_.chunks[index];
                chunk.state = chunk_state::failed;
                last_error_ = error{error_code::internal_error, "thread pool is not running"};
                machine_.evaluate(summary_locked());

                report.id = id_;
                report.file_name = file_name_;
                report.code = last_error_->code;
                report.message = last_error_->message;
                report.chunk_index = index;
                report.retry_count = chunk.retries;
            }
            CU_LOG_ERROR(log_category::session, "Cannot dispatch chunk: thread pool is not running");
            emit_error(report);
            emit_progress();
            finish_task();
            continue;
        }

        pool_->submit_to_stage([self = shared_from_this(), index]() { self->run_chunk(index); },
                               "chunk_transfer");
    }
}

// ============================================================================
// Chunk tasks
// ============================================================================

auto upload_session::load_chunk(uint64_t offset, uint64_t length,
                                const std::string& planned_digest) const
    -> result<std::vector<std::byte>> {
    std::vector<std::byte> bytes(static_cast<std::size_t>(length));

    auto read_result = source_->read(offset, bytes);
    if (!read_result) {
        return unexpected{read_result.error()};
    }
    if (read_result.value() != bytes.size()) {
        return unexpected{error{error_code::file_read_error,
                                "short read at offset " + std::to_string(offset)}};
    }

    if (!digest::equals(digest::sha256(bytes), planned_digest)) {
        return unexpected{error{error_code::file_hash_mismatch,
                                "source changed after planning at offset " +
                                    std::to_string(offset)}};
    }
    return bytes;
}

void upload_session::abandon_chunk(uint64_t index, const error& cause) {
    limiter_.release();

    std::optional<error_report> report;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        plan_.chunks[index].state = chunk_state::pending;

        // Only the first chunk to notice reports; later ones just step back.
        if (!machine_.integrity_failed() && machine_.fail_integrity()) {
            last_error_ = cause;
            report = error_report{id_, file_name_, cause.code, cause.message,
                                  std::nullopt, std::nullopt};
        }
    }

    if (report) {
        auto ctx = make_log_context(id_, file_name_, file_size_);
        ctx.chunk_index = index;
        ctx.error_message = cause.message;
        CU_LOG_ERROR_CTX(log_category::session, "Source no longer matches the plan", ctx);
        emit_error(*report);
        emit_progress();
    }
    finish_task();
}

void upload_session::run_chunk(uint64_t index) {
    uint64_t offset = 0;
    uint64_t length = 0;
    std::string planned_digest;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto& chunk = plan_.chunks[index];
        offset = chunk.offset;
        length = chunk.size();
        planned_digest = chunk.digest;
    }

    auto loaded = load_chunk(offset, length, planned_digest);
    if (!loaded) {
        abandon_chunk(index, loaded.error());
        return;
    }

    chunk_request request;
    uint32_t retries_so_far = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& chunk = plan_.chunks[index];
        chunk.payload = std::move(loaded.value());
        request.session = id_;
        request.chunk_index = chunk.index;
        request.total_chunks = plan_.total_chunks();
        request.file_name = file_name_;
        // Only this task touches the payload until it is released below.
        request.chunk_bytes = std::span<const std::byte>(chunk.payload);
        request.chunk_digest = chunk.digest;
        retries_so_far = chunk.retries;
    }

    auto on_failure = [this, index](uint32_t retries, const error& err) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            plan_.chunks[index].retries = retries;
        }
        CU_LOG_DEBUG(log_category::session,
                     "Chunk " + std::to_string(index) + " attempt failed (" +
                         std::to_string(retries) + "): " + err.message);
        emit_progress();
    };

    auto should_stop = [this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        return machine_.pause_requested();
    };

    auto outcome = retry_.execute(request, retries_so_far, token_, on_failure, should_stop);

    limiter_.release();

    bool verify_now = false;
    std::optional<error_report> failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& chunk = plan_.chunks[index];
        chunk.retries = outcome.retries;
        std::vector<std::byte>().swap(chunk.payload);

        switch (outcome.kind) {
            case retry_outcome_kind::uploaded:
                chunk.state = chunk_state::uploaded;
                progress_.record_uploaded(chunk.size());
                break;
            case retry_outcome_kind::exhausted:
                chunk.state = chunk_state::failed;
                last_error_ = outcome.last_error.value_or(
                    error{error_code::transport_error, "chunk upload failed"});
                failure = error_report{id_, file_name_, last_error_->code,
                                       last_error_->message, chunk.index, chunk.retries};
                break;
            case retry_outcome_kind::cancelled:
            case retry_outcome_kind::interrupted:
                chunk.state = chunk_state::pending;
                break;
        }

        auto transition = machine_.evaluate(summary_locked());
        if (transition.changed() && transition.to == upload_status::verifying) {
            verify_now = true;
        } else {
            ensure_dispatcher_locked();
        }
    }

    if (outcome.kind == retry_outcome_kind::cancelled) {
        finish_task();
        return;
    }

    if (failure) {
        auto ctx = make_log_context(id_, file_name_, file_size_);
        ctx.chunk_index = failure->chunk_index;
        ctx.retry_count = failure->retry_count;
        ctx.error_message = failure->message;
        CU_LOG_ERROR_CTX(log_category::session, "Chunk permanently failed", ctx);
        emit_error(*failure);
    }

    emit_progress();

    if (verify_now) {
        run_verification();
    }
    finish_task();
}

void upload_session::run_verification() {
    if (token_.is_cancelled()) {
        return;
    }

    std::optional<error> failure;
    std::string computed = plan_.file_digest;

    if (config_.verification == verification_mode::reread_source) {
        auto recomputed = digest::sha256_source(*source_);
        if (!recomputed) {
            failure = recomputed.error();
        } else {
            computed = recomputed.value();
        }
    }

    if (!failure && !digest::equals(computed, plan_.file_digest)) {
        failure = error{error_code::file_hash_mismatch,
                        "whole-file digest mismatch (expected " + plan_.file_digest +
                            ", computed " + computed + ")"};
    }

    std::optional<completion_report> done;
    std::optional<error_report> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (machine_.status() != upload_status::verifying) {
            return;
        }

        auto ctx = make_log_context(id_, file_name_, file_size_);
        if (failure) {
            auto moved = machine_.fail_integrity();
            if (!moved) {
                return;
            }
            last_error_ = failure;
            failed = error_report{id_, file_name_, failure->code, failure->message,
                                  std::nullopt, std::nullopt};
            ctx.error_message = failure->message;
            CU_LOG_ERROR_CTX(log_category::session, "Whole-file verification failed", ctx);
        } else {
            auto moved = machine_.complete();
            if (!moved) {
                return;
            }
            auto elapsed = progress_.snapshot().elapsed;
            done = completion_report{id_, file_name_, file_size_, plan_.total_chunks(),
                                     computed, static_cast<uint64_t>(elapsed.count())};
            ctx.duration_ms = done->duration_ms;
            ctx.total_chunks = done->chunk_count;
            CU_LOG_INFO_CTX(log_category::session, "Upload session completed", ctx);
        }
    }

    if (failed) {
        emit_error(*failed);
    }
    emit_progress();
    if (done) {
        emit_complete(*done);
    }
}

void upload_session::finish_task() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_tasks_ > 0) {
            --running_tasks_;
        }
    }
    settled_cv_.notify_all();
}

// ============================================================================
// Helpers
// ============================================================================

auto upload_session::summary_locked() const -> chunk_summary {
    chunk_summary summary;
    summary.total = plan_.chunks.size();
    for (const auto& chunk : plan_.chunks) {
        switch (chunk.state) {
            case chunk_state::uploaded: ++summary.uploaded; break;
            case chunk_state::failed: ++summary.failed; break;
            case chunk_state::in_flight: ++summary.in_flight; break;
            case chunk_state::pending: break;
        }
    }
    return summary;
}

auto upload_session::progress_locked() const -> progress_report {
    auto snap = progress_.snapshot();
    auto summary = summary_locked();

    progress_report report;
    report.id = id_;
    report.file_name = file_name_;
    report.status = machine_.status();
    report.uploaded_bytes = snap.uploaded_bytes;
    report.total_bytes = snap.total_bytes;
    report.percent = snap.percent;
    report.bytes_per_second = snap.bytes_per_second;
    report.eta = snap.eta;
    report.uploaded_chunks = summary.uploaded;
    report.total_chunks = summary.total;
    report.failed_chunks = summary.failed;
    for (const auto& chunk : plan_.chunks) {
        report.total_retries += chunk.retries;
    }
    return report;
}

auto upload_session::settled_locked() const -> bool {
    if (dispatching_ || running_tasks_ > 0) {
        return false;
    }
    auto status = machine_.status();
    return status != upload_status::uploading && status != upload_status::verifying;
}

void upload_session::emit_progress() {
    std::lock_guard<std::recursive_mutex> guard(callback_mutex_);
    if (token_.is_cancelled() || !callbacks_.on_progress) {
        return;
    }
    // Built under the callback mutex so reports reach the sink in order.
    auto report = progress();

    auto ctx = make_log_context(id_, file_name_, file_size_);
    ctx.bytes_uploaded = report.uploaded_bytes;
    ctx.progress_percent = report.percent;
    ctx.rate_mbps = report.bytes_per_second * 8.0 / 1'000'000.0;
    if (report.eta) {
        ctx.eta_seconds = static_cast<double>(report.eta->count()) / 1000.0;
    }
    CU_LOG_TRACE_CTX(log_category::progress, "Progress", ctx);

    callbacks_.on_progress(report);
}

void upload_session::emit_error(const error_report& report) {
    std::lock_guard<std::recursive_mutex> guard(callback_mutex_);
    if (token_.is_cancelled() || !callbacks_.on_error) {
        return;
    }
    callbacks_.on_error(report);
}

void upload_session::emit_complete(const completion_report& report) {
    std::lock_guard<std::recursive_mutex> guard(callback_mutex_);
    if (token_.is_cancelled() || !callbacks_.on_complete) {
        return;
    }
    callbacks_.on_complete(report);
}

}  // namespace chunked_upload
