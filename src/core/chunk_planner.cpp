/**
 * @file chunk_planner.cpp
 * @brief Implementation of chunk planning
 */

#include "chunked_upload/core/chunk_planner.h"

#include "chunked_upload/adapters/thread_pool_adapter.h"
#include "chunked_upload/core/digest.h"
#include "chunked_upload/core/logging.h"

#include <algorithm>
#include <future>
#include <optional>
#include <span>
#include <vector>

namespace chunked_upload {

chunk_planner::chunk_planner(upload_config config,
                             std::shared_ptr<adapters::upload_thread_pool_interface> pool)
    : config_(std::move(config)), pool_(std::move(pool)) {}

auto chunk_planner::plan(const byte_source& source,
                         const std::optional<std::string>& file_name) const
    -> result<upload_plan> {
    auto valid = config_.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }

    const uint64_t file_size = source.size();
    upload_log_context log_ctx;
    log_ctx.filename = file_name.value_or(source.name());
    log_ctx.file_size = file_size;

    if (config_.max_file_size && file_size > *config_.max_file_size) {
        log_ctx.error_message = "limit " + std::to_string(*config_.max_file_size);
        CU_LOG_WARN_CTX(log_category::planner, "Rejecting file above size limit", log_ctx);
        return unexpected{error{error_code::file_too_large,
                                "file size " + std::to_string(file_size) +
                                    " exceeds limit " +
                                    std::to_string(*config_.max_file_size)}};
    }

    upload_plan plan;
    plan.file_name = log_ctx.filename;
    plan.file_size = file_size;
    plan.chunk_size = config_.chunk_size;

    const uint64_t chunk_count = config_.calculate_chunk_count(file_size);
    plan.chunks.resize(static_cast<std::size_t>(chunk_count));
    for (uint64_t i = 0; i < chunk_count; ++i) {
        auto& record = plan.chunks[static_cast<std::size_t>(i)];
        record.index = i;
        record.offset = i * config_.chunk_size;
        record.end = std::min<uint64_t>(record.offset + config_.chunk_size, file_size);
    }

    // At most one window of chunk bytes is buffered; buffers are reused per window.
    const std::size_t window = window_size();
    std::vector<std::vector<std::byte>> buffers(
        std::min<std::size_t>(window, plan.chunks.size()));

    sha256_stream whole_file;
    for (std::size_t first = 0; first < plan.chunks.size(); first += window) {
        const std::size_t count = std::min(window, plan.chunks.size() - first);
        auto records = std::span<chunk_record>(plan.chunks).subspan(first, count);

        for (std::size_t k = 0; k < count; ++k) {
            auto& buffer = buffers[k];
            buffer.resize(static_cast<std::size_t>(records[k].size()));

            auto read_result = source.read(records[k].offset, buffer);
            if (!read_result) {
                return unexpected{read_result.error()};
            }
            if (read_result.value() != buffer.size()) {
                return unexpected{error{error_code::file_read_error,
                                        "short read for chunk " +
                                            std::to_string(records[k].index)}};
            }

            auto update_result = whole_file.update(buffer);
            if (!update_result) {
                return unexpected{update_result.error()};
            }
        }

        auto digests = compute_digests(records, buffers);
        if (!digests) {
            return unexpected{digests.error()};
        }
    }

    auto file_digest = whole_file.finalize();
    if (!file_digest) {
        return unexpected{file_digest.error()};
    }
    plan.file_digest = std::move(file_digest.value());

    log_ctx.total_chunks = chunk_count;
    CU_LOG_DEBUG_CTX(log_category::planner, "Upload planned", log_ctx);

    return plan;
}

auto chunk_planner::plan(const std::filesystem::path& path) const -> result<upload_plan> {
    auto source = file_byte_source::open(path);
    if (!source) {
        return unexpected{source.error()};
    }
    return plan(*source.value());
}

auto chunk_planner::window_size() const -> std::size_t {
    if (!pool_ || !pool_->is_running() || pool_->is_worker_thread()) {
        return 1;
    }
    return std::max<std::size_t>(pool_->worker_count(), 1);
}

auto chunk_planner::compute_digests(std::span<chunk_record> records,
                                    const std::vector<std::vector<std::byte>>& buffers) const
    -> result<void> {
    if (records.size() < 2) {
        for (std::size_t k = 0; k < records.size(); ++k) {
            records[k].digest = digest::sha256(buffers[k]);
        }
        return {};
    }

    // Each task writes only its own record and reads only its own buffer.
    std::vector<std::future<void>> pending;
    pending.reserve(records.size());
    for (std::size_t k = 0; k < records.size(); ++k) {
        auto* target = &records[k];
        const auto* bytes = &buffers[k];
        pending.push_back(pool_->submit_to_stage(
            [target, bytes]() { target->digest = digest::sha256(*bytes); }, "digest"));
    }

    std::optional<error> failure;
    for (auto& f : pending) {
        try {
            f.get();
        } catch (const std::exception& e) {
            if (!failure) {
                failure = error{error_code::internal_error,
                                std::string("chunk digest task failed: ") + e.what()};
            }
        }
    }

    if (failure) {
        return unexpected{*failure};
    }
    return {};
}

}  // namespace chunked_upload
