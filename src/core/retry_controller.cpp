/**
 * @file retry_controller.cpp
 * @brief Implementation of the per-chunk retry loop
 */

#include "chunked_upload/core/retry_controller.h"

#include "chunked_upload/core/logging.h"

#include <algorithm>
#include <cmath>

namespace chunked_upload {

retry_controller::retry_controller(retry_policy policy,
                                   std::shared_ptr<chunk_transport> transport)
    : policy_(policy), transport_(std::move(transport)) {}

auto retry_controller::backoff_delay(uint32_t retries) const -> std::chrono::milliseconds {
    if (retries == 0) {
        return std::chrono::milliseconds(0);
    }

    double delay = static_cast<double>(policy_.initial_backoff.count()) *
                   std::pow(policy_.backoff_multiplier, static_cast<double>(retries - 1));
    double cap = static_cast<double>(policy_.max_backoff.count());

    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, cap)));
}

auto retry_controller::ack_to_error(const chunk_ack& ack) -> error {
    std::string message = "endpoint rejected chunk";
    if (ack.detail) {
        message += ": " + *ack.detail;
    }
    return error{ack.checksum_mismatch ? error_code::chunk_checksum_mismatch
                                       : error_code::upload_rejected,
                 message};
}

auto retry_controller::execute(const chunk_request& request,
                               uint32_t retries_so_far,
                               const cancellation_token& token,
                               const failure_callback& on_failure,
                               const stop_predicate& should_stop) const -> retry_outcome {
    retry_outcome outcome;
    outcome.retries = std::min(retries_so_far, policy_.max_retries);

    upload_log_context log_ctx;
    log_ctx.session_id = request.session.to_string();
    log_ctx.filename = request.file_name;
    log_ctx.chunk_index = request.chunk_index;
    log_ctx.total_chunks = request.total_chunks;

    if (!transport_) {
        outcome.kind = retry_outcome_kind::exhausted;
        outcome.last_error = error{error_code::internal_error, "no chunk transport configured"};
        return outcome;
    }

    while (true) {
        if (token.is_cancelled()) {
            outcome.kind = retry_outcome_kind::cancelled;
            return outcome;
        }
        if (should_stop && should_stop()) {
            outcome.kind = retry_outcome_kind::interrupted;
            return outcome;
        }

        auto sent = transport_->send(request, token);

        error failure;
        if (sent) {
            if (sent.value().success) {
                outcome.kind = retry_outcome_kind::uploaded;
                outcome.ack = sent.value();
                return outcome;
            }
            failure = ack_to_error(sent.value());
        } else {
            failure = sent.error();
        }

        if (failure.code == error_code::transfer_cancelled || token.is_cancelled()) {
            outcome.kind = retry_outcome_kind::cancelled;
            outcome.last_error = failure;
            return outcome;
        }

        outcome.last_error = failure;
        log_ctx.retry_count = outcome.retries;
        log_ctx.error_message = failure.message;

        if (!is_retryable(failure.code) || outcome.retries >= policy_.max_retries) {
            CU_LOG_WARN_CTX(log_category::retry, "Chunk retry budget exhausted", log_ctx);
            outcome.kind = retry_outcome_kind::exhausted;
            return outcome;
        }

        ++outcome.retries;
        if (on_failure) {
            on_failure(outcome.retries, failure);
        }

        auto delay = backoff_delay(outcome.retries);
        log_ctx.retry_count = outcome.retries;
        CU_LOG_DEBUG_CTX(log_category::retry,
                         "Retrying chunk in " + std::to_string(delay.count()) + "ms", log_ctx);

        if (token.wait_for(delay)) {
            outcome.kind = retry_outcome_kind::cancelled;
            return outcome;
        }
    }
}

}  // namespace chunked_upload
