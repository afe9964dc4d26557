/**
 * @file upload_state_machine.cpp
 * @brief Implementation of the session state machine
 */

#include "chunked_upload/core/upload_state_machine.h"

#include <string>

namespace chunked_upload {

namespace {

auto invalid_transition(upload_status from, std::string_view operation) -> unexpected {
    return unexpected{error{error_code::invalid_state,
                            std::string("cannot ") + std::string(operation) + " while " +
                                std::string(to_string(from))}};
}

}  // namespace

auto upload_state_machine::is_valid_transition(upload_status from, upload_status to) -> bool {
    if (from == to) {
        return true;
    }

    switch (from) {
        case upload_status::uploading:
            return to == upload_status::paused || to == upload_status::verifying ||
                   to == upload_status::error || to == upload_status::cancelled;
        case upload_status::paused:
            return to == upload_status::uploading || to == upload_status::verifying ||
                   to == upload_status::error || to == upload_status::cancelled;
        case upload_status::verifying:
            return to == upload_status::completed || to == upload_status::error ||
                   to == upload_status::cancelled;
        case upload_status::error:
            return to == upload_status::uploading || to == upload_status::cancelled;
        case upload_status::completed:
        case upload_status::cancelled:
        default:
            return false;
    }
}

auto upload_state_machine::move_to(upload_status next) -> status_transition {
    status_transition transition{status_, next};
    status_ = next;
    return transition;
}

auto upload_state_machine::evaluate(const chunk_summary& summary) -> status_transition {
    if (is_terminal_status(status_) || status_ == upload_status::verifying ||
        integrity_failed_) {
        return {status_, status_};
    }

    if (summary.failed > 0) {
        return move_to(upload_status::error);
    }
    if (status_ == upload_status::error) {
        // Stays in error until an explicit retry.
        return {status_, status_};
    }
    if (summary.uploaded == summary.total) {
        return move_to(upload_status::verifying);
    }
    if (pause_requested_) {
        return move_to(upload_status::paused);
    }
    return move_to(upload_status::uploading);
}

auto upload_state_machine::pause() -> result<status_transition> {
    if (status_ == upload_status::paused) {
        return status_transition{status_, status_};
    }
    if (status_ != upload_status::uploading) {
        return invalid_transition(status_, "pause");
    }
    pause_requested_ = true;
    return move_to(upload_status::paused);
}

auto upload_state_machine::resume() -> result<status_transition> {
    if (status_ == upload_status::uploading) {
        pause_requested_ = false;
        return status_transition{status_, status_};
    }
    if (status_ != upload_status::paused) {
        return invalid_transition(status_, "resume");
    }
    pause_requested_ = false;
    return move_to(upload_status::uploading);
}

auto upload_state_machine::retry() -> result<status_transition> {
    if (status_ != upload_status::error) {
        return invalid_transition(status_, "retry");
    }
    if (integrity_failed_) {
        return unexpected{error{error_code::file_hash_mismatch,
                                "source content no longer matches the plan; the file must be submitted again"}};
    }
    pause_requested_ = false;
    return move_to(upload_status::uploading);
}

auto upload_state_machine::cancel() -> result<status_transition> {
    if (is_terminal_status(status_)) {
        return invalid_transition(status_, "cancel");
    }
    return move_to(upload_status::cancelled);
}

auto upload_state_machine::complete() -> result<status_transition> {
    if (status_ != upload_status::verifying) {
        return invalid_transition(status_, "complete");
    }
    return move_to(upload_status::completed);
}

auto upload_state_machine::fail_integrity() -> result<status_transition> {
    if (is_terminal_status(status_)) {
        return invalid_transition(status_, "fail integrity");
    }
    integrity_failed_ = true;
    pause_requested_ = false;
    return move_to(upload_status::error);
}

}  // namespace chunked_upload
