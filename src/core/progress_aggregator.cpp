/**
 * @file progress_aggregator.cpp
 * @brief Implementation of progress_aggregator
 */

#include "chunked_upload/core/progress_aggregator.h"

#include <algorithm>

namespace chunked_upload {

progress_aggregator::progress_aggregator(uint64_t total_bytes, time_point start)
    : total_bytes_(total_bytes), start_(start) {}

void progress_aggregator::record_uploaded(uint64_t bytes) {
    uploaded_bytes_ = std::min(total_bytes_, uploaded_bytes_ + bytes);
}

void progress_aggregator::restart_clock(time_point start) {
    start_ = start;
}

auto progress_aggregator::snapshot() const -> snapshot_data {
    return snapshot(std::chrono::steady_clock::now());
}

auto progress_aggregator::snapshot(time_point now) const -> snapshot_data {
    snapshot_data snap;
    snap.uploaded_bytes = uploaded_bytes_;
    snap.total_bytes = total_bytes_;

    if (total_bytes_ == 0) {
        snap.percent = 100.0;
    } else {
        snap.percent = static_cast<double>(uploaded_bytes_) /
                       static_cast<double>(total_bytes_) * 100.0;
    }

    snap.elapsed = std::max(duration{0}, std::chrono::duration_cast<duration>(now - start_));

    auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(now - start_);
    if (elapsed_us.count() > 0) {
        snap.bytes_per_second = static_cast<double>(uploaded_bytes_) /
                                (static_cast<double>(elapsed_us.count()) / 1'000'000.0);
    }

    if (snap.bytes_per_second > 0.0) {
        auto remaining = static_cast<double>(total_bytes_ - uploaded_bytes_);
        snap.eta = duration{static_cast<int64_t>(remaining / snap.bytes_per_second * 1000.0)};
    }

    return snap;
}

}  // namespace chunked_upload
