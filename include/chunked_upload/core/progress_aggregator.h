/**
 * @file progress_aggregator.h
 * @brief Bytes, throughput and ETA for one upload session
 */

#ifndef CHUNKED_UPLOAD_CORE_PROGRESS_AGGREGATOR_H
#define CHUNKED_UPLOAD_CORE_PROGRESS_AGGREGATOR_H

#include <chrono>
#include <cstdint>
#include <optional>

namespace chunked_upload {

using duration = std::chrono::milliseconds;
using time_point = std::chrono::steady_clock::time_point;

/**
 * @brief Event-driven progress accounting
 *
 * Only acknowledged chunks count towards uploaded bytes. The owning session
 * serializes access; the class itself is not thread-safe.
 *
 * @code
 * progress_aggregator progress(file_size);
 * progress.record_uploaded(chunk.size());
 * auto snap = progress.snapshot();
 * if (snap.eta) { ... }
 * @endcode
 */
class progress_aggregator {
public:
    /**
     * @brief Point-in-time view of the counters
     */
    struct snapshot_data {
        uint64_t uploaded_bytes = 0;
        uint64_t total_bytes = 0;
        double percent = 0.0;                ///< 0..100
        duration elapsed{0};
        double bytes_per_second = 0.0;
        std::optional<duration> eta;         ///< Absent while speed is zero
    };

    explicit progress_aggregator(uint64_t total_bytes,
                                 time_point start = std::chrono::steady_clock::now());

    /**
     * @brief Count an acknowledged chunk
     *
     * Uploaded bytes never exceed the total.
     */
    void record_uploaded(uint64_t bytes);

    /**
     * @brief Restart the clock without touching the counters
     */
    void restart_clock(time_point start = std::chrono::steady_clock::now());

    [[nodiscard]] auto uploaded_bytes() const noexcept -> uint64_t { return uploaded_bytes_; }
    [[nodiscard]] auto total_bytes() const noexcept -> uint64_t { return total_bytes_; }
    [[nodiscard]] auto start_time() const noexcept -> time_point { return start_; }
    [[nodiscard]] auto is_complete() const noexcept -> bool {
        return uploaded_bytes_ >= total_bytes_;
    }

    [[nodiscard]] auto snapshot() const -> snapshot_data;
    [[nodiscard]] auto snapshot(time_point now) const -> snapshot_data;

private:
    uint64_t total_bytes_;
    uint64_t uploaded_bytes_{0};
    time_point start_;
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_CORE_PROGRESS_AGGREGATOR_H
