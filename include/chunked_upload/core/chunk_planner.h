/**
 * @file chunk_planner.h
 * @brief Splits a source into fixed-size chunks with per-chunk digests
 */

#ifndef CHUNKED_UPLOAD_CORE_CHUNK_PLANNER_H
#define CHUNKED_UPLOAD_CORE_CHUNK_PLANNER_H

#include <chunked_upload/core/byte_source.h>
#include <chunked_upload/core/chunk_types.h>
#include <chunked_upload/core/types.h>
#include <chunked_upload/core/upload_config.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chunked_upload {

namespace adapters {
class upload_thread_pool_interface;
}

/**
 * @brief Produces upload plans
 *
 * For chunk i the planner reads [i*chunk_size, min((i+1)*chunk_size, size))
 * and computes its SHA-256. The whole-file digest is accumulated in the same
 * pass. Chunk bytes are not kept: the returned records carry no payload, and
 * at most one window of chunks is buffered at a time.
 *
 * With a thread pool the digests of a window (one chunk per worker) run in
 * parallel. When plan() is itself called from a task of that pool, digests
 * are computed on the calling thread instead, so a worker never waits on
 * work queued behind it. The returned chunks are always ordered by index.
 */
class chunk_planner {
public:
    explicit chunk_planner(upload_config config,
                           std::shared_ptr<adapters::upload_thread_pool_interface> pool = nullptr);

    /**
     * @brief Plan an upload from a byte source
     * @param source Bytes to upload
     * @param file_name Name override (defaults to source.name())
     * @return Plan with all chunks pending, or file_too_large / read errors
     */
    [[nodiscard]] auto plan(const byte_source& source,
                            const std::optional<std::string>& file_name = std::nullopt) const
        -> result<upload_plan>;

    /**
     * @brief Plan an upload from a file on disk
     */
    [[nodiscard]] auto plan(const std::filesystem::path& path) const -> result<upload_plan>;

    [[nodiscard]] auto config() const -> const upload_config& { return config_; }

private:
    [[nodiscard]] auto window_size() const -> std::size_t;

    [[nodiscard]] auto compute_digests(std::span<chunk_record> records,
                                       const std::vector<std::vector<std::byte>>& buffers) const
        -> result<void>;

    upload_config config_;
    std::shared_ptr<adapters::upload_thread_pool_interface> pool_;
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_CORE_CHUNK_PLANNER_H
