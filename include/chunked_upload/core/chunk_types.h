/**
 * @file chunk_types.h
 * @brief Chunk records and upload plans
 */

#ifndef CHUNKED_UPLOAD_CORE_CHUNK_TYPES_H
#define CHUNKED_UPLOAD_CORE_CHUNK_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chunked_upload {

/**
 * @brief Lifecycle of a single chunk
 */
enum class chunk_state : uint8_t {
    pending,    ///< Waiting for dispatch
    in_flight,  ///< Holding a permit, being transferred or backing off
    uploaded,   ///< Acknowledged by the endpoint
    failed,     ///< Retry budget exhausted
};

[[nodiscard]] constexpr auto to_string(chunk_state state) -> std::string_view {
    switch (state) {
        case chunk_state::pending: return "pending";
        case chunk_state::in_flight: return "in_flight";
        case chunk_state::uploaded: return "uploaded";
        case chunk_state::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief One contiguous slice of the file
 *
 * Covers [offset, end). The payload is empty except while the chunk is in
 * flight: it is read from the source just before sending and released once
 * the attempt sequence ends.
 */
struct chunk_record {
    uint64_t index = 0;
    uint64_t offset = 0;
    uint64_t end = 0;
    std::vector<std::byte> payload;
    std::string digest;
    chunk_state state = chunk_state::pending;
    uint32_t retries = 0;

    [[nodiscard]] auto size() const noexcept -> uint64_t { return end - offset; }
    [[nodiscard]] auto is_uploaded() const noexcept -> bool {
        return state == chunk_state::uploaded;
    }
};

/**
 * @brief Output of the chunk planner
 */
struct upload_plan {
    std::string file_name;
    uint64_t file_size = 0;
    std::size_t chunk_size = 0;
    std::vector<chunk_record> chunks;

    /// Whole-file SHA-256 accumulated in index order during planning
    std::string file_digest;

    [[nodiscard]] auto total_chunks() const noexcept -> uint64_t { return chunks.size(); }
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_CORE_CHUNK_TYPES_H
