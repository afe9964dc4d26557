/**
 * @file chunk_transport.h
 * @brief Abstract interface for delivering one chunk to the endpoint
 */

#ifndef CHUNKED_UPLOAD_TRANSPORT_CHUNK_TRANSPORT_H
#define CHUNKED_UPLOAD_TRANSPORT_CHUNK_TRANSPORT_H

#include <chunked_upload/core/cancellation_token.h>
#include <chunked_upload/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace chunked_upload {

/**
 * @brief Logical fields of one chunk request
 *
 * The bytes are borrowed from the session's chunk record and stay valid for
 * the duration of send().
 */
struct chunk_request {
    session_id session;
    uint64_t chunk_index = 0;
    uint64_t total_chunks = 0;
    std::string file_name;
    std::span<const std::byte> chunk_bytes;
    std::string chunk_digest;
};

/**
 * @brief Endpoint acknowledgement of a delivered chunk
 */
struct chunk_ack {
    /// Endpoint-reported success flag
    bool success = false;

    /// HTTP status (or transport-specific status code)
    int status_code = 0;

    /// Endpoint-supplied error detail when success is false
    std::optional<std::string> detail;

    /// Endpoint reported that the received bytes did not match chunkDigest
    bool checksum_mismatch = false;
};

/**
 * @brief Delivers one chunk and reports the outcome
 *
 * Implementations must return error_code::transfer_cancelled promptly once
 * the token fires, and error_code::transport_error for network faults and
 * non-success responses.
 */
class chunk_transport {
public:
    virtual ~chunk_transport() = default;

    /**
     * @brief Send a chunk
     * @param request Chunk fields
     * @param token Session cancellation token
     * @return Acknowledgement, or transport_error / transfer_cancelled
     */
    [[nodiscard]] virtual auto send(const chunk_request& request,
                                    const cancellation_token& token) -> result<chunk_ack> = 0;

    /**
     * @brief Human-readable endpoint description for logs
     */
    [[nodiscard]] virtual auto endpoint() const -> std::string = 0;
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_TRANSPORT_CHUNK_TRANSPORT_H
