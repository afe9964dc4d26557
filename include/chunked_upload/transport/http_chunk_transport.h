/**
 * @file http_chunk_transport.h
 * @brief HTTP multipart chunk transport on network_system's http_client
 */

#ifndef CHUNKED_UPLOAD_TRANSPORT_HTTP_CHUNK_TRANSPORT_H
#define CHUNKED_UPLOAD_TRANSPORT_HTTP_CHUNK_TRANSPORT_H

#include <chunked_upload/transport/chunk_transport.h>
#include <chunked_upload/config/feature_flags.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace chunked_upload {

namespace adapters {
class upload_thread_pool_interface;
}

/**
 * @brief HTTP transport configuration
 */
struct http_transport_config {
    /// Chunk endpoint, e.g. "http://localhost:8080/api/upload/chunk"
    std::string endpoint_url;

    /// Timeout of one request
    std::chrono::milliseconds timeout{30000};

    /// Extra headers added to every request
    std::map<std::string, std::string> headers;

    /// How often an in-flight request checks the cancellation token
    std::chrono::milliseconds cancel_poll_interval{25};

    /// Upper bound on requests running at once; further sends queue
    std::size_t max_parallel_requests{8};
};

/**
 * @brief Status and body of one completed HTTP exchange
 */
struct http_exchange {
    int status_code = 0;
    std::string body;
};

/**
 * @brief Runs blocking HTTP exchanges on a fixed number of threads
 *
 * At most max_parallel() exchanges run at once; the rest wait in the queue.
 * A queued exchange whose token fired before it started is never run.
 *
 * @note run() returns transfer_cancelled as soon as the token fires, but an
 *       exchange that has already started is not interrupted: it finishes in
 *       the background (bounded by the client timeout), so the endpoint may
 *       still receive that chunk after cancel. Destruction skips queued
 *       exchanges and waits for started ones.
 */
class request_executor {
public:
    explicit request_executor(std::size_t max_parallel);
    ~request_executor();

    request_executor(const request_executor&) = delete;
    auto operator=(const request_executor&) -> request_executor& = delete;

    /**
     * @brief Queue an exchange and wait for it, polling the token
     * @return Exchange result, transfer_cancelled, or transport_error if the
     *         exchange threw
     */
    [[nodiscard]] auto run(std::function<result<http_exchange>()> exchange,
                           const cancellation_token& token,
                           std::chrono::milliseconds poll_interval) -> result<http_exchange>;

    [[nodiscard]] auto max_parallel() const noexcept -> std::size_t { return max_parallel_; }

private:
    std::size_t max_parallel_;
    std::shared_ptr<std::atomic<bool>> stopping_;
    std::shared_ptr<adapters::upload_thread_pool_interface> pool_;
};

/**
 * @brief Encoded multipart/form-data request body
 */
struct multipart_body {
    std::string content_type;
    std::vector<uint8_t> bytes;
};

/**
 * @brief Encode a chunk request as multipart/form-data
 *
 * Fields: sessionId, chunkIndex, totalChunks, fileName, chunkDigest and the
 * binary part chunkBytes.
 */
[[nodiscard]] auto encode_chunk_request(const chunk_request& request,
                                        const std::string& boundary) -> multipart_body;

/**
 * @brief Interpret an endpoint response
 *
 * Non-2xx statuses become transport_error ("HTTP <status>: <detail>"), or
 * chunk_checksum_mismatch when the body reports a digest mismatch. A 2xx body
 * is parsed for {"success": bool, "error"|"message": string}.
 */
[[nodiscard]] auto parse_chunk_response(int status_code, std::string_view body)
    -> result<chunk_ack>;

/**
 * @brief chunk_transport that POSTs chunks to an HTTP endpoint
 *
 * Requires network_system; without it every send() reports not_available.
 * Requests run on a request_executor sized by max_parallel_requests. A request
 * that is still running when the token fires is abandoned and send() returns
 * transfer_cancelled immediately; see request_executor for what may still
 * reach the endpoint.
 */
class http_chunk_transport : public chunk_transport {
public:
    explicit http_chunk_transport(http_transport_config config);
    ~http_chunk_transport() override;

    http_chunk_transport(const http_chunk_transport&) = delete;
    auto operator=(const http_chunk_transport&) -> http_chunk_transport& = delete;

    [[nodiscard]] auto send(const chunk_request& request,
                            const cancellation_token& token) -> result<chunk_ack> override;

    [[nodiscard]] auto endpoint() const -> std::string override;

    /**
     * @brief Whether this build can actually send requests
     */
    [[nodiscard]] static constexpr auto is_available() noexcept -> bool {
#if CHUNKED_UPLOAD_HAS_HTTP_TRANSPORT
        return true;
#else
        return false;
#endif
    }

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_TRANSPORT_HTTP_CHUNK_TRANSPORT_H
