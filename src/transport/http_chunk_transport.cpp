/**
 * @file http_chunk_transport.cpp
 * @brief Implementation of the HTTP multipart chunk transport
 */

#include "chunked_upload/transport/http_chunk_transport.h"

#include "chunked_upload/adapters/thread_pool_adapter.h"
#include "chunked_upload/core/logging.h"

#include <algorithm>
#include <cctype>
#include <future>
#include <optional>
#include <random>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace chunked_upload {

namespace {

void append(std::vector<uint8_t>& out, std::string_view text) {
    out.insert(out.end(), text.begin(), text.end());
}

void append_field(std::vector<uint8_t>& out, const std::string& boundary,
                  std::string_view name, std::string_view value) {
    append(out, "--" + boundary + "\r\n");
    append(out, "Content-Disposition: form-data; name=\"");
    append(out, name);
    append(out, "\"\r\n\r\n");
    append(out, value);
    append(out, "\r\n");
}

[[maybe_unused]] auto generate_boundary() -> std::string {
    static constexpr char alphabet[] =
        "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<std::size_t> dis(0, sizeof(alphabet) - 2);

    std::string boundary = "----chunked-upload-";
    for (int i = 0; i < 24; ++i) {
        boundary += alphabet[dis(gen)];
    }
    return boundary;
}

/**
 * @brief Position just past `"key"\s*:\s*`, or npos
 */
auto find_json_value(std::string_view body, std::string_view key) -> std::size_t {
    std::string quoted = "\"" + std::string(key) + "\"";
    auto pos = body.find(quoted);
    while (pos != std::string_view::npos) {
        auto cursor = pos + quoted.size();
        while (cursor < body.size() && std::isspace(static_cast<unsigned char>(body[cursor]))) {
            ++cursor;
        }
        if (cursor < body.size() && body[cursor] == ':') {
            ++cursor;
            while (cursor < body.size() &&
                   std::isspace(static_cast<unsigned char>(body[cursor]))) {
                ++cursor;
            }
            return cursor;
        }
        pos = body.find(quoted, pos + 1);
    }
    return std::string_view::npos;
}

auto find_json_bool(std::string_view body, std::string_view key) -> std::optional<bool> {
    auto pos = find_json_value(body, key);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    if (body.substr(pos, 4) == "true") return true;
    if (body.substr(pos, 5) == "false") return false;
    return std::nullopt;
}

auto find_json_string(std::string_view body, std::string_view key)
    -> std::optional<std::string> {
    auto pos = find_json_value(body, key);
    if (pos == std::string_view::npos || pos >= body.size() || body[pos] != '"') {
        return std::nullopt;
    }

    std::string value;
    for (auto i = pos + 1; i < body.size(); ++i) {
        char c = body[i];
        if (c == '\\' && i + 1 < body.size()) {
            value += body[++i];
        } else if (c == '"') {
            return value;
        } else {
            value += c;
        }
    }
    return std::nullopt;
}

auto mentions_checksum(const std::optional<std::string>& detail) -> bool {
    if (!detail) {
        return false;
    }
    std::string lowered = *detail;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("checksum") != std::string::npos ||
           lowered.find("digest") != std::string::npos;
}

auto error_detail(std::string_view body) -> std::optional<std::string> {
    if (auto detail = find_json_string(body, "error")) {
        return detail;
    }
    return find_json_string(body, "message");
}

}  // namespace

auto encode_chunk_request(const chunk_request& request, const std::string& boundary)
    -> multipart_body {
    multipart_body body;
    body.content_type = "multipart/form-data; boundary=" + boundary;
    body.bytes.reserve(request.chunk_bytes.size() + 1024);

    append_field(body.bytes, boundary, "sessionId", request.session.to_string());
    append_field(body.bytes, boundary, "chunkIndex", std::to_string(request.chunk_index));
    append_field(body.bytes, boundary, "totalChunks", std::to_string(request.total_chunks));
    append_field(body.bytes, boundary, "fileName", request.file_name);
    append_field(body.bytes, boundary, "chunkDigest", request.chunk_digest);

    append(body.bytes, "--" + boundary + "\r\n");
    append(body.bytes, "Content-Disposition: form-data; name=\"chunkBytes\"; filename=\"");
    append(body.bytes, request.file_name);
    append(body.bytes, ".part");
    append(body.bytes, std::to_string(request.chunk_index));
    append(body.bytes, "\"\r\nContent-Type: application/octet-stream\r\n\r\n");
    auto* raw = reinterpret_cast<const uint8_t*>(request.chunk_bytes.data());
    body.bytes.insert(body.bytes.end(), raw, raw + request.chunk_bytes.size());
    append(body.bytes, "\r\n--" + boundary + "--\r\n");

    return body;
}

auto parse_chunk_response(int status_code, std::string_view body) -> result<chunk_ack> {
    auto detail = error_detail(body);
    bool checksum_mismatch = find_json_bool(body, "checksumMismatch").value_or(false) ||
                             mentions_checksum(detail);

    if (status_code < 200 || status_code >= 300) {
        std::string message = "HTTP " + std::to_string(status_code);
        if (detail) {
            message += ": " + *detail;
        } else if (!body.empty()) {
            message += ": " + std::string(body.substr(0, 200));
        }
        return unexpected{error{checksum_mismatch ? error_code::chunk_checksum_mismatch
                                                  : error_code::transport_error,
                                message}};
    }

    chunk_ack ack;
    ack.status_code = status_code;
    ack.detail = detail;
    ack.checksum_mismatch = checksum_mismatch;

    if (status_code == 204 && body.empty()) {
        ack.success = true;
        return ack;
    }

    auto success = find_json_bool(body, "success");
    if (!success) {
        ack.success = false;
        if (!ack.detail) {
            ack.detail = "response missing success flag";
        }
        return ack;
    }

    ack.success = *success;
    return ack;
}

// ============================================================================
// request_executor
// ============================================================================

request_executor::request_executor(std::size_t max_parallel)
    : max_parallel_(std::max<std::size_t>(max_parallel, 1)),
      stopping_(std::make_shared<std::atomic<bool>>(false)),
      pool_(adapters::upload_pool_factory::create(max_parallel_, "chunked_upload_http")) {}

request_executor::~request_executor() {
    stopping_->store(true);
    pool_.reset();
}

auto request_executor::run(std::function<result<http_exchange>()> exchange,
                           const cancellation_token& token,
                           std::chrono::milliseconds poll_interval) -> result<http_exchange> {
    if (token.is_cancelled()) {
        return unexpected{error{error_code::transfer_cancelled, "chunk send cancelled"}};
    }

    auto slot = std::make_shared<std::optional<result<http_exchange>>>();
    auto done = pool_->submit_to_stage(
        [exchange = std::move(exchange), token, slot, stopping = stopping_]() {
            if (token.is_cancelled() || stopping->load()) {
                slot->emplace(unexpected{error{error_code::transfer_cancelled,
                                               "request skipped before it started"}});
                return;
            }
            slot->emplace(exchange());
        },
        "http_request");

    while (done.wait_for(poll_interval) != std::future_status::ready) {
        if (token.is_cancelled()) {
            return unexpected{error{error_code::transfer_cancelled, "chunk send cancelled"}};
        }
    }

    try {
        done.get();
    } catch (const std::exception& e) {
        return unexpected{error{error_code::transport_error,
                                std::string("HTTP request failed: ") + e.what()}};
    }

    if (!slot->has_value()) {
        return unexpected{error{error_code::internal_error, "HTTP request produced no result"}};
    }
    return std::move(slot->value());
}

// ============================================================================
// http_chunk_transport
// ============================================================================

struct http_chunk_transport::impl {
    http_transport_config config;
    request_executor executor;
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif

    explicit impl(http_transport_config cfg)
        : config(std::move(cfg)), executor(config.max_parallel_requests) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(config.timeout);
#endif
    }
};

http_chunk_transport::http_chunk_transport(http_transport_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {}

http_chunk_transport::~http_chunk_transport() = default;

auto http_chunk_transport::endpoint() const -> std::string {
    return impl_->config.endpoint_url;
}

auto http_chunk_transport::send(const chunk_request& request,
                                const cancellation_token& token) -> result<chunk_ack> {
    if (token.is_cancelled()) {
        return unexpected{error{error_code::transfer_cancelled, "chunk send cancelled"}};
    }

#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::internal_error, "HTTP client not initialized"}};
    }

    auto body = encode_chunk_request(request, generate_boundary());
    auto headers = impl_->config.headers;
    headers["Content-Type"] = body.content_type;

    auto post = [client = impl_->client, url = impl_->config.endpoint_url,
                 payload = std::move(body.bytes),
                 headers = std::move(headers)]() -> result<http_exchange> {
        auto response = client->post(url, payload, headers);
        if (response.is_err()) {
            return unexpected{error{error_code::transport_error, "HTTP POST request failed"}};
        }
        const auto& resp = response.value();
        http_exchange exchange;
        exchange.status_code = resp.status_code;
        exchange.body = std::string(resp.body.begin(), resp.body.end());
        return exchange;
    };

    auto outcome = impl_->executor.run(std::move(post), token, impl_->config.cancel_poll_interval);
    if (!outcome) {
        if (outcome.error().code == error_code::transfer_cancelled) {
            CU_LOG_DEBUG(log_category::transport,
                         "Abandoning request for chunk " + std::to_string(request.chunk_index));
        }
        return unexpected{outcome.error()};
    }
    return parse_chunk_response(outcome.value().status_code, outcome.value().body);
#else
    (void)request;
    return unexpected{error{error_code::not_available,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

}  // namespace chunked_upload
