/**
 * @file test_http_chunk_transport.cpp
 * @brief Unit tests for the HTTP chunk request encoding, response parsing and
 *        the bounded request executor
 */

#include <gtest/gtest.h>

#include <chunked_upload/transport/http_chunk_transport.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace chunked_upload::test {

class HttpChunkEncodingTest : public ::testing::Test {
protected:
    void SetUp() override {
        payload_ = {std::byte{0x00}, std::byte{0x01}, std::byte{0xfe}, std::byte{0xff}};

        request_.session = session_id::generate();
        request_.chunk_index = 3;
        request_.total_chunks = 10;
        request_.file_name = "report.pdf";
        request_.chunk_bytes = payload_;
        request_.chunk_digest = "abc123";
    }

    auto encode() const -> std::string {
        auto body = encode_chunk_request(request_, "BOUNDARY");
        return std::string(body.bytes.begin(), body.bytes.end());
    }

    std::vector<std::byte> payload_;
    chunk_request request_;
};

TEST_F(HttpChunkEncodingTest, ContentTypeCarriesBoundary) {
    auto body = encode_chunk_request(request_, "BOUNDARY");
    EXPECT_EQ(body.content_type, "multipart/form-data; boundary=BOUNDARY");
}

TEST_F(HttpChunkEncodingTest, AllFieldsPresent) {
    auto text = encode();

    EXPECT_NE(text.find("name=\"sessionId\"\r\n\r\n" + request_.session.to_string()),
              std::string::npos);
    EXPECT_NE(text.find("name=\"chunkIndex\"\r\n\r\n3\r\n"), std::string::npos);
    EXPECT_NE(text.find("name=\"totalChunks\"\r\n\r\n10\r\n"), std::string::npos);
    EXPECT_NE(text.find("name=\"fileName\"\r\n\r\nreport.pdf\r\n"), std::string::npos);
    EXPECT_NE(text.find("name=\"chunkDigest\"\r\n\r\nabc123\r\n"), std::string::npos);
    EXPECT_NE(text.find("name=\"chunkBytes\"; filename=\"report.pdf.part3\""),
              std::string::npos);
}

TEST_F(HttpChunkEncodingTest, BinaryPayloadIsVerbatim) {
    auto text = encode();
    std::string raw("\x00\x01\xfe\xff", 4);
    EXPECT_NE(text.find("application/octet-stream\r\n\r\n" + raw + "\r\n"), std::string::npos);
}

TEST_F(HttpChunkEncodingTest, ClosingBoundary) {
    auto text = encode();
    std::string closing = "\r\n--BOUNDARY--\r\n";
    ASSERT_GE(text.size(), closing.size());
    EXPECT_EQ(text.substr(text.size() - closing.size()), closing);
}

// =============================================================================
// Response parsing
// =============================================================================

TEST(HttpChunkResponseTest, SuccessBody) {
    auto ack = parse_chunk_response(200, R"({"success": true})");
    ASSERT_TRUE(ack.has_value());
    EXPECT_TRUE(ack.value().success);
    EXPECT_EQ(ack.value().status_code, 200);
    EXPECT_FALSE(ack.value().checksum_mismatch);
}

TEST(HttpChunkResponseTest, RejectedBody) {
    auto ack = parse_chunk_response(200, R"({"success":false,"error":"quota exceeded"})");
    ASSERT_TRUE(ack.has_value());
    EXPECT_FALSE(ack.value().success);
    ASSERT_TRUE(ack.value().detail.has_value());
    EXPECT_EQ(*ack.value().detail, "quota exceeded");
}

TEST(HttpChunkResponseTest, MissingSuccessFlagIsRejection) {
    auto ack = parse_chunk_response(200, R"({"status":"ok"})");
    ASSERT_TRUE(ack.has_value());
    EXPECT_FALSE(ack.value().success);
    EXPECT_TRUE(ack.value().detail.has_value());
}

TEST(HttpChunkResponseTest, NoContentIsSuccess) {
    auto ack = parse_chunk_response(204, "");
    ASSERT_TRUE(ack.has_value());
    EXPECT_TRUE(ack.value().success);
}

TEST(HttpChunkResponseTest, ChecksumMismatchFlag) {
    auto ack = parse_chunk_response(200, R"({"success":false,"checksumMismatch":true})");
    ASSERT_TRUE(ack.has_value());
    EXPECT_FALSE(ack.value().success);
    EXPECT_TRUE(ack.value().checksum_mismatch);
}

TEST(HttpChunkResponseTest, ServerErrorBecomesTransportError) {
    auto ack = parse_chunk_response(500, R"({"error":"storage unavailable"})");
    ASSERT_FALSE(ack.has_value());
    EXPECT_EQ(ack.error().code, error_code::transport_error);
    EXPECT_EQ(ack.error().message, "HTTP 500: storage unavailable");
}

TEST(HttpChunkResponseTest, ServerErrorWithPlainBody) {
    auto ack = parse_chunk_response(502, "Bad Gateway");
    ASSERT_FALSE(ack.has_value());
    EXPECT_EQ(ack.error().code, error_code::transport_error);
    EXPECT_EQ(ack.error().message, "HTTP 502: Bad Gateway");
}

TEST(HttpChunkResponseTest, ChecksumRejectionStatus) {
    auto ack = parse_chunk_response(422, R"({"message":"Chunk checksum mismatch"})");
    ASSERT_FALSE(ack.has_value());
    EXPECT_EQ(ack.error().code, error_code::chunk_checksum_mismatch);
}

// =============================================================================
// Transport
// =============================================================================

TEST(HttpChunkTransportTest, EndpointIsReported) {
    http_transport_config config;
    config.endpoint_url = "http://localhost:8080/api/upload/chunk";
    http_chunk_transport transport(config);
    EXPECT_EQ(transport.endpoint(), "http://localhost:8080/api/upload/chunk");
}

TEST(HttpChunkTransportTest, CancelledTokenShortCircuits) {
    http_transport_config config;
    config.endpoint_url = "http://localhost:1/never";
    http_chunk_transport transport(config);

    cancellation_token token;
    token.cancel();

    chunk_request request;
    request.session = session_id::generate();
    auto sent = transport.send(request, token);
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::transfer_cancelled);
}

TEST(HttpChunkTransportTest, UnavailableWithoutNetworkSystem) {
    if (http_chunk_transport::is_available()) {
        GTEST_SKIP() << "network_system is linked";
    }

    http_transport_config config;
    config.endpoint_url = "http://localhost:1/never";
    http_chunk_transport transport(config);

    cancellation_token token;
    chunk_request request;
    request.session = session_id::generate();
    auto sent = transport.send(request, token);
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::not_available);
}

// =============================================================================
// Request executor
// =============================================================================

namespace {

using namespace std::chrono_literals;

/**
 * @brief Exchanges that block until released, counting how many run at once
 */
class held_exchanges {
public:
    auto make() -> std::function<result<http_exchange>()> {
        return [this]() -> result<http_exchange> {
            std::unique_lock<std::mutex> lock(mutex_);
            ++started_;
            ++running_;
            peak_ = std::max(peak_, running_);
            cv_.notify_all();
            cv_.wait(lock, [this] { return released_; });
            --running_;
            return http_exchange{200, "{\"success\":true}"};
        };
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

    auto wait_started(std::size_t count, std::chrono::milliseconds timeout) -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return started_ >= count; });
    }

    auto started() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

    auto peak() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t started_{0};
    std::size_t running_{0};
    std::size_t peak_{0};
    bool released_{false};
};

}  // namespace

TEST(RequestExecutorTest, ReturnsExchangeResult) {
    request_executor executor(2);
    cancellation_token token;

    auto outcome = executor.run(
        []() -> result<http_exchange> { return http_exchange{201, "created"}; }, token, 5ms);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().status_code, 201);
    EXPECT_EQ(outcome.value().body, "created");
}

TEST(RequestExecutorTest, ThrowingExchangeBecomesTransportError) {
    request_executor executor(1);
    cancellation_token token;

    auto outcome = executor.run(
        []() -> result<http_exchange> { throw std::runtime_error("socket closed"); }, token,
        5ms);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::transport_error);
}

TEST(RequestExecutorTest, ZeroParallelismMeansOne) {
    request_executor executor(0);
    EXPECT_EQ(executor.max_parallel(), 1u);
}

TEST(RequestExecutorTest, ParallelRequestsAreCapped) {
    constexpr std::size_t cap = 3;
    held_exchanges exchanges;
    request_executor executor(cap);
    cancellation_token token;

    std::atomic<std::size_t> succeeded{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 10; ++i) {
        callers.emplace_back([&]() {
            auto outcome = executor.run(exchanges.make(), token, 5ms);
            if (outcome && outcome.value().status_code == 200) {
                ++succeeded;
            }
        });
    }

    ASSERT_TRUE(exchanges.wait_started(cap, 5s));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(exchanges.started(), cap);

    exchanges.release();
    for (auto& caller : callers) {
        caller.join();
    }

    EXPECT_EQ(exchanges.peak(), cap);
    EXPECT_EQ(exchanges.started(), 10u);
    EXPECT_EQ(succeeded.load(), 10u);
}

TEST(RequestExecutorTest, QueuedRequestSkippedAfterCancel) {
    held_exchanges blocker;
    request_executor executor(1);
    cancellation_token busy_token;

    std::thread busy([&]() {
        auto outcome = executor.run(blocker.make(), busy_token, 5ms);
        EXPECT_TRUE(outcome.has_value());
    });
    ASSERT_TRUE(blocker.wait_started(1, 5s));

    cancellation_token token;
    std::atomic<bool> queued_ran{false};
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(30ms);
        token.cancel();
    });

    auto started = std::chrono::steady_clock::now();
    auto outcome = executor.run(
        [&queued_ran]() -> result<http_exchange> {
            queued_ran = true;
            return http_exchange{200, ""};
        },
        token, 5ms);
    auto waited = std::chrono::steady_clock::now() - started;
    canceller.join();

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::transfer_cancelled);
    EXPECT_LT(waited, 2s);

    // Once the slot frees up, the cancelled request is dropped rather than sent.
    blocker.release();
    busy.join();
    auto after = executor.run(
        []() -> result<http_exchange> { return http_exchange{204, ""}; }, busy_token, 5ms);
    ASSERT_TRUE(after.has_value());
    EXPECT_FALSE(queued_ran.load());
}

TEST(RequestExecutorTest, CancelReturnsWhileRequestRuns) {
    held_exchanges exchanges;
    request_executor executor(1);
    cancellation_token token;

    std::thread canceller([&]() {
        ASSERT_TRUE(exchanges.wait_started(1, 5s));
        token.cancel();
    });

    auto outcome = executor.run(exchanges.make(), token, 5ms);
    canceller.join();

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::transfer_cancelled);

    // The started exchange still finishes; the executor waits for it on destruction.
    exchanges.release();
}

TEST(HttpChunkTransportTest, DefaultRequestCap) {
    http_transport_config config;
    EXPECT_EQ(config.max_parallel_requests, 8u);
}

}  // namespace chunked_upload::test
