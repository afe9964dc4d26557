/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes, result and session_id
 */

#include <gtest/gtest.h>

#include <chunked_upload/core/types.h>
#include <chunked_upload/core/upload_config.h>

#include <set>
#include <string>
#include <unordered_set>

namespace chunked_upload::test {

// =============================================================================
// error_code
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ToStringNamesEveryCode) {
    EXPECT_EQ(to_string(error_code::success), "success");
    EXPECT_EQ(to_string(error_code::file_too_large), "file too large");
    EXPECT_EQ(to_string(error_code::transport_error), "transport error");
    EXPECT_EQ(to_string(error_code::transfer_cancelled), "transfer cancelled");
    EXPECT_EQ(to_string(error_code::file_hash_mismatch), "file hash mismatch");
    EXPECT_EQ(to_string(error_code::session_not_found), "session not found");
}

TEST_F(ErrorCodeTest, RetryableCodes) {
    EXPECT_TRUE(is_retryable(error_code::transport_error));
    EXPECT_TRUE(is_retryable(error_code::connection_timeout));
    EXPECT_TRUE(is_retryable(error_code::upload_rejected));
    EXPECT_TRUE(is_retryable(error_code::chunk_checksum_mismatch));
}

TEST_F(ErrorCodeTest, NonRetryableCodes) {
    EXPECT_FALSE(is_retryable(error_code::transfer_cancelled));
    EXPECT_FALSE(is_retryable(error_code::file_too_large));
    EXPECT_FALSE(is_retryable(error_code::file_hash_mismatch));
    EXPECT_FALSE(is_retryable(error_code::not_available));
    EXPECT_FALSE(is_retryable(error_code::internal_error));
}

// =============================================================================
// result
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<int> r = unexpected{error{error_code::file_not_found, "missing"}};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::file_not_found);
    EXPECT_EQ(r.error().message, "missing");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected{error{error_code::invalid_state}};
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().message, "invalid state");
}

// =============================================================================
// session_id
// =============================================================================

class SessionIdTest : public ::testing::Test {};

TEST_F(SessionIdTest, DefaultIsNull) {
    session_id id;
    EXPECT_TRUE(id.is_null());
}

TEST_F(SessionIdTest, GeneratedIdsAreUnique) {
    std::set<session_id> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(session_id::generate());
    }
    EXPECT_EQ(ids.size(), 1000u);
}

TEST_F(SessionIdTest, CanonicalFormat) {
    auto text = session_id::generate().to_string();
    ASSERT_EQ(text.size(), 36u);
    EXPECT_EQ(text[8], '-');
    EXPECT_EQ(text[13], '-');
    EXPECT_EQ(text[18], '-');
    EXPECT_EQ(text[23], '-');
    // Version 4
    EXPECT_EQ(text[14], '4');
}

TEST_F(SessionIdTest, ParsesItsOwnOutput) {
    auto id = session_id::generate();
    auto parsed = session_id::from_string(id.to_string());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);
}

TEST_F(SessionIdTest, RejectsMalformedText) {
    EXPECT_FALSE(session_id::from_string("").has_value());
    EXPECT_FALSE(session_id::from_string("not-a-uuid").has_value());
    EXPECT_FALSE(session_id::from_string("0123456789abcdef0123456789abcdeg").has_value());
}

TEST_F(SessionIdTest, Hashable) {
    std::unordered_set<session_id> ids;
    auto id = session_id::generate();
    ids.insert(id);
    ids.insert(id);
    EXPECT_EQ(ids.size(), 1u);
}

// =============================================================================
// upload_config
// =============================================================================

class UploadConfigTest : public ::testing::Test {};

TEST_F(UploadConfigTest, Defaults) {
    upload_config config;
    EXPECT_EQ(config.chunk_size, 1024u * 1024u);
    EXPECT_EQ(config.max_concurrent, 3u);
    EXPECT_EQ(config.retry.max_retries, 3u);
    EXPECT_FALSE(config.max_file_size.has_value());
    EXPECT_EQ(config.retry.initial_backoff, std::chrono::milliseconds(1000));
    EXPECT_EQ(config.retry.max_backoff, std::chrono::milliseconds(30000));
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(UploadConfigTest, RejectsChunkSizeOutOfRange) {
    upload_config config;
    config.chunk_size = 10;
    auto small = config.validate();
    ASSERT_FALSE(small);
    EXPECT_EQ(small.error().code, error_code::invalid_chunk_size);

    config.chunk_size = upload_config::max_chunk_size + 1;
    EXPECT_FALSE(config.validate());
}

TEST_F(UploadConfigTest, RejectsZeroConcurrency) {
    upload_config config;
    config.max_concurrent = 0;
    auto valid = config.validate();
    ASSERT_FALSE(valid);
    EXPECT_EQ(valid.error().code, error_code::invalid_configuration);
}

TEST_F(UploadConfigTest, RejectsInvertedBackoff) {
    upload_config config;
    config.retry.initial_backoff = std::chrono::milliseconds(500);
    config.retry.max_backoff = std::chrono::milliseconds(100);
    EXPECT_FALSE(config.validate());
}

TEST_F(UploadConfigTest, ChunkCount) {
    upload_config config;
    config.chunk_size = 1024;
    EXPECT_EQ(config.calculate_chunk_count(0), 0u);
    EXPECT_EQ(config.calculate_chunk_count(1), 1u);
    EXPECT_EQ(config.calculate_chunk_count(1024), 1u);
    EXPECT_EQ(config.calculate_chunk_count(1025), 2u);
    EXPECT_EQ(config.calculate_chunk_count(10 * 1024), 10u);
}

TEST_F(UploadConfigTest, OptionsOverrideBase) {
    upload_config base;
    upload_options options;
    options.chunk_size = 4096;
    options.max_retries = 7;

    auto effective = options.apply(base);
    EXPECT_EQ(effective.chunk_size, 4096u);
    EXPECT_EQ(effective.retry.max_retries, 7u);
    EXPECT_EQ(effective.max_concurrent, base.max_concurrent);
}

}  // namespace chunked_upload::test
