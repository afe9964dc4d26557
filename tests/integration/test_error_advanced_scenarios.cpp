/**
 * @file test_error_advanced_scenarios.cpp
 * @brief Failure handling across the registry, sessions and transport
 *
 * This file contains tests for:
 * - Source changes detected before a chunk is sent
 * - Size limits enforced before any chunk is sent
 * - Non-retryable transport errors
 * - Several chunks failing in one session
 * - Statistics of failed sessions
 */

#include "test_fixtures.h"

namespace chunked_upload::test {

constexpr std::size_t mib = 1024 * 1024;

class ErrorScenarioTest : public RegistryFixture {};

TEST_F(ErrorScenarioTest, SourceChangedDuringUpload) {
    build_registry();

    auto source = std::make_shared<mutable_memory_source>("changing.bin", random_bytes(4 * mib));
    transport_->close_gate();
    auto id = registry_->submit(source);
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(transport_->wait_for_in_flight(3, 5s));

    // Chunks 0-2 are held at the gate; chunk 3 is read only after one of them finishes.
    source->flip_byte(3 * mib + 17);
    transport_->open_gate();

    ASSERT_TRUE(recorder_.wait_for_errors(1, 10s));
    auto status = registry_->wait(id.value(), 10s);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status.value(), upload_status::error);

    auto errors = recorder_.errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, error_code::file_hash_mismatch);
    EXPECT_TRUE(recorder_.completions().empty());

    // The changed chunk is never sent and no chunk counts as failed.
    auto snap = registry_->snapshot(id.value());
    ASSERT_TRUE(snap.has_value());
    EXPECT_TRUE(snap.value().failed_chunks().empty());
    EXPECT_EQ(snap.value().chunks[3].state, chunk_state::pending);
    EXPECT_EQ(transport_->attempts(3), 0u);
    EXPECT_EQ(snap.value().uploaded_bytes, 3 * mib);
    EXPECT_EQ(snap.value().buffered_bytes, 0u);
    ASSERT_TRUE(snap.value().last_error.has_value());
    EXPECT_EQ(snap.value().last_error->code, error_code::file_hash_mismatch);

    auto retried = registry_->retry(id.value());
    ASSERT_FALSE(retried.has_value());
    EXPECT_EQ(retried.error().code, error_code::file_hash_mismatch);

    // A failed session can be cleared.
    ASSERT_TRUE(registry_->clear(id.value()));
    EXPECT_TRUE(registry_->session_ids().empty());
}

TEST_F(ErrorScenarioTest, FileTooLargeSendsNothing) {
    build_registry(make_builder().with_max_file_size(5 * mib));
    auto path = create_test_file("huge.bin", 5 * mib + 1);

    auto id = registry_->submit(path);
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, error_code::file_too_large);
    EXPECT_EQ(transport_->total_attempts(), 0u);
    EXPECT_EQ(recorder_.event_count(), 0u);
}

TEST_F(ErrorScenarioTest, NonRetryableErrorFailsChunkAtOnce) {
    transport_->fail_times(1, 1, error_code::not_available);
    build_registry();

    auto id = registry_->submit(make_source("unavailable.bin", 3 * mib));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(recorder_.wait_for_errors(1, 10s));

    auto status = registry_->wait(id.value(), 10s);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status.value(), upload_status::error);
    EXPECT_EQ(transport_->attempts(1), 1u);

    auto errors = recorder_.errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, error_code::not_available);
    EXPECT_EQ(errors[0].retry_count.value_or(99), 0u);
}

TEST_F(ErrorScenarioTest, ChecksumMismatchIsRetried) {
    transport_->fail_times(0, 2, error_code::chunk_checksum_mismatch);
    build_registry();

    auto id = registry_->submit(make_source("checksum.bin", 2 * mib));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(recorder_.wait_for_completions(1, 10s));
    EXPECT_EQ(transport_->attempts(0), 3u);
}

TEST_F(ErrorScenarioTest, SeveralChunksFailIndependently) {
    transport_->fail_times(0, 10);
    transport_->fail_times(2, 10);
    build_registry(make_builder().with_max_concurrent(4));

    auto id = registry_->submit(make_source("several.bin", 4 * mib));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(recorder_.wait_for_errors(2, 10s));

    auto status = registry_->wait(id.value(), 10s);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status.value(), upload_status::error);

    auto snap = registry_->snapshot(id.value());
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap.value().failed_chunks(), (std::vector<uint64_t>{0, 2}));
    for (uint64_t index : {0u, 2u}) {
        EXPECT_EQ(snap.value().chunks[index].retries, 3u);
        EXPECT_EQ(transport_->attempts(index), 4u);
    }
    EXPECT_EQ(snap.value().chunks[1].state, chunk_state::uploaded);
    EXPECT_EQ(snap.value().chunks[3].state, chunk_state::uploaded);
    EXPECT_EQ(recorder_.errors().size(), 2u);
}

TEST_F(ErrorScenarioTest, RetryOnlyResendsFailedChunks) {
    transport_->fail_times(1, 4);
    build_registry(make_builder().with_max_concurrent(4));

    auto id = registry_->submit(make_source("resend.bin", 4 * mib));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(recorder_.wait_for_errors(1, 10s));
    ASSERT_TRUE(registry_->wait(id.value(), 10s).has_value());

    ASSERT_TRUE(registry_->retry(id.value()));
    ASSERT_TRUE(recorder_.wait_for_completions(1, 10s));

    EXPECT_EQ(transport_->attempts(0), 1u);
    EXPECT_EQ(transport_->attempts(1), 5u);
    EXPECT_EQ(transport_->attempts(2), 1u);
    EXPECT_EQ(transport_->attempts(3), 1u);
}

TEST_F(ErrorScenarioTest, ControlCommandsRejectedInWrongState) {
    transport_->fail_times(0, 10);
    build_registry();

    auto id = registry_->submit(make_source("states.bin", mib));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(registry_->wait(id.value(), 10s).has_value());
    ASSERT_EQ(registry_->status(id.value()).value(), upload_status::error);

    EXPECT_EQ(registry_->pause(id.value()).error().code, error_code::invalid_state);
    EXPECT_EQ(registry_->resume(id.value()).error().code, error_code::invalid_state);
}

TEST_F(ErrorScenarioTest, StatisticsCountFailedSessions) {
    transport_->fail_times(0, 10);
    build_registry();

    auto id = registry_->submit(make_source("stats.bin", mib));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(recorder_.wait_for_errors(1, 10s));
    ASSERT_TRUE(registry_->wait(id.value(), 10s).has_value());

    auto stats = registry_->statistics();
    EXPECT_EQ(stats.total_sessions, 1u);
    EXPECT_EQ(stats.failed_sessions, 1u);
    EXPECT_EQ(stats.completed_sessions, 0u);
    EXPECT_EQ(stats.uploaded_bytes, 0u);
}

}  // namespace chunked_upload::test
