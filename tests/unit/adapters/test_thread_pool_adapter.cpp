/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for the upload pool adapters
 */

#include <gtest/gtest.h>

#include <chunked_upload/adapters/thread_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>

namespace chunked_upload::test {

using namespace std::chrono_literals;

TEST(BasicUploadPoolTest, RunsSubmittedTasks) {
    adapters::basic_upload_pool pool(2);
    std::atomic<int> runs{0};

    auto a = pool.submit([&runs]() { ++runs; });
    auto b = pool.submit_to_stage([&runs]() { ++runs; }, "digest");
    a.get();
    b.get();

    EXPECT_EQ(runs.load(), 2);
    EXPECT_EQ(pool.worker_count(), 2u);
    EXPECT_TRUE(pool.is_running());
}

TEST(BasicUploadPoolTest, ForwardsTaskExceptions) {
    adapters::basic_upload_pool pool(1);
    auto f = pool.submit([]() { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(BasicUploadPoolTest, WorkerThreadIsRecognized) {
    auto pool = std::make_shared<adapters::basic_upload_pool>(1);
    auto other = std::make_shared<adapters::basic_upload_pool>(1);

    EXPECT_FALSE(pool->is_worker_thread());

    bool inside_own = false;
    bool inside_other = true;
    pool->submit([&]() {
            inside_own = pool->is_worker_thread();
            inside_other = other->is_worker_thread();
        })
        .get();

    EXPECT_TRUE(inside_own);
    EXPECT_FALSE(inside_other);
    EXPECT_FALSE(pool->is_worker_thread());
}

TEST(BasicUploadPoolTest, NestedPoolRestoresWorkerMark) {
    auto outer = std::make_shared<adapters::basic_upload_pool>(1);
    auto inner = std::make_shared<adapters::basic_upload_pool>(1);

    bool outer_after_inner = false;
    outer->submit([&]() {
            inner->submit([]() {}).get();
            outer_after_inner = outer->is_worker_thread();
        })
        .get();

    EXPECT_TRUE(outer_after_inner);
}

TEST(BasicUploadPoolTest, ShutdownRejectsNewTasks) {
    adapters::basic_upload_pool pool(1);
    pool.shutdown();

    EXPECT_FALSE(pool.is_running());
    auto f = pool.submit([]() {});
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(UploadPoolFactoryTest, CreatesRunningPool) {
    auto pool = adapters::upload_pool_factory::create(2, "factory_test");
    ASSERT_NE(pool, nullptr);
    EXPECT_TRUE(pool->is_running());
    EXPECT_FALSE(pool->is_worker_thread());

    auto marked = std::make_shared<std::promise<bool>>();
    auto result = marked->get_future();
    auto* raw = pool.get();
    auto submitted = pool->submit([raw, marked]() { marked->set_value(raw->is_worker_thread()); });
    ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(result.get());
    submitted.get();
}

}  // namespace chunked_upload::test
