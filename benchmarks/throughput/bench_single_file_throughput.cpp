/**
 * @file bench_single_file_throughput.cpp
 * @brief End-to-end upload throughput through the registry
 *
 * Uses a transport that acknowledges chunks without sending them, so the
 * numbers reflect planning, dispatch, retry bookkeeping and verification.
 */

#include <benchmark/benchmark.h>

#include <chunked_upload/adapters/thread_pool_adapter.h>
#include <chunked_upload/engine/upload_registry.h>

#include "utils/benchmark_helpers.h"

#include <chrono>
#include <memory>

namespace chunked_upload::benchmark {

namespace {

constexpr auto wait_budget = std::chrono::minutes(2);

auto build_registry(std::shared_ptr<null_transport> transport,
                    std::size_t chunk_size,
                    std::size_t max_concurrent,
                    verification_mode mode = verification_mode::reread_source)
    -> result<upload_registry> {
    return upload_registry::builder()
        .with_chunk_size(chunk_size)
        .with_max_concurrent(max_concurrent)
        .with_verification(mode)
        .with_transport(std::move(transport))
        .with_worker_threads(8)
        .build();
}

}  // namespace

/**
 * @brief Upload one in-memory file with varying chunks in flight
 */
static void BM_SingleFile_UploadThroughput(::benchmark::State& state) {
    const auto max_concurrent = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(sizes::medium_file, 42);

    auto transport = std::make_shared<null_transport>();
    auto registry = build_registry(transport, sizes::default_chunk, max_concurrent);
    if (!registry) {
        state.SkipWithError(registry.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        auto source = std::make_shared<memory_byte_source>("throughput.bin", data);
        auto id = registry.value().submit(source);
        if (!id) {
            state.SkipWithError(id.error().message.c_str());
            return;
        }
        auto status = registry.value().wait(id.value(), wait_budget);
        if (!status || status.value() != upload_status::completed) {
            state.SkipWithError("upload did not complete");
            return;
        }
        registry.value().clear_finished();
    }

    state.SetBytesProcessed(static_cast<int64_t>(sizes::medium_file) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["chunks_in_flight"] = static_cast<double>(max_concurrent);
}
BENCHMARK(BM_SingleFile_UploadThroughput)
    ->Arg(1)
    ->Arg(3)
    ->Arg(8)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

/**
 * @brief Compare completion by re-reading the source against trusting the plan digest
 */
static void BM_SingleFile_VerificationMode(::benchmark::State& state) {
    const auto mode = state.range(0) == 0 ? verification_mode::reread_source
                                          : verification_mode::planned_digest;
    auto data = generate_random_data(sizes::medium_file, 42);

    auto registry = build_registry(std::make_shared<null_transport>(),
                                   sizes::default_chunk, 3, mode);
    if (!registry) {
        state.SkipWithError(registry.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        auto id = registry.value().submit(
            std::make_shared<memory_byte_source>("verify.bin", data));
        if (!id) {
            state.SkipWithError(id.error().message.c_str());
            return;
        }
        auto status = registry.value().wait(id.value(), wait_budget);
        if (!status || status.value() != upload_status::completed) {
            state.SkipWithError("upload did not complete");
            return;
        }
        registry.value().clear_finished();
    }

    state.SetBytesProcessed(static_cast<int64_t>(sizes::medium_file) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(mode == verification_mode::reread_source ? "reread_source"
                                                            : "planned_digest");
}
BENCHMARK(BM_SingleFile_VerificationMode)
    ->Arg(0)
    ->Arg(1)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

/**
 * @brief Upload a file from disk at different chunk sizes
 */
static void BM_SingleFile_ChunkSize(::benchmark::State& state) {
    const auto chunk_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager files;
    auto path = files.create_random_file("chunk_size.bin", sizes::medium_file, 42);

    auto registry = build_registry(std::make_shared<null_transport>(), chunk_size, 3);
    if (!registry) {
        state.SkipWithError(registry.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        auto id = registry.value().submit(path);
        if (!id) {
            state.SkipWithError(id.error().message.c_str());
            return;
        }
        auto status = registry.value().wait(id.value(), wait_budget);
        if (!status || status.value() != upload_status::completed) {
            state.SkipWithError("upload did not complete");
            return;
        }
        registry.value().clear_finished();
    }

    state.SetBytesProcessed(static_cast<int64_t>(sizes::medium_file) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(chunk_size));
}
BENCHMARK(BM_SingleFile_ChunkSize)
    ->Arg(sizes::min_chunk)
    ->Arg(sizes::default_chunk)
    ->Arg(sizes::max_chunk)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace chunked_upload::benchmark
