/**
 * @file bench_chunk_operations.cpp
 * @brief Benchmarks for chunk planning and digest computation
 *
 * Measures:
 * - SHA-256 throughput at chunk-sized inputs
 * - Plan construction (split + per-chunk digests + whole-file digest)
 * - Plan construction with a worker pool
 */

#include <benchmark/benchmark.h>

#include <chunked_upload/adapters/thread_pool_adapter.h>
#include <chunked_upload/core/byte_source.h>
#include <chunked_upload/core/chunk_planner.h>
#include <chunked_upload/core/digest.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <memory>
#include <span>

namespace chunked_upload::benchmark {

namespace {

auto make_config(std::size_t chunk_size) -> upload_config {
    upload_config config;
    config.chunk_size = chunk_size;
    return config;
}

}  // namespace

/**
 * @brief SHA-256 of one chunk-sized buffer
 */
static void BM_ChunkDigest(::benchmark::State& state) {
    const auto chunk_size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(chunk_size, 42);

    for (auto _ : state) {
        auto hex = digest::sha256(data);
        ::benchmark::DoNotOptimize(hex);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(chunk_size));
    state.SetLabel(format_bytes(chunk_size));
}
BENCHMARK(BM_ChunkDigest)
    ->Arg(sizes::min_chunk)
    ->Arg(256 * sizes::KB)
    ->Arg(sizes::default_chunk)
    ->Arg(sizes::max_chunk);

/**
 * @brief Incremental SHA-256 over a file-sized buffer fed in chunk slices
 */
static void BM_StreamingDigest(::benchmark::State& state) {
    const auto chunk_size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(sizes::medium_file, 42);
    std::span<const std::byte> view(data);

    for (auto _ : state) {
        sha256_stream stream;
        for (std::size_t offset = 0; offset < view.size(); offset += chunk_size) {
            auto len = std::min(chunk_size, view.size() - offset);
            if (!stream.update(view.subspan(offset, len))) {
                state.SkipWithError("digest update failed");
                return;
            }
        }
        auto hex = stream.finalize();
        if (!hex) {
            state.SkipWithError("digest finalize failed");
            return;
        }
        ::benchmark::DoNotOptimize(hex.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(data.size()));
}
BENCHMARK(BM_StreamingDigest)
    ->Arg(sizes::min_chunk)
    ->Arg(sizes::default_chunk);

/**
 * @brief Plan an in-memory source on the calling thread
 */
static void BM_PlanMemorySource(::benchmark::State& state) {
    const auto chunk_size = static_cast<std::size_t>(state.range(0));
    memory_byte_source source("bench.bin", generate_random_data(sizes::medium_file, 7));
    chunk_planner planner(make_config(chunk_size));

    for (auto _ : state) {
        auto plan = planner.plan(source);
        if (!plan) {
            state.SkipWithError(plan.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(plan.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(source.size()));
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(make_config(chunk_size).calculate_chunk_count(source.size())));
}
BENCHMARK(BM_PlanMemorySource)
    ->Arg(sizes::min_chunk)
    ->Arg(sizes::default_chunk)
    ->Arg(sizes::max_chunk)
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Plan an in-memory source with per-chunk digests on a worker pool
 */
static void BM_PlanMemorySourceParallel(::benchmark::State& state) {
    const auto workers = static_cast<std::size_t>(state.range(0));
    memory_byte_source source("bench.bin", generate_random_data(sizes::medium_file, 7));
    auto pool = std::make_shared<adapters::basic_upload_pool>(workers);
    chunk_planner planner(make_config(sizes::default_chunk), pool);

    for (auto _ : state) {
        auto plan = planner.plan(source);
        if (!plan) {
            state.SkipWithError(plan.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(plan.value());
    }

    pool->shutdown();
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(source.size()));
}
BENCHMARK(BM_PlanMemorySourceParallel)
    ->Arg(1)
    ->Arg(2)
    ->Arg(4)
    ->Arg(8)
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Plan a file on disk
 */
static void BM_PlanFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    temp_file_manager files;
    auto path = files.create_random_file("plan_file.bin", file_size, 11);
    chunk_planner planner(make_config(sizes::default_chunk));

    for (auto _ : state) {
        auto plan = planner.plan(path);
        if (!plan) {
            state.SkipWithError(plan.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(plan.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(file_size));
    state.SetLabel(format_bytes(file_size));
}
BENCHMARK(BM_PlanFile)
    ->Arg(sizes::small_file)
    ->Arg(sizes::medium_file)
    ->Unit(::benchmark::kMillisecond);

}  // namespace chunked_upload::benchmark
