/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef CHUNKED_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
#define CHUNKED_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H

#include <chunked_upload/transport/chunk_transport.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chunked_upload::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});
    ~temp_file_manager();

    // Non-copyable
    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with random data
     * @return Path to created file
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Transport that acknowledges every chunk without sending it
 *
 * Isolates engine overhead (planning, dispatch, digests) from the network.
 */
class null_transport : public chunk_transport {
public:
    auto send(const chunk_request& request, const cancellation_token& token)
        -> result<chunk_ack> override;

    auto endpoint() const -> std::string override { return "null://"; }

    [[nodiscard]] auto bytes_received() const -> uint64_t { return bytes_.load(); }

private:
    std::atomic<uint64_t> bytes_{0};
};

/**
 * @brief Format bytes as human-readable string (e.g. "1.50 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Format throughput as human-readable string (e.g. "500.00 MB/s")
 */
auto format_throughput(double bytes_per_second) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 10 * MB;
constexpr std::size_t large_file = 100 * MB;

constexpr std::size_t min_chunk = 64 * KB;
constexpr std::size_t default_chunk = 1 * MB;
constexpr std::size_t max_chunk = 8 * MB;
}  // namespace sizes

}  // namespace chunked_upload::benchmark

#endif  // CHUNKED_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
