/**
 * @file test_fixtures.h
 * @brief Shared fixtures: temp files, memory sources, scripted transport
 */

#ifndef CHUNKED_UPLOAD_TEST_FIXTURES_H
#define CHUNKED_UPLOAD_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <chunked_upload/chunked_upload.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <thread>
#include <vector>

namespace chunked_upload::test {

using namespace std::chrono_literals;

inline auto random_bytes(std::size_t size, uint32_t seed = 42) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);
    std::mt19937 gen(seed);  // Fixed seed for reproducibility
    std::uniform_int_distribution<> dis(0, 255);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }
    return data;
}

inline auto to_bytes(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> bytes(text.size());
    if (!text.empty()) {
        std::memcpy(bytes.data(), text.data(), text.size());
    }
    return bytes;
}

inline auto make_source(const std::string& name, std::size_t size, uint32_t seed = 42)
    -> std::shared_ptr<memory_byte_source> {
    return std::make_shared<memory_byte_source>(name, random_bytes(size, seed));
}

/**
 * @brief In-memory source whose bytes can be altered after planning
 */
class mutable_memory_source : public byte_source {
public:
    mutable_memory_source(std::string name, std::vector<std::byte> data)
        : name_(std::move(name)), data_(std::move(data)) {}

    auto name() const -> std::string override { return name_; }

    auto size() const -> uint64_t override {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    auto read(uint64_t offset, std::span<std::byte> out) const -> result<std::size_t> override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (offset > data_.size()) {
            return unexpected{error{error_code::file_read_error, "offset out of range"}};
        }
        auto count = std::min<std::size_t>(out.size(), data_.size() - offset);
        std::memcpy(out.data(), data_.data() + offset, count);

        if (pending_flip_ && ++reads_since_armed_ >= flip_after_reads_) {
            data_[*pending_flip_] ^= std::byte{0xFF};
            pending_flip_.reset();
        }
        return count;
    }

    void flip_byte(std::size_t offset) {
        std::lock_guard<std::mutex> lock(mutex_);
        data_[offset] ^= std::byte{0xFF};
    }

    /**
     * @brief Flip a byte once `reads` more reads have been served
     */
    void flip_byte_after_reads(std::size_t offset, std::size_t reads) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_flip_ = offset;
        flip_after_reads_ = reads;
        reads_since_armed_ = 0;
    }

private:
    std::string name_;
    mutable std::vector<std::byte> data_;
    mutable std::mutex mutex_;
    mutable std::optional<std::size_t> pending_flip_;
    std::size_t flip_after_reads_{0};
    mutable std::size_t reads_since_armed_{0};
};

/**
 * @brief chunk_transport double with scripted failures
 *
 * Records every attempt, tracks the peak number of concurrent sends, checks
 * chunk digests like a real endpoint would, and can hold requests at a gate.
 */
class scripted_transport : public chunk_transport {
public:
    /**
     * @brief Make the next `count` attempts for a chunk fail
     */
    void fail_times(uint64_t index, uint32_t count,
                    error_code code = error_code::transport_error) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[index] = {count, code};
    }

    /**
     * @brief Make the next `count` attempts return success=false
     */
    void reject_times(uint64_t index, uint32_t count) {
        std::lock_guard<std::mutex> lock(mutex_);
        rejections_[index] = count;
    }

    void set_latency(std::chrono::milliseconds latency) {
        std::lock_guard<std::mutex> lock(mutex_);
        latency_ = latency;
    }

    /**
     * @brief Hold every send until open_gate()
     */
    void close_gate() {
        std::lock_guard<std::mutex> lock(mutex_);
        gate_open_ = false;
    }

    void open_gate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            gate_open_ = true;
        }
        cv_.notify_all();
    }

    auto send(const chunk_request& request, const cancellation_token& token)
        -> result<chunk_ack> override {
        if (token.is_cancelled()) {
            return unexpected{error{error_code::transfer_cancelled, "cancelled"}};
        }

        std::chrono::milliseconds latency{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++attempts_[request.chunk_index];
            ++total_attempts_;
            ++in_flight_;
            peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
            latency = latency_;
        }
        cv_.notify_all();

        auto leave = [this]() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                --in_flight_;
            }
            cv_.notify_all();
        };

        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (!gate_open_) {
                if (token.is_cancelled()) {
                    lock.unlock();
                    leave();
                    return unexpected{error{error_code::transfer_cancelled, "cancelled"}};
                }
                cv_.wait_for(lock, 1ms);
            }
        }

        if (latency.count() > 0 && token.wait_for(latency)) {
            leave();
            return unexpected{error{error_code::transfer_cancelled, "cancelled"}};
        }

        if (digest::sha256(request.chunk_bytes) != request.chunk_digest) {
            leave();
            chunk_ack ack;
            ack.status_code = 422;
            ack.detail = "checksum mismatch";
            ack.checksum_mismatch = true;
            return ack;
        }

        std::optional<error> scripted_error;
        bool rejected = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto failure = failures_.find(request.chunk_index);
            if (failure != failures_.end() && failure->second.first > 0) {
                --failure->second.first;
                scripted_error = error{failure->second.second,
                                       "HTTP 500: scripted failure"};
            }
            auto rejection = rejections_.find(request.chunk_index);
            if (!scripted_error && rejection != rejections_.end() && rejection->second > 0) {
                --rejection->second;
                rejected = true;
            }
            if (!scripted_error && !rejected) {
                received_[request.chunk_index].assign(request.chunk_bytes.begin(),
                                                      request.chunk_bytes.end());
                file_names_[request.chunk_index] = request.file_name;
                total_chunks_seen_ = request.total_chunks;
            }
        }
        leave();

        if (scripted_error) {
            return unexpected{*scripted_error};
        }

        chunk_ack ack;
        ack.status_code = 200;
        ack.success = !rejected;
        if (rejected) {
            ack.detail = "scripted rejection";
        }
        return ack;
    }

    auto endpoint() const -> std::string override { return "scripted://test"; }

    auto attempts(uint64_t index) const -> uint32_t {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = attempts_.find(index);
        return it == attempts_.end() ? 0 : it->second;
    }

    auto total_attempts() const -> uint64_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_attempts_;
    }

    auto peak_in_flight() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_in_flight_;
    }

    auto in_flight() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_flight_;
    }

    auto received_count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_.size();
    }

    /**
     * @brief Concatenate received chunks in index order
     */
    auto assembled() const -> std::vector<std::byte> {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::byte> out;
        for (const auto& [index, bytes] : received_) {
            out.insert(out.end(), bytes.begin(), bytes.end());
        }
        return out;
    }

    /**
     * @brief Wait until at least `count` sends are in progress
     */
    auto wait_for_in_flight(std::size_t count, std::chrono::milliseconds timeout) -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return in_flight_ >= count; });
    }

    /**
     * @brief Wait until at least `count` attempts were made in total
     */
    auto wait_for_attempts(uint64_t count, std::chrono::milliseconds timeout) -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return total_attempts_ >= count; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::map<uint64_t, std::pair<uint32_t, error_code>> failures_;
    std::map<uint64_t, uint32_t> rejections_;
    std::map<uint64_t, uint32_t> attempts_;
    std::map<uint64_t, std::vector<std::byte>> received_;
    std::map<uint64_t, std::string> file_names_;
    uint64_t total_chunks_seen_{0};
    uint64_t total_attempts_{0};
    std::size_t in_flight_{0};
    std::size_t peak_in_flight_{0};
    std::chrono::milliseconds latency_{0};
    bool gate_open_{true};
};

/**
 * @brief Thread-safe collector of session events
 */
class event_recorder {
public:
    auto callbacks() -> upload_callbacks {
        upload_callbacks cb;
        cb.on_progress = [this](const progress_report& r) { record_progress(r); };
        cb.on_complete = [this](const completion_report& r) { record_complete(r); };
        cb.on_error = [this](const error_report& r) { record_error(r); };
        return cb;
    }

    void attach(upload_registry& registry) {
        registry.on_progress([this](const progress_report& r) { record_progress(r); });
        registry.on_complete([this](const completion_report& r) { record_complete(r); });
        registry.on_error([this](const error_report& r) { record_error(r); });
    }

    void record_progress(const progress_report& report) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            progress_.push_back(report);
        }
        cv_.notify_all();
    }

    void record_complete(const completion_report& report) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            completions_.push_back(report);
        }
        cv_.notify_all();
    }

    void record_error(const error_report& report) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            errors_.push_back(report);
        }
        cv_.notify_all();
    }

    auto wait_for_completions(std::size_t count, std::chrono::milliseconds timeout) -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return completions_.size() >= count; });
    }

    auto wait_for_errors(std::size_t count, std::chrono::milliseconds timeout) -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return errors_.size() >= count; });
    }

    auto progress() const -> std::vector<progress_report> {
        std::lock_guard<std::mutex> lock(mutex_);
        return progress_;
    }

    auto completions() const -> std::vector<completion_report> {
        std::lock_guard<std::mutex> lock(mutex_);
        return completions_;
    }

    auto errors() const -> std::vector<error_report> {
        std::lock_guard<std::mutex> lock(mutex_);
        return errors_;
    }

    auto event_count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return progress_.size() + completions_.size() + errors_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<progress_report> progress_;
    std::vector<completion_report> completions_;
    std::vector<error_report> errors_;
};

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("chunked_upload_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size, uint32_t seed = 42)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        auto data = random_bytes(size, seed);
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        return path;
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief Registry wired to a scripted transport with millisecond backoff
 */
class RegistryFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        transport_ = std::make_shared<scripted_transport>();
        pool_ = std::make_shared<adapters::basic_upload_pool>(8);
    }

    void TearDown() override {
        registry_.reset();
        pool_.reset();
        TempDirectoryFixture::TearDown();
    }

    auto make_builder() -> upload_registry::builder {
        upload_registry::builder b;
        b.with_chunk_size(1024 * 1024)
            .with_max_concurrent(3)
            .with_max_retries(3)
            .with_backoff(1ms, 5ms)
            .with_transport(transport_)
            .with_thread_pool(pool_);
        return b;
    }

    void build_registry(upload_registry::builder b) {
        auto built = b.build();
        ASSERT_TRUE(built.has_value()) << built.error().message;
        registry_ = std::make_unique<upload_registry>(std::move(built.value()));
        recorder_.attach(*registry_);
    }

    void build_registry() { build_registry(make_builder()); }

    std::shared_ptr<scripted_transport> transport_;
    std::shared_ptr<adapters::basic_upload_pool> pool_;
    std::unique_ptr<upload_registry> registry_;
    event_recorder recorder_;
};

}  // namespace chunked_upload::test

#endif  // CHUNKED_UPLOAD_TEST_FIXTURES_H
