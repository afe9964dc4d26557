/**
 * @file upload_cli.cpp
 * @brief Upload a file to an HTTP chunk endpoint with progress reporting
 *
 * This example demonstrates:
 * - Building an upload_registry with an http_chunk_transport
 * - Using progress, completion and error callbacks
 * - Waiting for a session and retrying failed chunks on request
 */

#include <chunked_upload/chunked_upload.h>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

using namespace chunked_upload;

namespace {

/**
 * @brief Format bytes into human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto format_eta(const std::optional<std::chrono::milliseconds>& eta) -> std::string {
    if (!eta) {
        return "--";
    }
    auto seconds = eta->count() / 1000;
    std::ostringstream oss;
    oss << seconds / 60 << "m" << std::setw(2) << std::setfill('0') << seconds % 60 << "s";
    return oss.str();
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Chunked Upload CLI" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -e, --endpoint <url>    Chunk endpoint (default: http://localhost:8080/api/upload/chunk)" << std::endl;
    std::cout << "  -c, --chunk-size <KB>   Chunk size in KiB (default: 1024)" << std::endl;
    std::cout << "  -j, --concurrent <n>    Chunks in flight (default: 3)" << std::endl;
    std::cout << "  -r, --retries <n>       Retries per chunk (default: 3)" << std::endl;
    std::cout << "  --retry-failed <n>      Retry a failed session up to n times (default: 0)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string endpoint_url = "http://localhost:8080/api/upload/chunk";
    std::size_t chunk_kib = 1024;
    std::size_t concurrent = upload_config::default_max_concurrent;
    uint32_t retries = 3;
    int session_retries = 0;
    std::string local_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&](const char* name) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << name << " requires an argument" << std::endl;
                return nullptr;
            }
            return argv[i];
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-e" || arg == "--endpoint") {
            auto value = next_value("--endpoint");
            if (!value) return 1;
            endpoint_url = value;
        } else if (arg == "-c" || arg == "--chunk-size") {
            auto value = next_value("--chunk-size");
            if (!value) return 1;
            chunk_kib = static_cast<std::size_t>(std::stoul(value));
        } else if (arg == "-j" || arg == "--concurrent") {
            auto value = next_value("--concurrent");
            if (!value) return 1;
            concurrent = static_cast<std::size_t>(std::stoul(value));
        } else if (arg == "-r" || arg == "--retries") {
            auto value = next_value("--retries");
            if (!value) return 1;
            retries = static_cast<uint32_t>(std::stoul(value));
        } else if (arg == "--retry-failed") {
            auto value = next_value("--retry-failed");
            if (!value) return 1;
            session_retries = std::stoi(value);
        } else if (arg[0] != '-') {
            local_path = arg;
        }
    }

    if (local_path.empty()) {
        std::cerr << "Error: local_file is required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (!http_chunk_transport::is_available()) {
        std::cerr << "Error: this build has no HTTP transport (network_system not found)"
                  << std::endl;
        return 1;
    }

    http_transport_config http_config;
    http_config.endpoint_url = endpoint_url;
    http_config.max_parallel_requests = concurrent;

    auto registry_result = upload_registry::builder()
        .with_chunk_size(chunk_kib * 1024)
        .with_max_concurrent(concurrent)
        .with_max_retries(retries)
        .with_transport(std::make_shared<http_chunk_transport>(http_config))
        .build();

    if (!registry_result.has_value()) {
        std::cerr << "Failed to create registry: " << registry_result.error().message << std::endl;
        return 1;
    }

    auto& registry = registry_result.value();
    std::mutex output_mutex;

    registry.on_progress([&output_mutex](const progress_report& progress) {
        constexpr int bar_width = 30;
        int filled = static_cast<int>(progress.percent / 100.0 * bar_width);

        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << "\r[";
        for (int i = 0; i < bar_width; ++i) {
            if (i < filled) std::cout << "=";
            else if (i == filled) std::cout << ">";
            else std::cout << " ";
        }
        std::cout << "] " << std::fixed << std::setprecision(1) << progress.percent << "%"
                  << " | " << progress.uploaded_chunks << "/" << progress.total_chunks << " chunks"
                  << " | " << format_bytes(static_cast<uint64_t>(progress.bytes_per_second)) << "/s"
                  << " | ETA " << format_eta(progress.eta)
                  << "     " << std::flush;
    });

    registry.on_complete([&output_mutex](const completion_report& report) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << std::endl << "[Complete] " << report.file_name << " ("
                  << format_bytes(report.size) << ", " << report.chunk_count << " chunks) in "
                  << report.duration_ms << " ms" << std::endl;
        std::cout << "  SHA-256: " << report.whole_file_digest << std::endl;
    });

    registry.on_error([&output_mutex](const error_report& report) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << std::endl << "[Error] " << report.message;
        if (report.chunk_index) {
            std::cout << " (chunk " << *report.chunk_index;
            if (report.retry_count) {
                std::cout << ", " << *report.retry_count << " retries";
            }
            std::cout << ")";
        }
        std::cout << std::endl;
    });

    auto id_result = registry.submit(std::filesystem::path(local_path));
    if (!id_result.has_value()) {
        std::cerr << "Failed to start upload: " << id_result.error().message << std::endl;
        return 1;
    }
    auto id = id_result.value();
    std::cout << "Session " << id.to_string() << " -> " << endpoint_url << std::endl;

    for (int attempt = 0;; ++attempt) {
        auto status = registry.wait(id, std::chrono::hours(24));
        if (!status.has_value()) {
            std::cerr << "Error while waiting: " << status.error().message << std::endl;
            return 1;
        }
        if (status.value() == upload_status::completed) {
            return 0;
        }
        if (status.value() != upload_status::error || attempt >= session_retries) {
            std::cerr << "Upload ended in state " << to_string(status.value()) << std::endl;
            return 1;
        }

        std::cout << "Retrying failed chunks (" << attempt + 1 << "/" << session_retries << ")"
                  << std::endl;
        auto retried = registry.retry(id);
        if (!retried.has_value()) {
            std::cerr << "Retry refused: " << retried.error().message << std::endl;
            return 1;
        }
    }
}
