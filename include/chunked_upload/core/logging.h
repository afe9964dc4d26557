// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include <chunked_upload/config/feature_flags.h>

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace chunked_upload {

/**
 * @brief Log categories for the upload engine
 */
struct log_category {
    static constexpr std::string_view planner = "chunked_upload.planner";
    static constexpr std::string_view limiter = "chunked_upload.limiter";
    static constexpr std::string_view transport = "chunked_upload.transport";
    static constexpr std::string_view retry = "chunked_upload.retry";
    static constexpr std::string_view session = "chunked_upload.session";
    static constexpr std::string_view registry = "chunked_upload.registry";
    static constexpr std::string_view progress = "chunked_upload.progress";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for sensitive information masking
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_filenames = false;
    bool mask_endpoints = false;
    char mask_char = '*';
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, true, '*', 4};
    }

    static masking_config none() {
        return {false, false, false, '*', 4};
    }
};

/**
 * @brief Masks local paths, file names and endpoint hosts in log output
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    /**
     * @brief Mask every absolute path found in a free-form message
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_paths) {
            return input;
        }

        static const std::regex path_pattern(
            R"((?:\/[a-zA-Z0-9._-]+)+|(?:[a-zA-Z]:\\(?:[a-zA-Z0-9._-]+\\?)+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_path(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return config_.mask_filenames ? mask_filename(path) : path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return mask_filename(path);
        }

        std::string masked_dir(last_sep, config_.mask_char);
        std::string filename = path.substr(last_sep + 1);

        if (config_.mask_filenames) {
            filename = mask_filename(filename);
        }

        return masked_dir + "/" + filename;
    }

    /**
     * @brief Mask the host part of an endpoint URL, keeping scheme and path
     */
    [[nodiscard]] auto mask_endpoint(const std::string& url) const -> std::string {
        if (!config_.mask_endpoints || url.empty()) {
            return url;
        }

        auto scheme_end = url.find("://");
        auto host_begin = scheme_end == std::string::npos ? 0 : scheme_end + 3;
        auto host_end = url.find_first_of(":/", host_begin);
        if (host_end == std::string::npos) {
            host_end = url.size();
        }

        return url.substr(0, host_begin) +
               std::string(host_end - host_begin, config_.mask_char) +
               url.substr(host_end);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = config;
    }

private:
    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string {
        if (!config_.mask_filenames || filename.size() <= config_.visible_chars) {
            return filename;
        }

        auto dot_pos = filename.find_last_of('.');
        std::string name = filename;
        std::string ext;
        if (dot_pos != std::string::npos && dot_pos > 0) {
            name = filename.substr(0, dot_pos);
            ext = filename.substr(dot_pos);
        }

        if (name.size() <= config_.visible_chars) {
            return filename;
        }

        return name.substr(0, config_.visible_chars) +
               std::string(name.size() - config_.visible_chars, config_.mask_char) + ext;
    }

    masking_config config_;
};

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for upload operations
 */
struct upload_log_context {
    std::string session_id;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_uploaded;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> total_chunks;
    std::optional<uint32_t> retry_count;
    std::optional<double> progress_percent;
    std::optional<double> rate_mbps;
    std::optional<double> eta_seconds;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;
    std::optional<std::string> endpoint;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto add_double = [&](const char* name, double value) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2);
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!session_id.empty()) add_field("session_id", session_id);
        if (!filename.empty()) {
            add_field("filename", masker ? masker->mask_path(filename) : filename);
        }
        if (file_size) add_uint("size", *file_size);
        if (bytes_uploaded) add_uint("bytes_uploaded", *bytes_uploaded);
        if (chunk_index) add_uint("chunk_index", *chunk_index);
        if (total_chunks) add_uint("total_chunks", *total_chunks);
        if (retry_count) add_uint("retry_count", *retry_count);
        if (progress_percent) add_double("progress_percent", *progress_percent);
        if (rate_mbps) add_double("rate_mbps", *rate_mbps);
        if (eta_seconds) add_double("eta_seconds", *eta_seconds);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }
        if (endpoint) {
            add_field("endpoint", masker ? masker->mask_endpoint(*endpoint) : *endpoint);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<upload_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            std::string file = masker ? masker->mask_path(*source_file) : *source_file;
            oss << ",\"source\":{\"file\":\"" << detail::escape_json_string(file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Process-wide logger for the upload engine
 *
 * Routes through kcenon logger_system when the build links it, otherwise
 * writes to stderr. A user callback sees every record that passes the level
 * filter.
 */
class upload_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const upload_log_context*)>;

    upload_logger() = default;
    ~upload_logger() = default;

    upload_logger(const upload_logger&) = delete;
    upload_logger& operator=(const upload_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Subsequent calls are no-ops. Called when a registry is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(config);
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Suppress the default sink (stderr or logger_system)
     *
     * The callback still receives records. Used by tests and embedders
     * that forward records elsewhere.
     */
    void set_sink_enabled(bool enabled) { sink_enabled_.store(enabled); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        if (!sink_enabled_.load()) return;

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string rendered;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = get_iso8601_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            if (function) entry.function_name = function;
            rendered = entry.to_json_with_masking(&masker);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&masker);
            }
            rendered = oss.str();
        }

        write(level, rendered, file, line, function);
    }

    void flush() {
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write(log_level level, const std::string& rendered,
               [[maybe_unused]] const char* file,
               [[maybe_unused]] int line,
               [[maybe_unused]] const char* function) {
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), rendered, file, line, function);
            } else {
                logger_->log(to_logger_level(level), rendered);
            }
            return;
        }
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << get_local_timestamp() << " [" << log_level_to_string(level) << "] "
                  << rendered << "\n";
    }

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    [[nodiscard]] static auto get_local_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> sink_enabled_{true};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline upload_logger& get_logger() {
    static upload_logger instance;
    return instance;
}

// Logging macros for convenience
#define CU_LOG(level, category, message) \
    chunked_upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define CU_LOG_CTX(level, category, message, context) \
    chunked_upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define CU_LOG_TRACE(category, message) \
    CU_LOG(chunked_upload::log_level::trace, category, message)

#define CU_LOG_DEBUG(category, message) \
    CU_LOG(chunked_upload::log_level::debug, category, message)

#define CU_LOG_INFO(category, message) \
    CU_LOG(chunked_upload::log_level::info, category, message)

#define CU_LOG_WARN(category, message) \
    CU_LOG(chunked_upload::log_level::warn, category, message)

#define CU_LOG_ERROR(category, message) \
    CU_LOG(chunked_upload::log_level::error, category, message)

#define CU_LOG_TRACE_CTX(category, message, ctx) \
    CU_LOG_CTX(chunked_upload::log_level::trace, category, message, ctx)

#define CU_LOG_DEBUG_CTX(category, message, ctx) \
    CU_LOG_CTX(chunked_upload::log_level::debug, category, message, ctx)

#define CU_LOG_INFO_CTX(category, message, ctx) \
    CU_LOG_CTX(chunked_upload::log_level::info, category, message, ctx)

#define CU_LOG_WARN_CTX(category, message, ctx) \
    CU_LOG_CTX(chunked_upload::log_level::warn, category, message, ctx)

#define CU_LOG_ERROR_CTX(category, message, ctx) \
    CU_LOG_CTX(chunked_upload::log_level::error, category, message, ctx)

}  // namespace chunked_upload
