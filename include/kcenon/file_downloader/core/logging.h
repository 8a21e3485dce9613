// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/file_downloader/config/feature_flags.h"

#if FILE_DOWNLOADER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::file_downloader {

/**
 * @brief Log categories for file downloader
 */
struct log_category {
    static constexpr std::string_view queue = "file_downloader.queue";
    static constexpr std::string_view worker = "file_downloader.worker";
    static constexpr std::string_view operation = "file_downloader.operation";
    static constexpr std::string_view retry = "file_downloader.retry";
    static constexpr std::string_view notify = "file_downloader.notify";
    static constexpr std::string_view store = "file_downloader.store";
    static constexpr std::string_view client = "file_downloader.client";
};

/**
 * @brief Log levels for file downloader
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
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
    bool mask_accounts = false;
    std::string mask_char = "*";
    size_t visible_chars = 3;

    /**
     * @brief Create config with all masking enabled
     */
    static masking_config all_masked() {
        return {true, true, "*", 3};
    }

    /**
     * @brief Create config with no masking
     */
    static masking_config none() {
        return {false, false, "*", 3};
    }
};

/**
 * @brief Masks remote paths and account names before they reach a log sink
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    /**
     * @brief Mask every directory component of a path, keep the file name
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of('/');
        if (last_sep == std::string::npos || last_sep == 0) {
            return path;
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        return masked_dir + path.substr(last_sep);
    }

    /**
     * @brief Mask an account name, keeping the first visible_chars and any host part
     */
    [[nodiscard]] auto mask_account(const std::string& account) const -> std::string {
        if (!config_.mask_accounts || account.empty()) {
            return account;
        }

        auto at_pos = account.find('@');
        std::string user = account.substr(0, at_pos);
        std::string host = at_pos == std::string::npos ? "" : account.substr(at_pos);

        if (user.size() <= config_.visible_chars) {
            return std::string(user.size(), config_.mask_char[0]) + host;
        }
        return user.substr(0, config_.visible_chars) +
               std::string(user.size() - config_.visible_chars, config_.mask_char[0]) +
               host;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    masking_config config_;
};

namespace detail {

[[nodiscard]] inline auto escape_json_string(const std::string& input) -> std::string {
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
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
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
 * @brief Structured log context for download operations
 */
struct download_log_context {
    std::string account;
    std::string remote_path;
    std::optional<std::string> local_path;
    std::optional<int64_t> file_id;
    std::optional<int64_t> file_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<int32_t> result_code;
    std::optional<int32_t> job_id;
    std::optional<std::string> error_message;

    /**
     * @brief Convert context to JSON string
     */
    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    /**
     * @brief Convert context to JSON string with optional masking
     */
    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_int = [&](const char* name, int64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!account.empty()) {
            add_field("account", masker ? masker->mask_account(account) : account);
        }
        if (!remote_path.empty()) {
            add_field("remote_path", masker ? masker->mask_path(remote_path) : remote_path);
        }
        if (local_path) {
            add_field("local_path", masker ? masker->mask_path(*local_path) : *local_path);
        }
        if (file_id) add_int("file_id", *file_id);
        if (file_size) add_int("size", *file_size);
        if (bytes_transferred) add_int("bytes_transferred", static_cast<int64_t>(*bytes_transferred));
        if (result_code) add_int("result_code", *result_code);
        if (job_id) add_int("job_id", *job_id);
        if (error_message) add_field("error_message", *error_message);

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
 * @brief File downloader logging interface
 */
class file_downloader_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const download_log_context*)>;

    file_downloader_logger() = default;
    ~file_downloader_logger() = default;

    file_downloader_logger(const file_downloader_logger&) = delete;
    file_downloader_logger& operator=(const file_downloader_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     * Called by file_downloader::builder::build().
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if FILE_DOWNLOADER_USE_LOGGER_SYSTEM
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

    /**
     * @brief Shutdown the logger
     */
    void shutdown() {
#if FILE_DOWNLOADER_USE_LOGGER_SYSTEM
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
#if FILE_DOWNLOADER_USE_LOGGER_SYSTEM
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

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Set custom log callback, invoked for every enabled message
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const download_log_context* context = nullptr,
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

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        auto formatted = format_message(format, level, category, message, context,
                                        current_masker, file, line);
        write(level, formatted, file, line, function);
    }

    /**
     * @brief Render one message in the given output format
     *
     * JSON output is a single object with timestamp, level, category and
     * message, followed by the context fields and the source location.
     */
    [[nodiscard]] static auto format_message(log_output_format format,
                                             log_level level,
                                             std::string_view category,
                                             std::string_view message,
                                             const download_log_context* context,
                                             const sensitive_info_masker& masker,
                                             const char* file = nullptr,
                                             int line = 0) -> std::string {
        std::ostringstream oss;
        if (format == log_output_format::text) {
            oss << "[" << category << "] " << message;
            if (context) {
                oss << " " << context->to_json_with_masking(&masker);
            }
            return oss.str();
        }

        oss << "{\"timestamp\":\"" << get_iso8601_timestamp() << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\"" << detail::escape_json_string(std::string(message)) << "\"";
        if (context) {
            auto ctx_json = context->to_json_with_masking(&masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }
        if (file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json_string(file) << "\"";
            if (line > 0) {
                oss << ",\"line\":" << line;
            }
            oss << "}";
        }
        oss << "}";
        return oss.str();
    }

    /**
     * @brief Flush pending logs
     */
    void flush() {
#if FILE_DOWNLOADER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write(log_level level,
               const std::string& formatted,
               [[maybe_unused]] const char* file,
               [[maybe_unused]] int line,
               [[maybe_unused]] const char* function) {
#if FILE_DOWNLOADER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), formatted, file, line, function);
            } else {
                logger_->log(to_logger_level(level), formatted);
            }
            return;
        }
#endif
        std::ostringstream oss;
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] " << formatted;
        output_to_stderr(oss.str());
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if FILE_DOWNLOADER_USE_LOGGER_SYSTEM
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
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    static auto get_timestamp() -> std::string {
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
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline file_downloader_logger& get_logger() {
    static file_downloader_logger instance;
    return instance;
}

// Logging macros for convenience
#define FD_LOG(level, category, message) \
    kcenon::file_downloader::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define FD_LOG_CTX(level, category, message, context) \
    kcenon::file_downloader::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define FD_LOG_TRACE(category, message) \
    FD_LOG(kcenon::file_downloader::log_level::trace, category, message)

#define FD_LOG_DEBUG(category, message) \
    FD_LOG(kcenon::file_downloader::log_level::debug, category, message)

#define FD_LOG_INFO(category, message) \
    FD_LOG(kcenon::file_downloader::log_level::info, category, message)

#define FD_LOG_WARN(category, message) \
    FD_LOG(kcenon::file_downloader::log_level::warn, category, message)

#define FD_LOG_ERROR(category, message) \
    FD_LOG(kcenon::file_downloader::log_level::error, category, message)

#define FD_LOG_FATAL(category, message) \
    FD_LOG(kcenon::file_downloader::log_level::fatal, category, message)

#define FD_LOG_DEBUG_CTX(category, message, ctx) \
    FD_LOG_CTX(kcenon::file_downloader::log_level::debug, category, message, ctx)

#define FD_LOG_INFO_CTX(category, message, ctx) \
    FD_LOG_CTX(kcenon::file_downloader::log_level::info, category, message, ctx)

#define FD_LOG_WARN_CTX(category, message, ctx) \
    FD_LOG_CTX(kcenon::file_downloader::log_level::warn, category, message, ctx)

#define FD_LOG_ERROR_CTX(category, message, ctx) \
    FD_LOG_CTX(kcenon::file_downloader::log_level::error, category, message, ctx)

} // namespace kcenon::file_downloader
