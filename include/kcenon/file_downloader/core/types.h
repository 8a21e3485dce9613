/**
 * @file types.h
 * @brief Core type definitions for file_downloader
 */

#ifndef KCENON_FILE_DOWNLOADER_CORE_TYPES_H
#define KCENON_FILE_DOWNLOADER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::file_downloader {

/**
 * @brief Error codes for download operations
 *
 * Grouped in ranges, see error_codes.h for the range predicates.
 */
enum class error_code {
    success = 0,

    // Request errors (-100 to -119)
    invalid_request = -100,
    missing_account = -101,
    missing_file = -102,
    invalid_remote_path = -103,
    account_not_found = -104,

    // Connection errors (-120 to -139)
    no_network_connection = -120,
    connection_failed = -121,
    connection_timeout = -122,
    connection_lost = -123,
    host_not_available = -124,
    ssl_error = -125,

    // Remote errors (-140 to -159)
    unauthorized = -140,
    forbidden = -141,
    file_not_found = -142,
    server_error = -143,
    service_unavailable = -144,
    unhandled_http_code = -145,

    // Transfer errors (-160 to -179)
    cancelled = -160,
    incomplete_transfer = -161,
    unknown_error = -162,

    // Local storage errors (-180 to -199)
    local_storage_full = -180,
    local_storage_not_moved = -181,
    local_file_write_error = -182,
    record_store_error = -183,
    record_not_found = -184,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
    already_running = -202,
    not_running = -203,
    invalid_configuration = -204,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_request:
            return "invalid request";
        case error_code::missing_account:
            return "account not provided";
        case error_code::missing_file:
            return "file not provided";
        case error_code::invalid_remote_path:
            return "invalid remote path";
        case error_code::account_not_found:
            return "account not found";
        case error_code::no_network_connection:
            return "no network connection";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::host_not_available:
            return "host not available";
        case error_code::ssl_error:
            return "ssl error";
        case error_code::unauthorized:
            return "unauthorized";
        case error_code::forbidden:
            return "forbidden";
        case error_code::file_not_found:
            return "file not found";
        case error_code::server_error:
            return "server error";
        case error_code::service_unavailable:
            return "service unavailable";
        case error_code::unhandled_http_code:
            return "unhandled http code";
        case error_code::cancelled:
            return "cancelled";
        case error_code::incomplete_transfer:
            return "incomplete transfer";
        case error_code::unknown_error:
            return "unknown error";
        case error_code::local_storage_full:
            return "local storage full";
        case error_code::local_storage_not_moved:
            return "local storage not moved";
        case error_code::local_file_write_error:
            return "local file write error";
        case error_code::record_store_error:
            return "record store error";
        case error_code::record_not_found:
            return "record not found";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::already_running:
            return "already running";
        case error_code::not_running:
            return "not running";
        case error_code::invalid_configuration:
            return "invalid configuration";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_CORE_TYPES_H
