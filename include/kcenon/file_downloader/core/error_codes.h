/**
 * @file error_codes.h
 * @brief Error code range predicates for file_downloader
 * @version 0.1.0
 *
 * Error code ranges:
 * - -100 to -119: Request (validation) Errors
 * - -120 to -139: Connection Errors
 * - -140 to -159: Remote Errors
 * - -160 to -179: Transfer Errors
 * - -180 to -199: Local Storage Errors
 * - -200 to -219: Internal Errors
 */

#ifndef KCENON_FILE_DOWNLOADER_CORE_ERROR_CODES_H
#define KCENON_FILE_DOWNLOADER_CORE_ERROR_CODES_H

#include <cstdint>

#include "kcenon/file_downloader/core/types.h"

namespace kcenon::file_downloader {

[[nodiscard]] constexpr auto to_int(error_code code) noexcept -> int32_t {
    return static_cast<int32_t>(code);
}

/**
 * @brief Check if error code is in request error range
 */
[[nodiscard]] constexpr auto is_request_error(error_code code) noexcept -> bool {
    return to_int(code) <= -100 && to_int(code) >= -119;
}

/**
 * @brief Check if error code is in connection error range
 */
[[nodiscard]] constexpr auto is_connection_error(error_code code) noexcept -> bool {
    return to_int(code) <= -120 && to_int(code) >= -139;
}

/**
 * @brief Check if error code is in remote error range
 */
[[nodiscard]] constexpr auto is_remote_error(error_code code) noexcept -> bool {
    return to_int(code) <= -140 && to_int(code) >= -159;
}

/**
 * @brief Check if error code is in transfer error range
 */
[[nodiscard]] constexpr auto is_transfer_error(error_code code) noexcept -> bool {
    return to_int(code) <= -160 && to_int(code) >= -179;
}

/**
 * @brief Check if error code is in local storage error range
 */
[[nodiscard]] constexpr auto is_storage_error(error_code code) noexcept -> bool {
    return to_int(code) <= -180 && to_int(code) >= -199;
}

/**
 * @brief Check if error code is in internal error range
 */
[[nodiscard]] constexpr auto is_internal_error(error_code code) noexcept -> bool {
    return to_int(code) <= -200 && to_int(code) >= -219;
}

/**
 * @brief Check if the error requires the user to refresh credentials
 */
[[nodiscard]] constexpr auto is_authorization_error(error_code code) noexcept -> bool {
    return code == error_code::unauthorized;
}

/**
 * @brief Check if the error means the network is (temporarily) unusable
 *
 * SSL failures are connection-range errors but are not transient.
 */
[[nodiscard]] constexpr auto is_transient_network_error(error_code code) noexcept -> bool {
    switch (code) {
        case error_code::no_network_connection:
        case error_code::connection_failed:
        case error_code::connection_timeout:
        case error_code::connection_lost:
        case error_code::host_not_available:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Check if error is a client-side issue
 */
[[nodiscard]] constexpr auto is_client_error(error_code code) noexcept -> bool {
    return is_request_error(code) || is_storage_error(code);
}

/**
 * @brief Check if error is a server-side issue
 */
[[nodiscard]] constexpr auto is_server_error(error_code code) noexcept -> bool {
    return is_remote_error(code);
}

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_CORE_ERROR_CODES_H
