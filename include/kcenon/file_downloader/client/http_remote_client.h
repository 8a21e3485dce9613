/**
 * @file http_remote_client.h
 * @brief WebDAV-style HTTP implementation of remote_client
 */

#ifndef KCENON_FILE_DOWNLOADER_CLIENT_HTTP_REMOTE_CLIENT_H
#define KCENON_FILE_DOWNLOADER_CLIENT_HTTP_REMOTE_CLIENT_H

#include <chrono>
#include <memory>
#include <string>

#include "kcenon/file_downloader/client/credentials_provider.h"
#include "kcenon/file_downloader/client/remote_client.h"

namespace kcenon::file_downloader {

/**
 * @brief Downloads files with a plain HTTP GET below the account base URL
 *
 * Status mapping:
 * - 401 -> unauthorized
 * - 403 -> forbidden
 * - 404 -> file_not_found
 * - 503 -> service_unavailable
 * - other 5xx -> server_error
 * - any other non-2xx -> unhandled_http_code
 *
 * Transport failures throw remote_exception(connection_failed).
 * Without network_system every download fails with not_initialized.
 *
 * @note open_download() fetches the whole body before it returns and the
 *       stream then reads from memory. Cancelling the operation therefore
 *       takes effect only after the network transfer is complete, and the
 *       response must fit in memory.
 */
class http_remote_client : public remote_client {
public:
    http_remote_client(std::string owner, account_credentials credentials,
                       std::chrono::milliseconds timeout = std::chrono::seconds(30));
    ~http_remote_client() override;

    http_remote_client(const http_remote_client&) = delete;
    auto operator=(const http_remote_client&) -> http_remote_client& = delete;

    [[nodiscard]] auto open_download(const std::string& remote_path)
        -> result<std::unique_ptr<remote_download_stream>> override;

    [[nodiscard]] auto owner() const -> const std::string& override;

    /**
     * @brief Full URL of a remote path, slashes kept
     */
    [[nodiscard]] auto url_for(const std::string& remote_path) const -> std::string;

    /**
     * @brief Value of the Authorization header
     */
    [[nodiscard]] auto authorization() const -> std::string;

    /**
     * @brief Error code for a non-2xx HTTP status
     */
    [[nodiscard]] static auto map_status(int status_code) -> error_code;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Creates a fresh http_remote_client per call
 */
class http_remote_client_factory : public remote_client_factory {
public:
    explicit http_remote_client_factory(
        std::shared_ptr<credentials_provider> credentials,
        std::chrono::milliseconds timeout = std::chrono::seconds(30));

    [[nodiscard]] auto client_for(const std::string& owner)
        -> result<std::shared_ptr<remote_client>> override;

private:
    std::shared_ptr<credentials_provider> credentials_;
    std::chrono::milliseconds timeout_;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_CLIENT_HTTP_REMOTE_CLIENT_H
