/**
 * @file remote_client.h
 * @brief Interfaces for the remote storage protocol client
 */

#ifndef KCENON_FILE_DOWNLOADER_CLIENT_REMOTE_CLIENT_H
#define KCENON_FILE_DOWNLOADER_CLIENT_REMOTE_CLIENT_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "kcenon/file_downloader/core/types.h"

namespace kcenon::file_downloader {

/**
 * @brief Streaming body of a remote file
 *
 * Errors in the connection range (see error_codes.h) are treated as
 * transport failures and may trigger a deferred retry.
 */
class remote_download_stream {
public:
    virtual ~remote_download_stream() = default;

    /**
     * @brief Read the next part of the body
     * @return Number of bytes written into buffer, 0 at end of stream
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    [[nodiscard]] virtual auto has_more() const -> bool = 0;

    /**
     * @brief Content length declared by the server
     */
    [[nodiscard]] virtual auto total_size() const -> std::optional<uint64_t> = 0;

    [[nodiscard]] virtual auto etag() const -> std::optional<std::string> { return std::nullopt; }
    [[nodiscard]] virtual auto mime_type() const -> std::optional<std::string> { return std::nullopt; }

    /**
     * @brief Modification time reported by the server, milliseconds since epoch
     */
    [[nodiscard]] virtual auto modification_timestamp() const -> std::optional<int64_t> {
        return std::nullopt;
    }
};

/**
 * @brief Protocol client bound to one account
 *
 * Implementations may also throw remote_exception or any std::exception.
 */
class remote_client {
public:
    virtual ~remote_client() = default;

    [[nodiscard]] virtual auto open_download(const std::string& remote_path)
        -> result<std::unique_ptr<remote_download_stream>> = 0;

    [[nodiscard]] virtual auto owner() const -> const std::string& = 0;
};

/**
 * @brief Supplies a client for an account
 *
 * Called before every download so credentials are always current.
 */
class remote_client_factory {
public:
    virtual ~remote_client_factory() = default;

    [[nodiscard]] virtual auto client_for(const std::string& owner)
        -> result<std::shared_ptr<remote_client>> = 0;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_CLIENT_REMOTE_CLIENT_H
