/**
 * @file remote_file.h
 * @brief Remote file descriptor and download request types
 */

#ifndef KCENON_FILE_DOWNLOADER_CORE_REMOTE_FILE_H
#define KCENON_FILE_DOWNLOADER_CORE_REMOTE_FILE_H

#include <cstdint>
#include <optional>
#include <string>

#include "kcenon/file_downloader/core/types.h"

namespace kcenon::file_downloader {

/**
 * @brief Describes a file (or directory) on the remote server
 *
 * Remote paths are absolute and directories end with '/'.
 */
struct remote_file {
    std::optional<int64_t> id;          ///< Local database id of the file
    std::optional<int64_t> parent_id;   ///< Local database id of the parent folder
    std::string remote_path;            ///< Absolute path on the server
    int64_t length = -1;                ///< Size in bytes, -1 when unknown
    int64_t creation_timestamp = 0;     ///< Milliseconds since epoch
    int64_t modification_timestamp = 0; ///< Milliseconds since epoch
    std::string remote_id;              ///< Server side file id
    std::string etag;
    std::string mime_type;
    std::string storage_path;           ///< Local copy, empty when not downloaded

    [[nodiscard]] auto is_directory() const -> bool {
        return !remote_path.empty() && remote_path.back() == '/';
    }

    /**
     * @brief Last path component, without the trailing '/' of directories
     */
    [[nodiscard]] auto file_name() const -> std::string {
        auto path = remote_path;
        if (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
        auto pos = path.find_last_of('/');
        return pos == std::string::npos ? path : path.substr(pos + 1);
    }

    /**
     * @brief True if any '/'-separated component is "." or ".."
     */
    [[nodiscard]] static auto has_relative_component(const std::string& path) -> bool {
        std::size_t start = 0;
        while (start <= path.size()) {
            auto end = path.find('/', start);
            if (end == std::string::npos) {
                end = path.size();
            }
            auto component = path.substr(start, end - start);
            if (component == "." || component == "..") {
                return true;
            }
            start = end + 1;
        }
        return false;
    }

    [[nodiscard]] auto validate() const -> result<void> {
        if (!id) {
            return unexpected{error{error_code::missing_file, "file id missing"}};
        }
        if (remote_path.empty() || remote_path.front() != '/') {
            return unexpected{error{error_code::invalid_remote_path,
                "remote path must be absolute: '" + remote_path + "'"}};
        }
        if (has_relative_component(remote_path)) {
            return unexpected{error{error_code::invalid_remote_path,
                "remote path must not contain '.' or '..': '" + remote_path + "'"}};
        }
        return {};
    }
};

/**
 * @brief Inbound request for downloading one file
 */
struct download_request {
    std::string owner;              ///< Account name
    remote_file file;
    bool is_available_offline = false;
    bool is_retry = false;

    [[nodiscard]] auto validate() const -> result<void> {
        if (owner.empty()) {
            return unexpected{error{error_code::missing_account, "account not provided"}};
        }
        return file.validate();
    }
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_CORE_REMOTE_FILE_H
