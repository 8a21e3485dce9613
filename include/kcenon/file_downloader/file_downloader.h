/**
 * @file file_downloader.h
 * @brief Main header for the file_downloader library
 * @version 0.1.0
 *
 * This is the primary include file for the file_downloader library.
 * Include this header to access the download queue and its collaborators.
 *
 * @code
 * #include <kcenon/file_downloader/file_downloader.h>
 *
 * using namespace kcenon::file_downloader;
 *
 * auto credentials = std::make_shared<static_credentials_provider>();
 * auto downloader = file_downloader::builder()
 *     .with_storage_root("/var/lib/app/files")
 *     .with_client_factory(std::make_shared<http_remote_client_factory>(credentials))
 *     .with_account_registry(accounts)
 *     .with_record_store_factory(
 *         std::make_shared<json_file_record_store_factory>("/var/lib/app/state"))
 *     .build();
 * @endcode
 */

#ifndef KCENON_FILE_DOWNLOADER_FILE_DOWNLOADER_H
#define KCENON_FILE_DOWNLOADER_FILE_DOWNLOADER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/file_downloader/core/types.h"
#include "kcenon/file_downloader/core/error_codes.h"
#include "kcenon/file_downloader/core/remote_file.h"
#include "kcenon/file_downloader/core/download_result.h"
#include "kcenon/file_downloader/core/download_operation.h"
#include "kcenon/file_downloader/core/storage_layout.h"

// Protocol client
#include "kcenon/file_downloader/client/remote_client.h"
#include "kcenon/file_downloader/client/credentials_provider.h"
#include "kcenon/file_downloader/client/http_remote_client.h"

// Service
#include "kcenon/file_downloader/service/file_downloader.h"
#include "kcenon/file_downloader/service/json_file_record_store.h"
#include "kcenon/file_downloader/service/retry_classifier.h"

// Adapters
#include "kcenon/file_downloader/adapters/thread_pool_adapter.h"

namespace kcenon::file_downloader {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_FILE_DOWNLOADER_H
