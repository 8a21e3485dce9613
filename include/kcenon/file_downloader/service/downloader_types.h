/**
 * @file downloader_types.h
 * @brief Configuration types for file_downloader
 */

#ifndef KCENON_FILE_DOWNLOADER_SERVICE_DOWNLOADER_TYPES_H
#define KCENON_FILE_DOWNLOADER_SERVICE_DOWNLOADER_TYPES_H

#include <chrono>
#include <cstddef>
#include <filesystem>

#include "kcenon/file_downloader/core/download_operation.h"
#include "kcenon/file_downloader/service/retry_scheduler.h"

namespace kcenon::file_downloader {

/**
 * @brief Plain configuration values of a file_downloader
 */
struct downloader_config {
    std::filesystem::path storage_root;
    std::size_t chunk_size = download_operation::default_chunk_size;
    std::chrono::milliseconds success_notification_delay{2000};
    std::chrono::milliseconds listener_sweep_interval{30000};
    std::size_t pool_workers = 2;
    retry_policy retry;  ///< Used by the default retry scheduler

    [[nodiscard]] auto is_valid() const -> bool {
        return !storage_root.empty() && chunk_size > 0 &&
               success_notification_delay.count() >= 0 &&
               listener_sweep_interval.count() > 0 && retry.is_valid();
    }
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_SERVICE_DOWNLOADER_TYPES_H
