/**
 * @file retry_classifier.h
 * @brief Decides whether a failed download is handed to the retry scheduler
 */

#ifndef KCENON_FILE_DOWNLOADER_SERVICE_RETRY_CLASSIFIER_H
#define KCENON_FILE_DOWNLOADER_SERVICE_RETRY_CLASSIFIER_H

#include <cstdint>
#include <memory>
#include <string>

#include "kcenon/file_downloader/core/download_result.h"

namespace kcenon::file_downloader {

class connectivity_monitor;
class retry_scheduler;

/**
 * @brief Classifies failures and defers the retryable ones
 */
class retry_classifier {
public:
    retry_classifier(std::shared_ptr<connectivity_monitor> connectivity,
                     std::shared_ptr<retry_scheduler> scheduler);

    /**
     * @brief True for connectivity failures or when no network is active
     */
    [[nodiscard]] auto should_retry(const failure_cause& cause) const -> bool;

    /**
     * @brief Inspect a terminal result and defer it when retryable
     *
     * Only non-cancelled failures carrying a cause are considered. A
     * deferred result is rewritten to error_code::no_network_connection.
     * Never throws.
     *
     * @return true if the download was handed to the scheduler
     */
    auto classify(const std::string& owner,
                  const std::string& remote_path,
                  download_result& result) const noexcept -> bool;

    /**
     * @brief Stable job id for (owner, path)
     *
     * 31-multiplier string hash over the UTF-8 bytes of owner + path with
     * 32-bit wrap-around, equal across runs and processes.
     */
    [[nodiscard]] static auto build_job_id(const std::string& owner,
                                           const std::string& remote_path) -> int32_t;

private:
    std::shared_ptr<connectivity_monitor> connectivity_;
    std::shared_ptr<retry_scheduler> scheduler_;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_SERVICE_RETRY_CLASSIFIER_H
