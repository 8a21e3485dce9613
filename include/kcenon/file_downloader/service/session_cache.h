/**
 * @file session_cache.h
 * @brief Single-entry cache of the per-account download session
 */

#ifndef KCENON_FILE_DOWNLOADER_SERVICE_SESSION_CACHE_H
#define KCENON_FILE_DOWNLOADER_SERVICE_SESSION_CACHE_H

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "kcenon/file_downloader/client/remote_client.h"
#include "kcenon/file_downloader/service/file_record_store.h"

namespace kcenon::file_downloader {

/**
 * @brief Resources used to run one download
 */
struct download_session {
    std::string owner;
    std::shared_ptr<file_record_store> store;
    std::shared_ptr<remote_client> client;
};

/**
 * @brief LRU cache of size 1 keyed by account
 *
 * The record store is reopened only when the account changes. The remote
 * client is fetched from the factory on every acquire() so credentials
 * are never stale.
 */
class session_cache {
public:
    session_cache(std::shared_ptr<file_record_store_factory> stores,
                  std::shared_ptr<remote_client_factory> clients);

    [[nodiscard]] auto acquire(const std::string& owner) -> result<download_session>;

    /**
     * @brief Drop the cached session
     */
    void reset();

    [[nodiscard]] auto current_owner() const -> std::optional<std::string>;

    /**
     * @brief Number of times the record store was (re)opened
     */
    [[nodiscard]] auto store_open_count() const -> std::size_t;

private:
    std::shared_ptr<file_record_store_factory> stores_;
    std::shared_ptr<remote_client_factory> clients_;

    mutable std::mutex mutex_;
    std::optional<std::string> owner_;
    std::shared_ptr<file_record_store> store_;
    std::size_t store_opens_ = 0;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_SERVICE_SESSION_CACHE_H
