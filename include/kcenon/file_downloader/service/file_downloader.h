/**
 * @file file_downloader.h
 * @brief Background download queue with a single worker
 */

#ifndef KCENON_FILE_DOWNLOADER_SERVICE_FILE_DOWNLOADER_H
#define KCENON_FILE_DOWNLOADER_SERVICE_FILE_DOWNLOADER_H

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "kcenon/file_downloader/client/remote_client.h"
#include "kcenon/file_downloader/core/remote_file.h"
#include "kcenon/file_downloader/core/types.h"
#include "kcenon/file_downloader/service/account_registry.h"
#include "kcenon/file_downloader/service/connectivity_monitor.h"
#include "kcenon/file_downloader/service/download_events.h"
#include "kcenon/file_downloader/service/download_notifier.h"
#include "kcenon/file_downloader/service/downloader_types.h"
#include "kcenon/file_downloader/service/file_record_store.h"
#include "kcenon/file_downloader/service/progress_listener_registry.h"
#include "kcenon/file_downloader/service/retry_scheduler.h"

namespace kcenon::file_downloader {

namespace adapters {
class transfer_thread_pool_interface;
}

/**
 * @brief Queue of downloads executed one at a time
 *
 * Requests are deduplicated by (account, remote path) and executed in
 * submission order by a dedicated worker thread.
 *
 * @code
 * auto downloader = file_downloader::builder()
 *     .with_storage_root("/var/lib/app/files")
 *     .with_client_factory(clients)
 *     .with_account_registry(accounts)
 *     .with_record_store_factory(stores)
 *     .build();
 *
 * if (downloader.has_value()) {
 *     auto& d = downloader.value();
 *     d.start();
 *     d.request_download({"alice@cloud.example.com", file});
 * }
 * @endcode
 */
class file_downloader {
public:
    /**
     * @brief Builder for file_downloader
     */
    class builder {
    public:
        builder();

        auto with_storage_root(std::filesystem::path root) -> builder&;
        auto with_client_factory(std::shared_ptr<remote_client_factory> factory) -> builder&;
        auto with_account_registry(std::shared_ptr<account_registry> registry) -> builder&;
        auto with_record_store_factory(std::shared_ptr<file_record_store_factory> factory) -> builder&;

        /**
         * @brief Use an external retry scheduler instead of the built-in one
         */
        auto with_retry_scheduler(std::shared_ptr<retry_scheduler> scheduler) -> builder&;
        auto with_retry_policy(retry_policy policy) -> builder&;
        auto with_connectivity_monitor(std::shared_ptr<connectivity_monitor> monitor) -> builder&;
        auto with_notification_sink(std::shared_ptr<notification_sink> sink) -> builder&;
        auto with_thread_pool(std::shared_ptr<adapters::transfer_thread_pool_interface> pool) -> builder&;
        auto with_chunk_size(std::size_t size) -> builder&;
        auto with_success_notification_delay(std::chrono::milliseconds delay) -> builder&;
        auto with_listener_ttl(std::chrono::milliseconds ttl) -> builder&;

        /**
         * @brief Build the downloader
         * @return invalid_configuration when a mandatory collaborator is missing
         */
        [[nodiscard]] auto build() -> result<file_downloader>;

    private:
        downloader_config config_;
        std::shared_ptr<remote_client_factory> clients_;
        std::shared_ptr<account_registry> accounts_;
        std::shared_ptr<file_record_store_factory> stores_;
        std::shared_ptr<retry_scheduler> scheduler_;
        std::shared_ptr<connectivity_monitor> connectivity_;
        std::shared_ptr<notification_sink> sink_;
        std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;
    };

    file_downloader(const file_downloader&) = delete;
    auto operator=(const file_downloader&) -> file_downloader& = delete;
    file_downloader(file_downloader&&) noexcept;
    auto operator=(file_downloader&&) noexcept -> file_downloader&;
    ~file_downloader();

    /**
     * @brief Start the worker thread
     */
    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief Cancel the active download and join the worker
     *
     * Pending requests stay queued and run after the next start().
     */
    [[nodiscard]] auto stop() -> result<void>;

    [[nodiscard]] auto is_running() const -> bool;

    /**
     * @brief Queue a download
     *
     * A request for a file that is already queued succeeds without queuing
     * anything.
     */
    [[nodiscard]] auto request_download(const download_request& request) -> result<void>;

    /**
     * @brief Re-queue a deferred download using the stored file record
     */
    [[nodiscard]] auto resubmit(const std::string& owner, const std::string& remote_path)
        -> result<void>;

    /**
     * @brief Cancel a pending or running download
     *
     * Cancelling a directory cancels everything queued below it. Unknown
     * files are ignored.
     */
    void cancel(const std::string& owner, const std::string& remote_path);

    /**
     * @brief Cancel every download of an account
     */
    void cancel_all(const std::string& owner);

    /**
     * @brief True if the file is queued, running, or lies under a queued directory
     */
    [[nodiscard]] auto is_downloading(const std::string& owner, const std::string& remote_path) const
        -> bool;

    /**
     * @brief Re-check the account registry
     *
     * A running download of an account that no longer exists is cancelled.
     */
    void on_accounts_updated();

    void add_progress_listener(const std::string& owner, int64_t file_id,
                               const std::shared_ptr<download_progress_listener>& listener);
    void remove_progress_listener(const std::string& owner, int64_t file_id,
                                  const std::shared_ptr<download_progress_listener>& listener);
    void clear_progress_listeners();

    [[nodiscard]] auto events() -> download_event_bus&;
    [[nodiscard]] auto progress_listeners() -> progress_listener_registry&;

    [[nodiscard]] auto pending_count() const -> std::size_t;
    [[nodiscard]] auto config() const -> const downloader_config&;

private:
    struct impl;
    explicit file_downloader(std::unique_ptr<impl> state);

    // Stops a running worker before the state is released
    void shutdown_worker() noexcept;

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_SERVICE_FILE_DOWNLOADER_H
