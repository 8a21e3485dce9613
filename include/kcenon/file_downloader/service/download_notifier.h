/**
 * @file download_notifier.h
 * @brief User-visible status notifications for downloads
 */

#ifndef KCENON_FILE_DOWNLOADER_SERVICE_DOWNLOAD_NOTIFIER_H
#define KCENON_FILE_DOWNLOADER_SERVICE_DOWNLOAD_NOTIFIER_H

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "kcenon/file_downloader/core/download_operation.h"
#include "kcenon/file_downloader/core/download_result.h"

namespace kcenon::file_downloader {

namespace adapters {
class transfer_thread_pool_interface;
}

enum class notification_kind {
    ongoing,
    succeeded,
    failed,
    credentials_error,
    waiting_for_network
};

enum class notification_action {
    none,
    show_details,
    refresh_credentials
};

struct download_notification {
    int64_t id = 0;
    notification_kind kind = notification_kind::ongoing;
    std::string owner;
    std::string remote_path;
    std::string title;
    std::string text;
    int percent = 0;                ///< -1 when indeterminate
    notification_action action = notification_action::none;
    error_code code = error_code::success;
    std::chrono::milliseconds auto_dismiss{0};  ///< 0 keeps it until cancelled
};

/**
 * @brief Presentation layer for notifications
 */
class notification_sink {
public:
    virtual ~notification_sink() = default;

    /**
     * @brief Show or replace the notification with the same id
     */
    virtual void post(const download_notification& notification) = 0;

    virtual void cancel(int64_t notification_id) = 0;
};

/**
 * @brief Sink writing notifications to the file_downloader logger
 */
class logging_notification_sink : public notification_sink {
public:
    void post(const download_notification& notification) override;
    void cancel(int64_t notification_id) override;
};

/**
 * @brief Translates download lifecycle into notifications
 *
 * Cancelled downloads produce no terminal notification. Progress updates
 * are posted only when the integer percentage changes. Successful downloads
 * are dismissed after the configured delay.
 */
class download_notifier {
public:
    explicit download_notifier(
        std::shared_ptr<notification_sink> sink,
        std::chrono::milliseconds success_dismiss_delay = std::chrono::milliseconds(2000),
        std::shared_ptr<adapters::transfer_thread_pool_interface> pool = nullptr);

    void on_download_started(const download_operation& operation);

    void on_progress(const download_operation& operation, const download_progress& progress);

    void on_download_finished(const download_operation& operation, const download_result& result);

    [[nodiscard]] auto success_dismiss_delay() const -> std::chrono::milliseconds {
        return success_dismiss_delay_;
    }

private:
    [[nodiscard]] static auto notification_id(const download_operation& operation) -> int64_t;

    std::shared_ptr<notification_sink> sink_;
    std::chrono::milliseconds success_dismiss_delay_;
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;

    std::mutex mutex_;
    std::map<int64_t, int> last_percent_;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_SERVICE_DOWNLOAD_NOTIFIER_H
