/**
 * @file download_notifier.cpp
 * @brief Implementation of download_notifier
 */

#include <kcenon/file_downloader/service/download_notifier.h>
#include <kcenon/file_downloader/adapters/thread_pool_adapter.h>
#include <kcenon/file_downloader/core/logging.h>

namespace kcenon::file_downloader {

// ============================================================================
// logging_notification_sink
// ============================================================================

void logging_notification_sink::post(const download_notification& notification) {
    download_log_context ctx;
    ctx.account = notification.owner;
    ctx.remote_path = notification.remote_path;
    ctx.result_code = to_int(notification.code);

    auto message = notification.title;
    if (!notification.text.empty()) {
        message += ": " + notification.text;
    }
    if (notification.kind == notification_kind::ongoing && notification.percent >= 0) {
        message += " (" + std::to_string(notification.percent) + "%)";
    }

    if (notification.kind == notification_kind::ongoing) {
        FD_LOG_DEBUG_CTX(log_category::notify, message, ctx);
    } else if (notification.kind == notification_kind::succeeded) {
        FD_LOG_INFO_CTX(log_category::notify, message, ctx);
    } else {
        FD_LOG_WARN_CTX(log_category::notify, message, ctx);
    }
}

void logging_notification_sink::cancel(int64_t notification_id) {
    FD_LOG_TRACE(log_category::notify,
        "Notification dismissed: " + std::to_string(notification_id));
}

// ============================================================================
// download_notifier
// ============================================================================

download_notifier::download_notifier(
    std::shared_ptr<notification_sink> sink,
    std::chrono::milliseconds success_dismiss_delay,
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool)
    : sink_(std::move(sink))
    , success_dismiss_delay_(success_dismiss_delay)
    , pool_(std::move(pool)) {}

auto download_notifier::notification_id(const download_operation& operation) -> int64_t {
    return operation.request().file.id.value_or(0);
}

void download_notifier::on_download_started(const download_operation& operation) {
    if (!sink_) {
        return;
    }

    const auto& file = operation.request().file;
    download_notification n;
    n.id = notification_id(operation);
    n.kind = notification_kind::ongoing;
    n.owner = operation.owner();
    n.remote_path = file.remote_path;
    n.title = "Downloading";
    n.text = file.file_name();
    n.percent = file.length > 0 ? 0 : -1;
    n.action = notification_action::show_details;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_percent_[n.id] = n.percent;
    }
    sink_->post(n);
}

void download_notifier::on_progress(const download_operation& operation,
                                    const download_progress& progress) {
    if (!sink_) {
        return;
    }

    auto id = notification_id(operation);
    auto percent = progress.percent();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_percent_.find(id);
        if (it != last_percent_.end() && it->second == percent) {
            return;
        }
        last_percent_[id] = percent;
    }

    download_notification n;
    n.id = id;
    n.kind = notification_kind::ongoing;
    n.owner = operation.owner();
    n.remote_path = operation.remote_path();
    n.title = "Downloading";
    n.text = progress.file_name;
    n.percent = percent;
    n.action = notification_action::show_details;
    sink_->post(n);
}

void download_notifier::on_download_finished(const download_operation& operation,
                                             const download_result& result) {
    auto id = notification_id(operation);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_percent_.erase(id);
    }
    if (!sink_) {
        return;
    }
    if (result.is_cancelled()) {
        sink_->cancel(id);
        return;
    }

    download_notification n;
    n.id = id;
    n.owner = operation.owner();
    n.remote_path = operation.remote_path();
    n.code = result.code();
    n.percent = result.is_success() ? 100 : 0;

    auto name = operation.request().file.file_name();
    if (result.is_success()) {
        n.kind = notification_kind::succeeded;
        n.title = "Download succeeded";
        n.text = name;
        n.action = notification_action::show_details;
        n.auto_dismiss = success_dismiss_delay_;
    } else if (result.is_deferred()) {
        n.kind = notification_kind::waiting_for_network;
        n.title = "Download waiting for network";
        n.text = name;
        n.action = notification_action::none;
    } else if (is_authorization_error(result.code())) {
        n.kind = notification_kind::credentials_error;
        n.title = "Credentials error";
        n.text = name + ": " + result.message();
        n.action = notification_action::refresh_credentials;
    } else {
        n.kind = notification_kind::failed;
        n.title = "Download failed";
        n.text = name + ": " + result.message();
        n.action = notification_action::show_details;
    }

    sink_->post(n);

    if (result.is_success() && pool_ && pool_->is_running()) {
        std::weak_ptr<notification_sink> weak = sink_;
        pool_->submit_delayed([weak, id]() {
            if (auto sink = weak.lock()) {
                sink->cancel(id);
            }
        }, success_dismiss_delay_);
    }
}

}  // namespace kcenon::file_downloader
