/**
 * @file retry_classifier.cpp
 * @brief Implementation of retry_classifier
 */

#include <kcenon/file_downloader/service/retry_classifier.h>
#include <kcenon/file_downloader/service/connectivity_monitor.h>
#include <kcenon/file_downloader/service/retry_scheduler.h>
#include <kcenon/file_downloader/core/logging.h>

namespace kcenon::file_downloader {

retry_classifier::retry_classifier(std::shared_ptr<connectivity_monitor> connectivity,
                                   std::shared_ptr<retry_scheduler> scheduler)
    : connectivity_(std::move(connectivity)), scheduler_(std::move(scheduler)) {}

auto retry_classifier::should_retry(const failure_cause& cause) const -> bool {
    if (is_remote_error(cause.code) || is_request_error(cause.code)) {
        return false;
    }
    if (is_transient_network_error(cause.code)) {
        return true;
    }
    return connectivity_ && !connectivity_->is_network_active();
}

auto retry_classifier::classify(const std::string& owner,
                                const std::string& remote_path,
                                download_result& result) const noexcept -> bool {
    if (result.is_success() || result.is_cancelled() || !result.cause()) {
        return false;
    }
    if (!scheduler_) {
        return false;
    }

    try {
        if (!should_retry(*result.cause())) {
            return false;
        }

        auto job_id = build_job_id(owner, remote_path);
        download_log_context ctx;
        ctx.account = owner;
        ctx.remote_path = remote_path;
        ctx.job_id = job_id;
        ctx.result_code = to_int(result.code());

        auto scheduled = scheduler_->schedule_download(job_id, owner, remote_path);
        if (!scheduled) {
            ctx.error_message = scheduled.error().message;
            FD_LOG_WARN_CTX(log_category::retry, "Retry could not be scheduled", ctx);
            return false;
        }

        FD_LOG_INFO_CTX(log_category::retry, "Download deferred until network is back", ctx);
        result.mark_deferred();
        return true;
    } catch (const std::exception& e) {
        FD_LOG_ERROR(log_category::retry, std::string("Retry classification failed: ") + e.what());
        return false;
    }
}

auto retry_classifier::build_job_id(const std::string& owner,
                                    const std::string& remote_path) -> int32_t {
    uint32_t hash = 0;
    for (unsigned char c : owner) {
        hash = hash * 31u + c;
    }
    for (unsigned char c : remote_path) {
        hash = hash * 31u + c;
    }
    return static_cast<int32_t>(hash);
}

}  // namespace kcenon::file_downloader
