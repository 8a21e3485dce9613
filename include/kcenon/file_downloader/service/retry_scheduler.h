/**
 * @file retry_scheduler.h
 * @brief Deferred re-submission of downloads that failed for lack of network
 */

#ifndef KCENON_FILE_DOWNLOADER_SERVICE_RETRY_SCHEDULER_H
#define KCENON_FILE_DOWNLOADER_SERVICE_RETRY_SCHEDULER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "kcenon/file_downloader/core/types.h"

namespace kcenon::file_downloader {

namespace adapters {
class transfer_thread_pool_interface;
}

class connectivity_monitor;

class retry_scheduler {
public:
    virtual ~retry_scheduler() = default;

    /**
     * @brief Hand a download over for a later retry
     *
     * Scheduling a job id that is already pending is a no-op.
     */
    [[nodiscard]] virtual auto schedule_download(int32_t job_id,
                                                 const std::string& owner,
                                                 const std::string& remote_path)
        -> result<void> = 0;
};

/**
 * @brief Backoff settings for pool_retry_scheduler
 */
struct retry_policy {
    std::size_t max_attempts = 5;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;

    [[nodiscard]] auto is_valid() const -> bool {
        return max_attempts > 0 && initial_delay.count() >= 0 &&
               max_delay >= initial_delay && backoff_multiplier >= 1.0;
    }

    /**
     * @brief Delay before the given attempt (0-based)
     */
    [[nodiscard]] auto delay_for(std::size_t attempt) const -> std::chrono::milliseconds;

    [[nodiscard]] static auto fast() -> retry_policy {
        return {5, std::chrono::milliseconds(10), std::chrono::milliseconds(100), 2.0};
    }
};

/**
 * @brief retry_scheduler running on a thread pool adapter
 *
 * When a retry comes due and the network is still down, the job is
 * rescheduled with the next backoff delay until max_attempts is reached.
 * Otherwise the resubmit handler is called with (owner, path).
 */
class pool_retry_scheduler : public retry_scheduler {
public:
    using resubmit_handler = std::function<void(const std::string& owner,
                                                const std::string& remote_path)>;

    pool_retry_scheduler(std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
                         std::shared_ptr<connectivity_monitor> connectivity,
                         retry_policy policy = {});
    ~pool_retry_scheduler() override;

    pool_retry_scheduler(const pool_retry_scheduler&) = delete;
    auto operator=(const pool_retry_scheduler&) -> pool_retry_scheduler& = delete;

    /**
     * @brief Replace the handler called for due retries
     *
     * Returns once no other thread is still running the previous handler.
     * Calling it from inside the handler does not wait for that call.
     */
    void set_resubmit_handler(resubmit_handler handler);

    [[nodiscard]] auto schedule_download(int32_t job_id,
                                         const std::string& owner,
                                         const std::string& remote_path)
        -> result<void> override;

    [[nodiscard]] auto is_scheduled(int32_t job_id) const -> bool;
    [[nodiscard]] auto pending_jobs() const -> std::size_t;
    [[nodiscard]] auto policy() const -> const retry_policy&;

    /**
     * @brief Forget all pending jobs; due retries become no-ops
     */
    void cancel_all();

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_SERVICE_RETRY_SCHEDULER_H
