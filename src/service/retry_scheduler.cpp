/**
 * @file retry_scheduler.cpp
 * @brief Implementation of pool_retry_scheduler
 */

#include <kcenon/file_downloader/service/retry_scheduler.h>
#include <kcenon/file_downloader/service/connectivity_monitor.h>
#include <kcenon/file_downloader/adapters/thread_pool_adapter.h>
#include <kcenon/file_downloader/core/logging.h>

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace kcenon::file_downloader {

auto retry_policy::delay_for(std::size_t attempt) const -> std::chrono::milliseconds {
    auto delay = static_cast<double>(initial_delay.count()) *
                 std::pow(backoff_multiplier, static_cast<double>(attempt));
    auto capped = std::min(delay, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

// ============================================================================
// pool_retry_scheduler::impl
// ============================================================================

struct pool_retry_scheduler::impl : std::enable_shared_from_this<pool_retry_scheduler::impl> {
    struct job {
        std::string owner;
        std::string remote_path;
        std::size_t attempt = 0;
        uint64_t generation = 0;
    };

    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;
    std::shared_ptr<connectivity_monitor> connectivity;
    retry_policy policy;

    mutable std::mutex mutex;
    std::map<int32_t, job> jobs;
    uint64_t next_generation = 1;
    resubmit_handler handler;

    // Threads currently inside the handler
    std::condition_variable idle_cv;
    std::multiset<std::thread::id> calling;

    // Caller holds the lock. Calls made by this thread do not count.
    void wait_for_handler_calls(std::unique_lock<std::mutex>& lock) {
        auto self = std::this_thread::get_id();
        idle_cv.wait(lock, [this, self] { return calling.count(self) == calling.size(); });
    }

    // Caller holds mutex.
    void arm(int32_t job_id, const job& j) {
        std::weak_ptr<impl> weak = shared_from_this();
        auto generation = j.generation;
        auto delay = policy.delay_for(j.attempt);
        pool->submit_delayed([weak, job_id, generation]() {
            if (auto self = weak.lock()) {
                self->fire(job_id, generation);
            }
        }, delay);
    }

    void fire(int32_t job_id, uint64_t generation) {
        resubmit_handler to_call;
        job due;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = jobs.find(job_id);
            if (it == jobs.end() || it->second.generation != generation) {
                return;
            }

            download_log_context ctx;
            ctx.account = it->second.owner;
            ctx.remote_path = it->second.remote_path;
            ctx.job_id = job_id;

            if (connectivity && !connectivity->is_network_active()) {
                auto& j = it->second;
                ++j.attempt;
                if (j.attempt >= policy.max_attempts) {
                    FD_LOG_WARN_CTX(log_category::retry, "Giving up retry, network still down", ctx);
                    jobs.erase(it);
                    return;
                }
                FD_LOG_DEBUG_CTX(log_category::retry, "Network still down, retry rescheduled", ctx);
                arm(job_id, j);
                return;
            }

            due = it->second;
            to_call = handler;
            jobs.erase(it);
            if (!to_call) {
                return;
            }
            calling.insert(std::this_thread::get_id());
            FD_LOG_INFO_CTX(log_category::retry, "Resubmitting deferred download", ctx);
        }

        call_guard guard(*this);
        to_call(due.owner, due.remote_path);
    }

    // Removes the calling thread from the in-flight set on every exit path
    struct call_guard {
        explicit call_guard(impl& owner) : owner_(owner) {}
        ~call_guard() {
            {
                std::lock_guard<std::mutex> lock(owner_.mutex);
                owner_.calling.erase(owner_.calling.find(std::this_thread::get_id()));
            }
            owner_.idle_cv.notify_all();
        }
        call_guard(const call_guard&) = delete;
        auto operator=(const call_guard&) -> call_guard& = delete;

        impl& owner_;
    };
};

// ============================================================================
// pool_retry_scheduler
// ============================================================================

pool_retry_scheduler::pool_retry_scheduler(
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
    std::shared_ptr<connectivity_monitor> connectivity,
    retry_policy policy)
    : impl_(std::make_shared<impl>()) {
    impl_->pool = std::move(pool);
    impl_->connectivity = std::move(connectivity);
    impl_->policy = policy;
}

pool_retry_scheduler::~pool_retry_scheduler() {
    cancel_all();
}

void pool_retry_scheduler::set_resubmit_handler(resubmit_handler handler) {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->handler = std::move(handler);
    impl_->wait_for_handler_calls(lock);
}

auto pool_retry_scheduler::schedule_download(int32_t job_id,
                                             const std::string& owner,
                                             const std::string& remote_path)
    -> result<void> {
    if (!impl_->pool || !impl_->pool->is_running()) {
        return unexpected(error(error_code::not_running, "retry pool is not running"));
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->jobs.count(job_id) > 0) {
        FD_LOG_DEBUG(log_category::retry,
            "Retry already pending for job " + std::to_string(job_id));
        return {};
    }

    impl::job j{owner, remote_path, 0, impl_->next_generation++};
    auto& stored = impl_->jobs.emplace(job_id, std::move(j)).first->second;
    impl_->arm(job_id, stored);
    return {};
}

auto pool_retry_scheduler::is_scheduled(int32_t job_id) const -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->jobs.count(job_id) > 0;
}

auto pool_retry_scheduler::pending_jobs() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->jobs.size();
}

auto pool_retry_scheduler::policy() const -> const retry_policy& {
    return impl_->policy;
}

void pool_retry_scheduler::cancel_all() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->jobs.clear();
}

}  // namespace kcenon::file_downloader
