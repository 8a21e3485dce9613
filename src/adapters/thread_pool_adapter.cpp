// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Thread pool adapter implementation for file_downloader
 */

#include "kcenon/file_downloader/adapters/thread_pool_adapter.h"
#include "kcenon/file_downloader/core/logging.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::file_downloader::adapters {

// ============================================================================
// Shared helpers
// ============================================================================

namespace {

// Runs the task and forwards its outcome to the promise.
void run_into(const std::function<void()>& task, std::promise<void>& promise) {
    try {
        task();
        promise.set_value();
    } catch (const std::exception& e) {
        FD_LOG_WARN(log_category::worker, std::string("Pool task failed: ") + e.what());
        promise.set_exception(std::current_exception());
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

auto default_worker_count(size_t requested) -> size_t {
    if (requested != 0) {
        return requested;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

}  // namespace

// ============================================================================
// thread_system_transfer_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "download_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

// Wakes sleeping delayed tasks early on shutdown.
struct delay_gate {
    std::mutex mutex;
    std::condition_variable cv;
    bool stopped = false;
    std::atomic<size_t> waiting{0};
};

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::shared_ptr<delay_gate> gate = std::make_shared<delay_gate>();

    std::future<void> enqueue(std::function<void()> task, const std::string& job_name) {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();

        auto job = std::make_unique<function_job>(
            [task = std::move(task), promise]() { run_into(task, *promise); }, job_name);
        auto enqueued = pool->enqueue(std::move(job));
        if (enqueued.is_err()) {
            FD_LOG_ERROR(log_category::worker, "Failed to enqueue " + job_name + " on " + pool_name);
            promise->set_exception(std::make_exception_ptr(
                std::runtime_error("thread pool rejected " + job_name)));
        }
        return future;
    }
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() {
    shutdown();
}

namespace {

// Builds and starts a thread_system pool with worker_count workers.
auto make_thread_system_adapter(size_t worker_count, const std::string& pool_name)
    -> std::shared_ptr<thread_system_transfer_adapter> {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        auto added = pool->enqueue(std::move(worker));
        if (added.is_err()) {
            FD_LOG_WARN(log_category::worker, "Could not add worker to " + pool_name);
        }
    }

    auto started = pool->start();
    if (started.is_err()) {
        FD_LOG_ERROR(log_category::worker, "Could not start thread pool " + pool_name);
    }

    return std::make_shared<thread_system_transfer_adapter>(std::move(pool), pool_name, worker_count);
}

}  // namespace

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    return pimpl_->enqueue(std::move(task), "download_task");
}

std::future<void> thread_system_transfer_adapter::submit_delayed(
    std::function<void()> task, std::chrono::milliseconds delay) {
    auto gate = pimpl_->gate;
    gate->waiting.fetch_add(1);

    auto delayed_task = [task = std::move(task), gate, delay]() {
        std::unique_lock<std::mutex> lock(gate->mutex);
        bool stopped = gate->cv.wait_for(lock, delay, [&gate] { return gate->stopped; });
        lock.unlock();
        gate->waiting.fetch_sub(1);
        if (stopped) {
            throw std::runtime_error("thread pool shut down before delayed task ran");
        }
        task();
    };
    return pimpl_->enqueue(std::move(delayed_task), "delayed_download_task");
}

size_t thread_system_transfer_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_transfer_adapter::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->gate->mutex);
    return pimpl_->pool != nullptr && !pimpl_->gate->stopped;
}

size_t thread_system_transfer_adapter::pending_tasks() const {
    size_t queued = 0;
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        queued = queue ? queue->size() : 0;
    }
    return queued + pimpl_->gate->waiting.load();
}

void thread_system_transfer_adapter::shutdown() {
    if (!pimpl_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(pimpl_->gate->mutex);
        if (pimpl_->gate->stopped) {
            return;
        }
        pimpl_->gate->stopped = true;
    }
    pimpl_->gate->cv.notify_all();

    if (pimpl_->pool) {
        auto stopped = pimpl_->pool->stop();
        if (stopped.is_err()) {
            FD_LOG_WARN(log_category::worker, "Thread pool " + pimpl_->pool_name + " did not stop cleanly");
        }
    }
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// standalone_transfer_pool implementation
// ============================================================================

struct standalone_transfer_pool::impl {
    struct queued_task {
        std::function<void()> task;
        std::shared_ptr<std::promise<void>> promise;
    };

    mutable std::mutex mutex;
    std::condition_variable work_cv;
    std::condition_variable timer_cv;
    std::deque<queued_task> queue;
    std::multimap<std::chrono::steady_clock::time_point, queued_task> delayed;
    bool stopped = false;
    size_t running = 0;

    std::vector<std::thread> workers;
    std::thread timer;

    void worker_loop() {
        while (true) {
            queued_task next;
            {
                std::unique_lock<std::mutex> lock(mutex);
                work_cv.wait(lock, [this] { return stopped || !queue.empty(); });
                if (queue.empty()) {
                    return;
                }
                next = std::move(queue.front());
                queue.pop_front();
                ++running;
            }
            run_into(next.task, *next.promise);
            std::lock_guard<std::mutex> lock(mutex);
            --running;
        }
    }

    void timer_loop() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!stopped) {
            if (delayed.empty()) {
                timer_cv.wait(lock, [this] { return stopped || !delayed.empty(); });
                continue;
            }
            auto due = delayed.begin()->first;
            if (timer_cv.wait_until(lock, due, [this, due] {
                    return stopped || (!delayed.empty() && delayed.begin()->first < due);
                })) {
                continue;
            }
            auto now = std::chrono::steady_clock::now();
            while (!delayed.empty() && delayed.begin()->first <= now) {
                queue.push_back(std::move(delayed.begin()->second));
                delayed.erase(delayed.begin());
            }
            work_cv.notify_all();
        }
    }

    std::future<void> push(std::function<void()> task) {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopped) {
                promise->set_exception(std::make_exception_ptr(
                    std::runtime_error("thread pool is shut down")));
                return future;
            }
            queue.push_back(queued_task{std::move(task), std::move(promise)});
        }
        work_cv.notify_one();
        return future;
    }
};

standalone_transfer_pool::standalone_transfer_pool(size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    worker_count = default_worker_count(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        pimpl_->workers.emplace_back([this] { pimpl_->worker_loop(); });
    }
    pimpl_->timer = std::thread([this] { pimpl_->timer_loop(); });
}

standalone_transfer_pool::~standalone_transfer_pool() {
    shutdown();
}

std::future<void> standalone_transfer_pool::submit(std::function<void()> task) {
    return pimpl_->push(std::move(task));
}

std::future<void> standalone_transfer_pool::submit_delayed(
    std::function<void()> task, std::chrono::milliseconds delay) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopped) {
            promise->set_exception(std::make_exception_ptr(
                std::runtime_error("thread pool is shut down")));
            return future;
        }
        pimpl_->delayed.emplace(std::chrono::steady_clock::now() + delay,
                                impl::queued_task{std::move(task), std::move(promise)});
    }
    pimpl_->timer_cv.notify_one();
    return future;
}

size_t standalone_transfer_pool::worker_count() const {
    return pimpl_->workers.size();
}

bool standalone_transfer_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->stopped;
}

size_t standalone_transfer_pool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->queue.size() + pimpl_->delayed.size() + pimpl_->running;
}

void standalone_transfer_pool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopped) {
            return;
        }
        pimpl_->stopped = true;
        // dropping the promises breaks the futures of waiting tasks
        pimpl_->delayed.clear();
    }
    pimpl_->work_cv.notify_all();
    pimpl_->timer_cv.notify_all();

    for (auto& worker : pimpl_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    if (pimpl_->timer.joinable()) {
        pimpl_->timer.join();
    }
}

// ============================================================================
// transfer_pool_factory implementation
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return make_thread_system_adapter(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<standalone_transfer_pool>(worker_count);
#endif
}

}  // namespace kcenon::file_downloader::adapters
