/**
 * @file progress_listener_registry.cpp
 * @brief Implementation of progress_listener_registry
 */

#include <kcenon/file_downloader/service/progress_listener_registry.h>
#include <kcenon/file_downloader/core/logging.h>

#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace kcenon::file_downloader {

struct progress_listener_registry::impl {
    using key_type = std::pair<std::string, int64_t>;

    std::chrono::milliseconds sweep_interval;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::condition_variable idle_cv;
    std::map<key_type, std::weak_ptr<download_progress_listener>> listeners;
    std::map<key_type, download_progress> pending;
    bool delivering = false;
    bool stopping = false;
    std::thread dispatcher;

    void run() {
        std::unique_lock<std::mutex> lock(mutex);
        auto next_sweep = std::chrono::steady_clock::now() + sweep_interval;
        while (true) {
            cv.wait_until(lock, next_sweep, [this] { return stopping || !pending.empty(); });
            if (stopping) {
                return;
            }

            if (std::chrono::steady_clock::now() >= next_sweep) {
                sweep_locked();
                next_sweep = std::chrono::steady_clock::now() + sweep_interval;
            }
            if (pending.empty()) {
                continue;
            }

            std::vector<std::pair<std::shared_ptr<download_progress_listener>, download_progress>> batch;
            for (auto& [key, progress] : pending) {
                auto it = listeners.find(key);
                if (it == listeners.end()) {
                    continue;
                }
                if (auto listener = it->second.lock()) {
                    batch.emplace_back(std::move(listener), std::move(progress));
                } else {
                    listeners.erase(it);
                }
            }
            pending.clear();
            delivering = true;
            lock.unlock();

            for (auto& [listener, progress] : batch) {
                try {
                    listener->on_transfer_progress(progress);
                } catch (const std::exception& e) {
                    FD_LOG_WARN(log_category::notify,
                        std::string("Progress listener threw: ") + e.what());
                }
            }
            batch.clear();

            lock.lock();
            delivering = false;
            idle_cv.notify_all();
        }
    }

    auto sweep_locked() -> std::size_t {
        std::size_t removed = 0;
        for (auto it = listeners.begin(); it != listeners.end();) {
            if (it->second.expired()) {
                it = listeners.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        if (removed > 0) {
            FD_LOG_TRACE(log_category::notify,
                "Swept " + std::to_string(removed) + " expired progress listeners");
        }
        return removed;
    }
};

progress_listener_registry::progress_listener_registry(std::chrono::milliseconds sweep_interval)
    : impl_(std::make_unique<impl>()) {
    impl_->sweep_interval = sweep_interval.count() > 0 ? sweep_interval
                                                       : std::chrono::milliseconds(30000);
    impl_->dispatcher = std::thread([this] { impl_->run(); });
}

progress_listener_registry::~progress_listener_registry() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->stopping = true;
    }
    impl_->cv.notify_all();
    if (impl_->dispatcher.joinable()) {
        impl_->dispatcher.join();
    }
}

void progress_listener_registry::add_listener(
    const std::string& owner, int64_t file_id,
    const std::shared_ptr<download_progress_listener>& listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->listeners[{owner, file_id}] = listener;
}

void progress_listener_registry::remove_listener(
    const std::string& owner, int64_t file_id,
    const std::shared_ptr<download_progress_listener>& listener) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->listeners.find({owner, file_id});
    if (it == impl_->listeners.end()) {
        return;
    }
    auto bound = it->second.lock();
    if (!bound || bound == listener) {
        impl_->listeners.erase(it);
    }
}

void progress_listener_registry::clear() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->listeners.clear();
    impl_->pending.clear();
    impl_->idle_cv.notify_all();
}

void progress_listener_registry::publish(const std::string& owner, int64_t file_id,
                                         const download_progress& progress) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl::key_type key{owner, file_id};
        if (impl_->listeners.count(key) == 0) {
            return;
        }
        auto [it, inserted] = impl_->pending.try_emplace(key, progress);
        if (!inserted) {
            // keep the byte count of coalesced samples
            auto rate = it->second.progress_rate + progress.progress_rate;
            it->second = progress;
            it->second.progress_rate = rate;
        }
    }
    impl_->cv.notify_one();
}

auto progress_listener_registry::sweep_expired() -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->sweep_locked();
}

void progress_listener_registry::flush() {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->idle_cv.wait(lock, [this] {
        return impl_->stopping || (impl_->pending.empty() && !impl_->delivering);
    });
}

auto progress_listener_registry::listener_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->listeners.size();
}

auto progress_listener_registry::has_listener(const std::string& owner, int64_t file_id) const
    -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->listeners.find({owner, file_id});
    return it != impl_->listeners.end() && !it->second.expired();
}

}  // namespace kcenon::file_downloader
