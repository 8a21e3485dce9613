/**
 * @file download_events.cpp
 * @brief Implementation of download_event_bus
 */

#include <kcenon/file_downloader/service/download_events.h>
#include <kcenon/file_downloader/core/logging.h>

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace kcenon::file_downloader {

struct download_event_bus::impl {
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::condition_variable idle_cv;
    std::deque<download_event> queue;
    std::map<subscription_id, subscriber> subscribers;
    subscription_id next_id = 1;
    bool delivering = false;
    bool stopping = false;
    std::thread thread;

    void run() {
        std::unique_lock<std::mutex> lock(mutex);
        while (true) {
            cv.wait(lock, [this] { return stopping || !queue.empty(); });
            if (queue.empty()) {
                return;
            }

            auto event = std::move(queue.front());
            queue.pop_front();
            std::vector<subscriber> targets;
            targets.reserve(subscribers.size());
            for (const auto& [id, handler] : subscribers) {
                targets.push_back(handler);
            }
            delivering = true;
            lock.unlock();

            for (const auto& handler : targets) {
                try {
                    handler(event);
                } catch (const std::exception& e) {
                    FD_LOG_WARN(log_category::notify,
                        std::string("Event subscriber threw: ") + e.what());
                }
            }

            lock.lock();
            delivering = false;
            idle_cv.notify_all();
        }
    }
};

download_event_bus::download_event_bus() : impl_(std::make_unique<impl>()) {
    impl_->thread = std::thread([this] { impl_->run(); });
}

download_event_bus::~download_event_bus() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->stopping = true;
    }
    impl_->cv.notify_all();
    if (impl_->thread.joinable()) {
        impl_->thread.join();
    }
}

auto download_event_bus::subscribe(subscriber handler) -> subscription_id {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto id = impl_->next_id++;
    impl_->subscribers.emplace(id, std::move(handler));
    return id;
}

void download_event_bus::unsubscribe(subscription_id id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->subscribers.erase(id);
}

void download_event_bus::publish(download_event event) {
    FD_LOG_TRACE(log_category::notify,
        std::string("Publishing ") + to_string(event.kind) + " event for " +
        event.owner + event.remote_path);
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->queue.push_back(std::move(event));
    }
    impl_->cv.notify_one();
}

void download_event_bus::flush() {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->idle_cv.wait(lock, [this] {
        return impl_->queue.empty() && !impl_->delivering;
    });
}

auto download_event_bus::subscriber_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->subscribers.size();
}

}  // namespace kcenon::file_downloader
