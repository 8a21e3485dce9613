/**
 * @file test_concurrency.cpp
 * @brief Concurrency tests for the download queue
 *
 * This file contains tests for:
 * - Concurrent requests for the same file
 * - Concurrent requests from many producer threads
 * - Cancellation racing the running download
 * - Account removal while downloading
 */

#include "test_fixtures.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <latch>
#include <mutex>
#include <thread>
#include <vector>

namespace kcenon::file_downloader::test {

using namespace std::chrono_literals;

class ConcurrentQueueTest : public DownloaderFixture {};

namespace {

// Blocks exists() until opened, to hold the worker before it checks the account
class gated_account_registry : public account_registry {
public:
    [[nodiscard]] auto exists(const std::string&) const -> bool override {
        std::unique_lock<std::mutex> lock(mutex_);
        if (gated_) {
            ++waiting_;
            cv_.notify_all();
            cv_.wait(lock, [this] { return !gated_; });
        }
        return true;
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            gated_ = false;
        }
        cv_.notify_all();
    }

    auto wait_for_waiter() -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, 5s, [this] { return waiting_ > 0; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable int waiting_ = 0;
    bool gated_ = true;
};

}  // namespace

// =============================================================================
// Producers
// =============================================================================

TEST_F(ConcurrentQueueTest, SameFileFromManyThreadsIsQueuedOnce) {
    constexpr int thread_count = 8;
    std::latch ready(thread_count);
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([&] {
            ready.arrive_and_wait();
            if (downloader_->request_download(make_request(ALICE, "/same.txt", 1))) {
                ++accepted;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    downloader_->events().flush();

    EXPECT_EQ(accepted.load(), thread_count);
    EXPECT_EQ(downloader_->pending_count(), 1u);
    EXPECT_EQ(recorder_.events().size(), 1u);
}

TEST_F(ConcurrentQueueTest, ManyProducersAllComplete) {
    constexpr int thread_count = 4;
    constexpr int files_per_thread = 25;
    for (int t = 0; t < thread_count; ++t) {
        for (int f = 0; f < files_per_thread; ++f) {
            server_->put_file(ALICE, "/t" + std::to_string(t) + "/f" + std::to_string(f), "data");
        }
    }
    ASSERT_TRUE(downloader_->start().has_value());

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([this, t] {
            for (int f = 0; f < files_per_thread; ++f) {
                auto path = "/t" + std::to_string(t) + "/f" + std::to_string(f);
                auto queued = downloader_->request_download(
                    make_request(ALICE, path, t * files_per_thread + f + 1));
                EXPECT_TRUE(queued.has_value());
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    ASSERT_TRUE(wait_for_finished(thread_count * files_per_thread));
    for (const auto& event : recorder_.finished()) {
        EXPECT_TRUE(event.success) << event.remote_path;
    }
    EXPECT_EQ(downloader_->pending_count(), 0u);
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_F(ConcurrentQueueTest, CancelRunningDownload) {
    server_->put_file(ALICE, "/big.bin", std::string(64, 'x'));
    server_->hold_reads();
    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/big.bin", 9)).has_value());
    ASSERT_TRUE(downloader_->start().has_value());

    ASSERT_TRUE(server_->wait_for_blocked_reader());
    EXPECT_TRUE(downloader_->is_downloading(ALICE, "/big.bin"));
    downloader_->cancel(ALICE, "/big.bin");
    server_->release_reads();

    ASSERT_TRUE(wait_for_finished(1));
    auto finished = recorder_.finished();
    EXPECT_FALSE(finished[0].success);
    EXPECT_EQ(finished[0].code, error_code::cancelled);
    EXPECT_FALSE(std::filesystem::exists(finished[0].local_path));
    EXPECT_FALSE(downloader_->is_downloading(ALICE, "/big.bin"));

    auto cancelled = sink_->cancelled();
    EXPECT_NE(std::find(cancelled.begin(), cancelled.end(), 9), cancelled.end());
    EXPECT_TRUE(scheduler_->jobs().empty());
}

TEST_F(ConcurrentQueueTest, CancellingParentDirectoryStopsRunningChild) {
    server_->put_file(ALICE, "/Docs/big.bin", std::string(64, 'x'));
    server_->hold_reads();
    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/Docs/big.bin", 1)).has_value());
    ASSERT_TRUE(downloader_->start().has_value());

    ASSERT_TRUE(server_->wait_for_blocked_reader());
    EXPECT_TRUE(downloader_->is_downloading(ALICE, "/Docs/"));
    downloader_->cancel(ALICE, "/Docs/");
    server_->release_reads();

    ASSERT_TRUE(wait_for_finished(1));
    EXPECT_EQ(recorder_.finished()[0].code, error_code::cancelled);
}

TEST_F(ConcurrentQueueTest, QueuedDownloadsContinueAfterCancel) {
    server_->put_file(ALICE, "/big.bin", std::string(64, 'x'));
    server_->put_file(ALICE, "/next.txt", "next");
    server_->hold_reads();
    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/big.bin", 1)).has_value());
    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/next.txt", 2)).has_value());
    ASSERT_TRUE(downloader_->start().has_value());

    ASSERT_TRUE(server_->wait_for_blocked_reader());
    downloader_->cancel(ALICE, "/big.bin");
    server_->release_reads();

    ASSERT_TRUE(wait_for_finished(2));
    auto finished = recorder_.finished();
    EXPECT_EQ(finished[0].code, error_code::cancelled);
    EXPECT_EQ(finished[1].remote_path, "/next.txt");
    EXPECT_TRUE(finished[1].success);
}

TEST_F(ConcurrentQueueTest, StopCancelsRunningDownload) {
    server_->put_file(ALICE, "/big.bin", std::string(64, 'x'));
    server_->hold_reads();
    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/big.bin", 1)).has_value());
    ASSERT_TRUE(downloader_->start().has_value());
    ASSERT_TRUE(server_->wait_for_blocked_reader());

    auto stopped = std::async(std::launch::async, [this] { return downloader_->stop(); });
    EXPECT_EQ(stopped.wait_for(50ms), std::future_status::timeout);
    server_->release_reads();

    ASSERT_TRUE(stopped.get().has_value());
    EXPECT_FALSE(downloader_->is_running());
    ASSERT_TRUE(wait_for_finished(1));
    EXPECT_EQ(recorder_.finished()[0].code, error_code::cancelled);
}

TEST_F(ConcurrentQueueTest, MoveAssignOntoRunningDownloaderStopsIt) {
    server_->put_file(ALICE, "/big.bin", std::string(64, 'x'));
    server_->hold_reads();
    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/big.bin", 1)).has_value());
    ASSERT_TRUE(downloader_->start().has_value());
    ASSERT_TRUE(server_->wait_for_blocked_reader());

    auto replacement = build_downloader();
    ASSERT_TRUE(replacement.has_value());

    auto assigned = std::async(std::launch::async, [&] {
        *downloader_ = std::move(replacement.value());
    });
    EXPECT_EQ(assigned.wait_for(50ms), std::future_status::timeout);
    server_->release_reads();
    assigned.get();

    EXPECT_FALSE(downloader_->is_running());
    auto cancelled = sink_->cancelled();
    EXPECT_NE(std::find(cancelled.begin(), cancelled.end(), 1), cancelled.end());

    // the replacement is usable
    event_recorder recorder;
    recorder.attach(downloader_->events());
    server_->put_file(ALICE, "/next.txt", "next");
    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/next.txt", 2)).has_value());
    ASSERT_TRUE(downloader_->start().has_value());
    ASSERT_TRUE(wait_until([&] {
        downloader_->events().flush();
        return recorder.finished().size() == 1;
    }));
    EXPECT_TRUE(recorder.finished()[0].success);
}

TEST_F(ConcurrentQueueTest, MoveAssignOntoItselfKeepsRunning) {
    ASSERT_TRUE(downloader_->start().has_value());

    auto& self = *downloader_;
    self = std::move(*downloader_);

    EXPECT_TRUE(downloader_->is_running());
}

TEST_F(ConcurrentQueueTest, StopBeforeAccountCheckCancelsDownload) {
    auto gate = std::make_shared<gated_account_registry>();
    auto built = file_downloader::builder()
        .with_storage_root(storage_dir_)
        .with_client_factory(clients_)
        .with_account_registry(gate)
        .with_record_store_factory(stores_)
        .with_retry_scheduler(scheduler_)
        .with_connectivity_monitor(connectivity_)
        .with_notification_sink(sink_)
        .with_chunk_size(4)
        .build();
    ASSERT_TRUE(built.has_value());
    auto& gated = built.value();
    event_recorder recorder;
    recorder.attach(gated.events());

    server_->put_file(ALICE, "/a.txt", "aaaa");
    ASSERT_TRUE(gated.request_download(make_request(ALICE, "/a.txt", 1)).has_value());
    ASSERT_TRUE(gated.start().has_value());
    ASSERT_TRUE(gate->wait_for_waiter());

    auto stopped = std::async(std::launch::async, [&] { return gated.stop(); });
    EXPECT_EQ(stopped.wait_for(50ms), std::future_status::timeout);
    gate->open();
    ASSERT_TRUE(stopped.get().has_value());

    ASSERT_TRUE(wait_until([&] {
        gated.events().flush();
        return recorder.finished().size() == 1;
    }));
    EXPECT_EQ(recorder.finished()[0].code, error_code::cancelled);
    EXPECT_FALSE(std::filesystem::exists(recorder.finished()[0].local_path));
}

// =============================================================================
// Accounts
// =============================================================================

TEST_F(ConcurrentQueueTest, RemovedAccountCancelsRunningDownload) {
    server_->put_file(ALICE, "/big.bin", std::string(64, 'x'));
    server_->hold_reads();
    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/big.bin", 1)).has_value());
    ASSERT_TRUE(downloader_->start().has_value());
    ASSERT_TRUE(server_->wait_for_blocked_reader());

    accounts_->remove(ALICE);
    downloader_->on_accounts_updated();
    server_->release_reads();

    ASSERT_TRUE(wait_for_finished(1));
    EXPECT_EQ(recorder_.finished()[0].code, error_code::cancelled);
}

}  // namespace kcenon::file_downloader::test
