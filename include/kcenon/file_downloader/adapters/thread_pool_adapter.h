// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Thread pool adapter for file_downloader
 *
 * Provides the pool used for deferred work such as download retries.
 * Runs on kcenon thread_system when available and on a small standalone
 * pool otherwise.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::file_downloader::adapters {

/**
 * @brief Interface for thread pool operations in file_downloader
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task that runs once the delay has elapsed
     *
     * Tasks still waiting when the pool shuts down are dropped and their
     * futures report std::future_errc::broken_promise.
     */
    virtual std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks queued or waiting for their delay
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Stop accepting work and drop delayed tasks
     */
    virtual void shutdown() = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that runs download tasks on a thread_system thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    explicit thread_system_transfer_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "file_downloader_pool",
        size_t worker_count = 0);

    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    void shutdown() override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Standalone pool used when thread_system is not available
 *
 * A fixed set of worker threads plus one timer thread for delayed tasks.
 */
class standalone_transfer_pool : public transfer_thread_pool_interface {
public:
    explicit standalone_transfer_pool(size_t worker_count = 2);
    ~standalone_transfer_pool() override;

    standalone_transfer_pool(const standalone_transfer_pool&) = delete;
    standalone_transfer_pool& operator=(const standalone_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    void shutdown() override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory for creating the thread pool adapter
 *
 * Picks thread_system_transfer_adapter when KCENON_WITH_THREAD_SYSTEM is
 * set and standalone_transfer_pool otherwise. The returned pool is started
 * with worker_count workers, or one per hardware thread when it is 0.
 */
class transfer_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "file_downloader_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::file_downloader::adapters
