/**
 * @file progress_listener_registry.h
 * @brief Per-file progress listeners with coalesced asynchronous delivery
 *
 * Listeners are held through std::weak_ptr; the caller keeps ownership.
 * Samples are queued per file and only the latest sample is delivered, on
 * the registry's dispatcher thread. Expired handles are swept every TTL.
 */

#ifndef KCENON_FILE_DOWNLOADER_SERVICE_PROGRESS_LISTENER_REGISTRY_H
#define KCENON_FILE_DOWNLOADER_SERVICE_PROGRESS_LISTENER_REGISTRY_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "kcenon/file_downloader/core/download_operation.h"

namespace kcenon::file_downloader {

/**
 * @brief Receives progress of one file
 */
class download_progress_listener {
public:
    virtual ~download_progress_listener() = default;

    virtual void on_transfer_progress(const download_progress& progress) = 0;
};

class progress_listener_registry {
public:
    explicit progress_listener_registry(
        std::chrono::milliseconds sweep_interval = std::chrono::milliseconds(30000));
    ~progress_listener_registry();

    progress_listener_registry(const progress_listener_registry&) = delete;
    auto operator=(const progress_listener_registry&) -> progress_listener_registry& = delete;

    /**
     * @brief Bind a listener to a file, replacing any previous one
     */
    void add_listener(const std::string& owner, int64_t file_id,
                      const std::shared_ptr<download_progress_listener>& listener);

    /**
     * @brief Unbind a listener; other listeners bound to the file are kept
     */
    void remove_listener(const std::string& owner, int64_t file_id,
                         const std::shared_ptr<download_progress_listener>& listener);

    void clear();

    /**
     * @brief Queue a progress sample for the listener of a file
     */
    void publish(const std::string& owner, int64_t file_id, const download_progress& progress);

    /**
     * @brief Drop expired handles now
     * @return Number of handles removed
     */
    auto sweep_expired() -> std::size_t;

    /**
     * @brief Block until every queued sample has been delivered
     */
    void flush();

    [[nodiscard]] auto listener_count() const -> std::size_t;

    [[nodiscard]] auto has_listener(const std::string& owner, int64_t file_id) const -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_SERVICE_PROGRESS_LISTENER_REGISTRY_H
