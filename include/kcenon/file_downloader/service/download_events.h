/**
 * @file download_events.h
 * @brief Broadcast of download added / finished events
 */

#ifndef KCENON_FILE_DOWNLOADER_SERVICE_DOWNLOAD_EVENTS_H
#define KCENON_FILE_DOWNLOADER_SERVICE_DOWNLOAD_EVENTS_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/file_downloader/core/types.h"

namespace kcenon::file_downloader {

enum class download_event_kind {
    added,
    finished
};

[[nodiscard]] constexpr auto to_string(download_event_kind kind) -> const char* {
    switch (kind) {
        case download_event_kind::added: return "added";
        case download_event_kind::finished: return "finished";
        default: return "unknown";
    }
}

struct download_event {
    download_event_kind kind = download_event_kind::added;
    std::string owner;
    std::string remote_path;
    std::string local_path;
    std::optional<std::string> linked_to_path;      ///< added only
    std::optional<std::string> unlinked_from_path;  ///< finished only
    bool success = false;                           ///< finished only
    bool deferred = false;                          ///< finished only, handed to retry
    error_code code = error_code::success;          ///< finished only
};

/**
 * @brief Asynchronous in-order event bus
 *
 * Events are delivered on the bus thread in publication order. A
 * subscriber removed while an event is being delivered may still receive
 * that event.
 */
class download_event_bus {
public:
    using subscriber = std::function<void(const download_event&)>;
    using subscription_id = uint64_t;

    download_event_bus();
    ~download_event_bus();

    download_event_bus(const download_event_bus&) = delete;
    auto operator=(const download_event_bus&) -> download_event_bus& = delete;

    auto subscribe(subscriber handler) -> subscription_id;
    void unsubscribe(subscription_id id);

    void publish(download_event event);

    /**
     * @brief Block until every published event has been delivered
     */
    void flush();

    [[nodiscard]] auto subscriber_count() const -> std::size_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_SERVICE_DOWNLOAD_EVENTS_H
