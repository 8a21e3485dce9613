/**
 * @file connectivity_monitor.h
 * @brief Network availability query
 */

#ifndef KCENON_FILE_DOWNLOADER_SERVICE_CONNECTIVITY_MONITOR_H
#define KCENON_FILE_DOWNLOADER_SERVICE_CONNECTIVITY_MONITOR_H

#include <atomic>

namespace kcenon::file_downloader {

class connectivity_monitor {
public:
    virtual ~connectivity_monitor() = default;

    [[nodiscard]] virtual auto is_network_active() const -> bool = 0;
};

/**
 * @brief connectivity_monitor whose state is set by the application
 */
class manual_connectivity_monitor : public connectivity_monitor {
public:
    explicit manual_connectivity_monitor(bool active = true) : active_(active) {}

    void set_network_active(bool active) { active_.store(active); }

    [[nodiscard]] auto is_network_active() const -> bool override { return active_.load(); }

private:
    std::atomic<bool> active_;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_SERVICE_CONNECTIVITY_MONITOR_H
