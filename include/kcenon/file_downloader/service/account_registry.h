/**
 * @file account_registry.h
 * @brief Registry of accounts known to the application
 */

#ifndef KCENON_FILE_DOWNLOADER_SERVICE_ACCOUNT_REGISTRY_H
#define KCENON_FILE_DOWNLOADER_SERVICE_ACCOUNT_REGISTRY_H

#include <mutex>
#include <set>
#include <string>

namespace kcenon::file_downloader {

class account_registry {
public:
    virtual ~account_registry() = default;

    [[nodiscard]] virtual auto exists(const std::string& owner) const -> bool = 0;
};

/**
 * @brief account_registry backed by an in-memory set
 */
class static_account_registry : public account_registry {
public:
    void add(const std::string& owner) {
        std::lock_guard<std::mutex> lock(mutex_);
        accounts_.insert(owner);
    }

    void remove(const std::string& owner) {
        std::lock_guard<std::mutex> lock(mutex_);
        accounts_.erase(owner);
    }

    [[nodiscard]] auto exists(const std::string& owner) const -> bool override {
        std::lock_guard<std::mutex> lock(mutex_);
        return accounts_.count(owner) > 0;
    }

private:
    mutable std::mutex mutex_;
    std::set<std::string> accounts_;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_SERVICE_ACCOUNT_REGISTRY_H
