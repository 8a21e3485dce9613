/**
 * @file credentials_provider.h
 * @brief Account credential lookup
 */

#ifndef KCENON_FILE_DOWNLOADER_CLIENT_CREDENTIALS_PROVIDER_H
#define KCENON_FILE_DOWNLOADER_CLIENT_CREDENTIALS_PROVIDER_H

#include <map>
#include <mutex>
#include <string>

#include "kcenon/file_downloader/core/types.h"

namespace kcenon::file_downloader {

enum class credentials_kind {
    basic,
    bearer
};

struct account_credentials {
    credentials_kind kind = credentials_kind::basic;
    std::string username;
    std::string secret;     ///< Password or access token
    std::string base_url;   ///< e.g. https://cloud.example.com/remote.php/webdav
};

/**
 * @brief Source of account credentials
 *
 * Queried on every client creation, so refreshed tokens are picked up.
 */
class credentials_provider {
public:
    virtual ~credentials_provider() = default;

    [[nodiscard]] virtual auto credentials_for(const std::string& owner)
        -> result<account_credentials> = 0;
};

/**
 * @brief credentials_provider backed by an in-memory table
 */
class static_credentials_provider : public credentials_provider {
public:
    void set(const std::string& owner, account_credentials creds) {
        std::lock_guard<std::mutex> lock(mutex_);
        table_[owner] = std::move(creds);
    }

    void erase(const std::string& owner) {
        std::lock_guard<std::mutex> lock(mutex_);
        table_.erase(owner);
    }

    [[nodiscard]] auto credentials_for(const std::string& owner)
        -> result<account_credentials> override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = table_.find(owner);
        if (it == table_.end()) {
            return unexpected{error{error_code::account_not_found,
                "no credentials for account " + owner}};
        }
        return it->second;
    }

private:
    std::mutex mutex_;
    std::map<std::string, account_credentials> table_;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_CLIENT_CREDENTIALS_PROVIDER_H
