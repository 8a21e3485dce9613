/**
 * @file session_cache.cpp
 * @brief Implementation of session_cache
 */

#include <kcenon/file_downloader/service/session_cache.h>
#include <kcenon/file_downloader/core/logging.h>

namespace kcenon::file_downloader {

session_cache::session_cache(std::shared_ptr<file_record_store_factory> stores,
                             std::shared_ptr<remote_client_factory> clients)
    : stores_(std::move(stores)), clients_(std::move(clients)) {}

auto session_cache::acquire(const std::string& owner) -> result<download_session> {
    std::shared_ptr<file_record_store> store;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!owner_ || *owner_ != owner || !store_) {
            if (!stores_) {
                return unexpected(error(error_code::not_initialized, "no record store factory"));
            }
            auto opened = stores_->store_for(owner);
            if (!opened) {
                owner_.reset();
                store_.reset();
                return unexpected(opened.error());
            }
            owner_ = owner;
            store_ = opened.value();
            ++store_opens_;
            FD_LOG_DEBUG(log_category::worker, "Session switched to account " + owner);
        }
        store = store_;
    }

    if (!clients_) {
        return unexpected(error(error_code::not_initialized, "no remote client factory"));
    }
    auto client = clients_->client_for(owner);
    if (!client) {
        return unexpected(client.error());
    }
    if (!client.value()) {
        return unexpected(error(error_code::internal_error, "client factory returned null"));
    }

    return download_session{owner, std::move(store), client.value()};
}

void session_cache::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    owner_.reset();
    store_.reset();
}

auto session_cache::current_owner() const -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    return owner_;
}

auto session_cache::store_open_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_opens_;
}

}  // namespace kcenon::file_downloader
