/**
 * @file file_downloader.cpp
 * @brief Implementation of file_downloader
 */

#include <kcenon/file_downloader/service/file_downloader.h>
#include <kcenon/file_downloader/adapters/thread_pool_adapter.h>
#include <kcenon/file_downloader/core/keyed_work_index.h>
#include <kcenon/file_downloader/core/logging.h>
#include <kcenon/file_downloader/core/storage_layout.h>
#include <kcenon/file_downloader/service/retry_classifier.h>
#include <kcenon/file_downloader/service/session_cache.h>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace kcenon::file_downloader {

namespace {

auto now_millis() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// A directory path covers everything below it, a file path only itself.
auto path_covers(const std::string& path, const std::string& candidate) -> bool {
    if (path == candidate) {
        return true;
    }
    return !path.empty() && path.back() == '/' && candidate.rfind(path, 0) == 0;
}

auto make_context(const download_operation& op) -> download_log_context {
    download_log_context ctx;
    ctx.account = op.owner();
    ctx.remote_path = op.remote_path();
    ctx.file_id = op.request().file.id;
    return ctx;
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct file_downloader::impl {
    downloader_config config;
    storage_layout layout;

    std::shared_ptr<remote_client_factory> clients;
    std::shared_ptr<account_registry> accounts;
    std::shared_ptr<file_record_store_factory> stores;
    std::shared_ptr<connectivity_monitor> connectivity;
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;
    std::shared_ptr<retry_scheduler> scheduler;
    std::shared_ptr<pool_retry_scheduler> owned_scheduler;
    bool owns_pool = false;

    keyed_work_index<download_operation> index;
    session_cache sessions;
    retry_classifier classifier;
    download_notifier notifier;
    progress_listener_registry listeners;
    download_event_bus events;

    // Channel of keys in submission order
    std::mutex channel_mutex;
    std::condition_variable channel_cv;
    std::deque<std::string> channel;
    bool stopping = false;
    std::thread worker;
    bool running = false;

    // Active slot, written by the worker only
    mutable std::mutex active_mutex;
    std::shared_ptr<download_operation> active;

    impl(downloader_config cfg,
         std::shared_ptr<remote_client_factory> client_factory,
         std::shared_ptr<account_registry> account_reg,
         std::shared_ptr<file_record_store_factory> store_factory,
         std::shared_ptr<connectivity_monitor> monitor,
         std::shared_ptr<adapters::transfer_thread_pool_interface> thread_pool,
         std::shared_ptr<retry_scheduler> retry,
         std::shared_ptr<pool_retry_scheduler> owned_retry,
         std::shared_ptr<notification_sink> sink)
        : config(std::move(cfg))
        , layout(config.storage_root)
        , clients(std::move(client_factory))
        , accounts(std::move(account_reg))
        , stores(std::move(store_factory))
        , connectivity(std::move(monitor))
        , pool(std::move(thread_pool))
        , scheduler(std::move(retry))
        , owned_scheduler(std::move(owned_retry))
        , sessions(stores, clients)
        , classifier(connectivity, scheduler)
        , notifier(std::move(sink), config.success_notification_delay, pool)
        , listeners(config.listener_sweep_interval) {}

    ~impl() {
        if (owned_scheduler) {
            owned_scheduler->set_resubmit_handler(nullptr);
            owned_scheduler->cancel_all();
        }
        if (owns_pool && pool) {
            if (auto pending = pool->pending_tasks(); pending > 0) {
                FD_LOG_DEBUG(log_category::worker,
                    "Dropping " + std::to_string(pending) + " pending pool tasks");
            }
            pool->shutdown();
        }
    }

    void set_active(std::shared_ptr<download_operation> op) {
        std::lock_guard<std::mutex> lock(active_mutex);
        active = std::move(op);
    }

    [[nodiscard]] auto get_active() const -> std::shared_ptr<download_operation> {
        std::lock_guard<std::mutex> lock(active_mutex);
        return active;
    }

    // ------------------------------------------------------------------------
    // Worker loop
    // ------------------------------------------------------------------------

    void run() {
        FD_LOG_INFO(log_category::worker, "Download worker started");
        while (true) {
            std::string key;
            {
                std::unique_lock<std::mutex> lock(channel_mutex);
                channel_cv.wait(lock, [this] { return stopping || !channel.empty(); });
                if (stopping) {
                    break;
                }
                key = std::move(channel.front());
                channel.pop_front();
            }
            process(key);
        }
        FD_LOG_INFO(log_category::worker, "Download worker stopped");
    }

    [[nodiscard]] auto is_stopping() -> bool {
        std::lock_guard<std::mutex> lock(channel_mutex);
        return stopping;
    }

    void process(const std::string& key) {
        auto op = index.get(key);
        if (!op) {
            return;
        }

        // stop() sets the flag before reading the slot, so one side sees the other
        set_active(op);
        if (is_stopping()) {
            op->cancel();
        }

        if (!accounts->exists(op->owner())) {
            set_active(nullptr);
            drop_account(*op);
            return;
        }

        auto ctx = make_context(*op);
        FD_LOG_INFO_CTX(log_category::worker, "Download started", ctx);

        notifier.on_download_started(*op);

        auto file_id = op->request().file.id.value_or(0);
        auto callback = op->add_progress_callback(
            [this, op_raw = op.get(), owner = op->owner(), file_id](const download_progress& p) {
                listeners.publish(owner, file_id, p);
                notifier.on_progress(*op_raw, p);
            });

        auto result = run_operation(*op);
        if (!result.is_success() && op->is_cancelled()) {
            result = download_result::cancelled();
        }

        op->remove_progress_callback(callback);
        finish(op, std::move(result));
    }

    auto run_operation(download_operation& op) -> download_result {
        try {
            auto session = sessions.acquire(op.owner());
            if (!session) {
                const auto& err = session.error();
                if (is_connection_error(err.code)) {
                    return download_result::failure_with_cause(
                        err.code, failure_cause{err.code, err.message});
                }
                return download_result::failure(err.code, err.message);
            }

            auto result = op.execute(*session.value().client);
            if (result.is_success()) {
                save_downloaded_file(*session.value().store, op);
            }
            return result;
        } catch (const std::exception& e) {
            if (op.is_cancelled()) {
                return download_result::cancelled();
            }
            auto ctx = make_context(op);
            ctx.error_message = e.what();
            FD_LOG_ERROR_CTX(log_category::worker, "Download raised an exception", ctx);
            return download_result::from_exception(e);
        }
    }

    void finish(const std::shared_ptr<download_operation>& op, download_result result) {
        [[maybe_unused]] auto [removed, unlinked_from] = index.remove_payload(op->owner(), op->remote_path(), op);
        set_active(nullptr);

        classifier.classify(op->owner(), op->remote_path(), result);

        auto ctx = make_context(*op);
        ctx.result_code = to_int(result.code());
        ctx.bytes_transferred = op->transferred_bytes();
        if (result.is_success()) {
            FD_LOG_INFO_CTX(log_category::worker, "Download finished", ctx);
        } else if (result.is_cancelled()) {
            FD_LOG_INFO_CTX(log_category::worker, "Download cancelled", ctx);
        } else {
            ctx.error_message = result.message();
            FD_LOG_WARN_CTX(log_category::worker, "Download failed", ctx);
        }

        notifier.on_download_finished(*op, result);

        download_event event;
        event.kind = download_event_kind::finished;
        event.owner = op->owner();
        event.remote_path = op->remote_path();
        event.local_path = op->save_path().string();
        event.unlinked_from_path = unlinked_from;
        event.success = result.is_success();
        event.deferred = result.is_deferred();
        event.code = result.code();
        events.publish(std::move(event));
    }

    void drop_account(const download_operation& op) {
        auto ctx = make_context(op);
        ctx.result_code = to_int(error_code::account_not_found);
        FD_LOG_WARN_CTX(log_category::worker, "Account gone, dropping its downloads", ctx);

        for (const auto& pending : index.remove_all(op.owner())) {
            pending->cancel();
        }
        sessions.reset();

        download_event event;
        event.kind = download_event_kind::finished;
        event.owner = op.owner();
        event.remote_path = op.remote_path();
        event.local_path = op.save_path().string();
        event.success = false;
        event.code = error_code::account_not_found;
        events.publish(std::move(event));
    }

    void save_downloaded_file(file_record_store& store, const download_operation& op) {
        auto file = op.file();
        auto existing = store.get_file_by_id(file.id.value_or(0));
        auto record = existing ? existing.value() : file_record::from_remote(op.owner(), file);

        auto now = now_millis();
        record.last_sync_date_for_properties = now;
        record.last_sync_date_for_data = now;
        record.needs_thumbnail_update = true;
        record.modification_timestamp = file.modification_timestamp;
        record.modified_at_last_sync_for_data = file.modification_timestamp;
        record.etag = file.etag;
        record.mime_type = file.mime_type;
        record.storage_path = op.save_path().string();
        record.remote_id = file.remote_id;
        record.available_offline = record.available_offline || op.request().is_available_offline;

        std::error_code ec;
        auto size = std::filesystem::file_size(op.save_path(), ec);
        record.length = ec ? 0 : static_cast<int64_t>(size);

        auto ctx = make_context(op);
        auto saved = store.save_file(record);
        if (!saved) {
            ctx.error_message = saved.error().message;
            FD_LOG_ERROR_CTX(log_category::store, "Could not save downloaded file record", ctx);
            return;
        }
        auto conflict = store.save_conflict(record, std::nullopt);
        if (!conflict) {
            ctx.error_message = conflict.error().message;
            FD_LOG_ERROR_CTX(log_category::store, "Could not clear file conflict", ctx);
        }
    }

    // ------------------------------------------------------------------------
    // Producer side
    // ------------------------------------------------------------------------

    auto enqueue(const download_request& request) -> result<void> {
        auto valid = request.validate();
        if (!valid) {
            FD_LOG_WARN(log_category::queue, "Rejected download request: " + valid.error().message);
            return unexpected(error(error_code::invalid_request, valid.error().message));
        }

        const auto& path = request.file.remote_path;
        auto save = layout.save_path(request.owner, path);
        auto tmp = layout.tmp_path(request.owner, path);
        if (!layout.contains(save) || !layout.contains(tmp)) {
            FD_LOG_WARN(log_category::queue, "Rejected download outside storage root: " + path);
            return unexpected(error(error_code::invalid_request,
                "local path escapes storage root: " + save.string()));
        }

        auto op = std::make_shared<download_operation>(
            request, std::move(save), std::move(tmp), config.chunk_size);

        auto inserted = index.put_if_absent(request.owner, path, op);
        if (!inserted) {
            FD_LOG_DEBUG(log_category::queue, "Already queued: " + request.owner + path);
            return {};
        }

        {
            std::lock_guard<std::mutex> lock(channel_mutex);
            channel.push_back(inserted->key);
        }
        channel_cv.notify_one();

        download_log_context ctx;
        ctx.account = request.owner;
        ctx.remote_path = path;
        ctx.file_id = request.file.id;
        FD_LOG_DEBUG_CTX(log_category::queue, "Download queued", ctx);

        download_event event;
        event.kind = download_event_kind::added;
        event.owner = request.owner;
        event.remote_path = path;
        event.local_path = op->save_path().string();
        event.linked_to_path = inserted->linked_to_path;
        events.publish(std::move(event));
        return {};
    }

    void cancel(const std::string& owner, const std::string& remote_path) {
        [[maybe_unused]] auto [removed, unlinked] = index.remove(owner, remote_path);
        if (removed) {
            removed->cancel();
            FD_LOG_DEBUG(log_category::queue, "Removed from queue: " + owner + remote_path);
        }

        auto current = get_active();
        if (current && current->owner() == owner && path_covers(remote_path, current->remote_path())) {
            current->cancel();
        }
    }

    void cancel_all(const std::string& owner) {
        auto removed = index.remove_all(owner);
        for (const auto& op : removed) {
            op->cancel();
        }
        FD_LOG_DEBUG(log_category::queue,
            "Removed " + std::to_string(removed.size()) + " queued downloads of " + owner);

        auto current = get_active();
        if (current && current->owner() == owner) {
            current->cancel();
        }
    }

    [[nodiscard]] auto is_downloading(const std::string& owner, const std::string& remote_path) const
        -> bool {
        if (index.contains(owner, remote_path)) {
            return true;
        }
        auto current = get_active();
        return current && current->owner() == owner &&
               (path_covers(current->remote_path(), remote_path) ||
                path_covers(remote_path, current->remote_path()));
    }

    auto resubmit(const std::string& owner, const std::string& remote_path) -> result<void> {
        if (!accounts->exists(owner)) {
            return unexpected(error(error_code::account_not_found, "account gone: " + owner));
        }
        auto store = stores->store_for(owner);
        if (!store) {
            return unexpected(store.error());
        }
        auto record = store.value()->get_file_by_path(remote_path);
        if (!record) {
            return unexpected(record.error());
        }

        const auto& r = record.value();
        download_request request;
        request.owner = owner;
        request.file.id = r.id;
        request.file.parent_id = r.parent_id;
        request.file.remote_path = r.remote_path;
        request.file.length = r.length;
        request.file.creation_timestamp = r.creation_timestamp;
        request.file.modification_timestamp = r.modification_timestamp;
        request.file.remote_id = r.remote_id;
        request.file.etag = r.etag;
        request.file.mime_type = r.mime_type;
        request.file.storage_path = r.storage_path;
        request.is_available_offline = r.available_offline;
        request.is_retry = true;
        return enqueue(request);
    }
};

// ============================================================================
// Builder
// ============================================================================

file_downloader::builder::builder() = default;

auto file_downloader::builder::with_storage_root(std::filesystem::path root) -> builder& {
    config_.storage_root = std::move(root);
    return *this;
}

auto file_downloader::builder::with_client_factory(
    std::shared_ptr<remote_client_factory> factory) -> builder& {
    clients_ = std::move(factory);
    return *this;
}

auto file_downloader::builder::with_account_registry(
    std::shared_ptr<account_registry> registry) -> builder& {
    accounts_ = std::move(registry);
    return *this;
}

auto file_downloader::builder::with_record_store_factory(
    std::shared_ptr<file_record_store_factory> factory) -> builder& {
    stores_ = std::move(factory);
    return *this;
}

auto file_downloader::builder::with_retry_scheduler(
    std::shared_ptr<retry_scheduler> scheduler) -> builder& {
    scheduler_ = std::move(scheduler);
    return *this;
}

auto file_downloader::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto file_downloader::builder::with_connectivity_monitor(
    std::shared_ptr<connectivity_monitor> monitor) -> builder& {
    connectivity_ = std::move(monitor);
    return *this;
}

auto file_downloader::builder::with_notification_sink(
    std::shared_ptr<notification_sink> sink) -> builder& {
    sink_ = std::move(sink);
    return *this;
}

auto file_downloader::builder::with_thread_pool(
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto file_downloader::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto file_downloader::builder::with_success_notification_delay(
    std::chrono::milliseconds delay) -> builder& {
    config_.success_notification_delay = delay;
    return *this;
}

auto file_downloader::builder::with_listener_ttl(std::chrono::milliseconds ttl) -> builder& {
    config_.listener_sweep_interval = ttl;
    return *this;
}

auto file_downloader::builder::build() -> result<file_downloader> {
    if (!clients_ || !accounts_ || !stores_) {
        return unexpected{error{error_code::invalid_configuration,
            "client factory, account registry and record store factory are required"}};
    }
    if (!config_.is_valid()) {
        return unexpected{error{error_code::invalid_configuration,
            "invalid downloader configuration"}};
    }

    get_logger().initialize();

    auto connectivity = connectivity_ ? connectivity_
                                      : std::make_shared<manual_connectivity_monitor>(true);
    auto pool = pool_ ? pool_
                      : adapters::transfer_pool_factory::create(config_.pool_workers,
                                                                "file_downloader_pool");
    auto sink = sink_ ? sink_ : std::make_shared<logging_notification_sink>();

    std::shared_ptr<pool_retry_scheduler> owned;
    auto scheduler = scheduler_;
    if (!scheduler) {
        owned = std::make_shared<pool_retry_scheduler>(pool, connectivity, config_.retry);
        scheduler = owned;
    }

    auto state = std::make_unique<impl>(config_, clients_, accounts_, stores_, connectivity,
                                        pool, scheduler, owned, sink);
    state->owns_pool = !pool_;
    if (owned) {
        auto* raw = state.get();
        owned->set_resubmit_handler([raw](const std::string& owner, const std::string& path) {
            auto queued = raw->resubmit(owner, path);
            if (!queued) {
                FD_LOG_WARN(log_category::retry,
                    "Deferred download not resubmitted: " + queued.error().message);
            }
        });
    }

    FD_LOG_INFO(log_category::queue,
        "File downloader created, storage root " + config_.storage_root.string());
    return file_downloader{std::move(state)};
}

// ============================================================================
// file_downloader
// ============================================================================

file_downloader::file_downloader(std::unique_ptr<impl> state) : impl_(std::move(state)) {}

file_downloader::file_downloader(file_downloader&&) noexcept = default;

auto file_downloader::operator=(file_downloader&& other) noexcept -> file_downloader& {
    if (this != &other) {
        shutdown_worker();
        impl_ = std::move(other.impl_);
    }
    return *this;
}

file_downloader::~file_downloader() {
    shutdown_worker();
}

void file_downloader::shutdown_worker() noexcept {
    if (impl_ && is_running()) {
        auto stopped = stop();
        if (!stopped) {
            FD_LOG_WARN(log_category::worker, "Stop on destruction failed: " + stopped.error().message);
        }
    }
}

auto file_downloader::start() -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->channel_mutex);
    if (impl_->running) {
        return unexpected{error{error_code::already_running}};
    }
    impl_->stopping = false;
    impl_->running = true;
    auto* state = impl_.get();
    impl_->worker = std::thread([state] { state->run(); });
    return {};
}

auto file_downloader::stop() -> result<void> {
    {
        std::lock_guard<std::mutex> lock(impl_->channel_mutex);
        if (!impl_->running) {
            return unexpected{error{error_code::not_running}};
        }
        impl_->stopping = true;
    }
    impl_->channel_cv.notify_all();

    if (auto current = impl_->get_active()) {
        current->cancel();
    }
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }

    std::lock_guard<std::mutex> lock(impl_->channel_mutex);
    impl_->running = false;
    return {};
}

auto file_downloader::is_running() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->channel_mutex);
    return impl_->running;
}

auto file_downloader::request_download(const download_request& request) -> result<void> {
    return impl_->enqueue(request);
}

auto file_downloader::resubmit(const std::string& owner, const std::string& remote_path)
    -> result<void> {
    return impl_->resubmit(owner, remote_path);
}

void file_downloader::cancel(const std::string& owner, const std::string& remote_path) {
    impl_->cancel(owner, remote_path);
}

void file_downloader::cancel_all(const std::string& owner) {
    impl_->cancel_all(owner);
}

auto file_downloader::is_downloading(const std::string& owner,
                                     const std::string& remote_path) const -> bool {
    return impl_->is_downloading(owner, remote_path);
}

void file_downloader::on_accounts_updated() {
    auto current = impl_->get_active();
    if (current && !impl_->accounts->exists(current->owner())) {
        FD_LOG_INFO(log_category::worker,
            "Account removed, cancelling running download of " + current->owner());
        current->cancel();
    }
    auto cached = impl_->sessions.current_owner();
    if (cached && !impl_->accounts->exists(*cached)) {
        impl_->sessions.reset();
    }
}

void file_downloader::add_progress_listener(
    const std::string& owner, int64_t file_id,
    const std::shared_ptr<download_progress_listener>& listener) {
    impl_->listeners.add_listener(owner, file_id, listener);
}

void file_downloader::remove_progress_listener(
    const std::string& owner, int64_t file_id,
    const std::shared_ptr<download_progress_listener>& listener) {
    impl_->listeners.remove_listener(owner, file_id, listener);
}

void file_downloader::clear_progress_listeners() {
    impl_->listeners.clear();
}

auto file_downloader::events() -> download_event_bus& {
    return impl_->events;
}

auto file_downloader::progress_listeners() -> progress_listener_registry& {
    return impl_->listeners;
}

auto file_downloader::pending_count() const -> std::size_t {
    return impl_->index.pending_count();
}

auto file_downloader::config() const -> const downloader_config& {
    return impl_->config;
}

}  // namespace kcenon::file_downloader
