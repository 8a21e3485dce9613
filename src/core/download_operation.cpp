/**
 * @file download_operation.cpp
 * @brief Implementation of download_operation
 */

#include <kcenon/file_downloader/core/download_operation.h>
#include <kcenon/file_downloader/core/logging.h>

#include <fstream>
#include <system_error>

namespace kcenon::file_downloader {

namespace {

// Removes the temporary file unless released after a successful commit.
class tmp_file_guard {
public:
    explicit tmp_file_guard(const std::filesystem::path& path) : path_(path) {}

    ~tmp_file_guard() {
        if (!released_) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }
    }

    tmp_file_guard(const tmp_file_guard&) = delete;
    auto operator=(const tmp_file_guard&) -> tmp_file_guard& = delete;

    void release() { released_ = true; }

private:
    const std::filesystem::path& path_;
    bool released_ = false;
};

auto move_file(const std::filesystem::path& from, const std::filesystem::path& to)
    -> std::error_code {
    std::error_code ec;
    std::filesystem::create_directories(to.parent_path(), ec);
    if (ec) {
        return ec;
    }
    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return ec;
    }

    // rename fails across file systems
    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return ec;
    }
    std::filesystem::remove(from, ec);
    return ec;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

download_operation::download_operation(download_request request,
                                       std::filesystem::path save_path,
                                       std::filesystem::path tmp_path,
                                       std::size_t chunk_size)
    : request_(std::move(request))
    , save_path_(std::move(save_path))
    , tmp_path_(std::move(tmp_path))
    , chunk_size_(chunk_size == 0 ? default_chunk_size : chunk_size) {
}

// ============================================================================
// Cancellation
// ============================================================================

auto download_operation::cancel() -> bool {
    int current = state_.load();
    while (true) {
        if (current == static_cast<int>(operation_state::committed)) {
            return false;
        }
        if (current == static_cast<int>(operation_state::cancelled)) {
            return true;
        }
        if (state_.compare_exchange_weak(current, static_cast<int>(operation_state::cancelled))) {
            FD_LOG_DEBUG(log_category::operation,
                "Cancellation requested: " + request_.owner + request_.file.remote_path);
            return true;
        }
    }
}

auto download_operation::is_cancelled() const -> bool {
    return state_.load() == static_cast<int>(operation_state::cancelled);
}

auto download_operation::state() const -> operation_state {
    return static_cast<operation_state>(state_.load());
}

// ============================================================================
// Progress callbacks
// ============================================================================

auto download_operation::add_progress_callback(progress_callback callback) -> callback_id {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_callback_id_++;
    callbacks_.emplace_back(id, std::move(callback));
    return id;
}

void download_operation::remove_progress_callback(callback_id id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
        if (it->first == id) {
            callbacks_.erase(it);
            return;
        }
    }
}

void download_operation::notify_progress(const download_progress& progress) {
    std::vector<progress_callback> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(callbacks_.size());
        for (const auto& [id, cb] : callbacks_) {
            snapshot.push_back(cb);
        }
    }
    for (const auto& cb : snapshot) {
        cb(progress);
    }
}

auto download_operation::file() const -> remote_file {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_.file;
}

// ============================================================================
// Execution
// ============================================================================

auto download_operation::execute(remote_client& client) -> download_result {
    int expected = static_cast<int>(operation_state::pending);
    if (!state_.compare_exchange_strong(expected, static_cast<int>(operation_state::running))) {
        if (expected == static_cast<int>(operation_state::cancelled)) {
            return download_result::cancelled();
        }
        return download_result::failure(error_code::internal_error,
                                        "operation executed twice");
    }

    download_log_context ctx;
    ctx.account = request_.owner;
    ctx.remote_path = request_.file.remote_path;
    ctx.local_path = save_path_.string();
    FD_LOG_DEBUG_CTX(log_category::operation, "Download operation started", ctx);

    if (request_.file.is_directory()) {
        std::error_code ec;
        std::filesystem::create_directories(save_path_, ec);
        if (ec) {
            return download_result::failure(error_code::local_file_write_error, ec.message());
        }
        return commit();
    }

    tmp_file_guard guard(tmp_path_);
    auto downloaded = download_to_tmp(client);
    if (!downloaded.is_success()) {
        return is_cancelled() ? download_result::cancelled() : downloaded;
    }

    auto committed = commit();
    if (committed.is_success()) {
        guard.release();
    }
    return committed;
}

auto download_operation::download_to_tmp(remote_client& client) -> download_result {
    // checkpoint 1
    if (is_cancelled()) {
        return download_result::cancelled();
    }

    auto opened = client.open_download(request_.file.remote_path);
    if (!opened) {
        return failure_from(opened.error());
    }
    auto stream = std::move(opened.value());

    auto declared = stream->total_size();
    int64_t total = declared ? static_cast<int64_t>(*declared) : request_.file.length;

    std::error_code ec;
    std::filesystem::create_directories(tmp_path_.parent_path(), ec);
    if (ec) {
        return download_result::failure(error_code::local_file_write_error,
            "cannot create " + tmp_path_.parent_path().string() + ": " + ec.message());
    }

    if (total > 0) {
        auto space = std::filesystem::space(tmp_path_.parent_path(), ec);
        if (!ec && space.available < static_cast<uintmax_t>(total)) {
            return download_result::failure(error_code::local_storage_full);
        }
    }

    std::ofstream out(tmp_path_, std::ios::binary | std::ios::trunc);
    if (!out) {
        return download_result::failure(error_code::local_file_write_error,
            "cannot open " + tmp_path_.string());
    }

    std::vector<std::byte> buffer(chunk_size_);
    auto name = request_.file.file_name();
    transferred_ = 0;

    while (stream->has_more()) {
        // checkpoint 2
        if (is_cancelled()) {
            return download_result::cancelled();
        }

        auto read = stream->read(std::span<std::byte>(buffer.data(), buffer.size()));
        if (!read) {
            return failure_from(read.error());
        }
        auto count = read.value();
        if (count == 0) {
            continue;
        }

        out.write(reinterpret_cast<const char*>(buffer.data()),
                  static_cast<std::streamsize>(count));
        if (!out) {
            return download_result::failure(error_code::local_file_write_error,
                "write failed on " + tmp_path_.string());
        }

        auto so_far = transferred_.fetch_add(count) + count;
        notify_progress(download_progress{count, so_far, total, name});
    }

    out.close();
    if (!out) {
        return download_result::failure(error_code::local_file_write_error,
            "close failed on " + tmp_path_.string());
    }

    if (declared && transferred_.load() != *declared) {
        return download_result::failure(error_code::incomplete_transfer,
            "received " + std::to_string(transferred_.load()) + " of " +
            std::to_string(*declared) + " bytes");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto etag = stream->etag()) {
        request_.file.etag = *etag;
    }
    if (auto mime = stream->mime_type()) {
        request_.file.mime_type = *mime;
    }
    if (auto modified = stream->modification_timestamp()) {
        request_.file.modification_timestamp = *modified;
    }
    return download_result::ok();
}

auto download_operation::commit() -> download_result {
    // checkpoint 3
    int expected = static_cast<int>(operation_state::running);
    if (!state_.compare_exchange_strong(expected, static_cast<int>(operation_state::committed))) {
        return download_result::cancelled();
    }

    if (!request_.file.is_directory()) {
        auto ec = move_file(tmp_path_, save_path_);
        if (ec) {
            FD_LOG_ERROR(log_category::operation,
                "Could not move " + tmp_path_.string() + " to " + save_path_.string() +
                ": " + ec.message());
            return download_result::failure(error_code::local_storage_not_moved, ec.message());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    request_.file.storage_path = save_path_.string();
    return download_result::ok();
}

auto download_operation::failure_from(const error& err) const -> download_result {
    if (is_cancelled()) {
        return download_result::cancelled();
    }
    if (is_connection_error(err.code)) {
        return download_result::failure_with_cause(err.code, failure_cause{err.code, err.message});
    }
    return download_result::failure(err.code, err.message);
}

}  // namespace kcenon::file_downloader
