/**
 * @file download_operation.h
 * @brief Single file download unit of work
 *
 * An operation copies the remote body into a temporary file and moves it
 * to the save path once the whole body arrived.
 *
 * Cancellation is cooperative. The cancellation state is checked:
 * 1. before the download stream is opened
 * 2. before each chunk is read
 * 3. before the temporary file is committed to the save path
 *
 * The commit step and cancel() race on one atomic state: when cancel()
 * returns true, execute() is guaranteed to report error_code::cancelled
 * and the temporary file is removed without being moved.
 */

#ifndef KCENON_FILE_DOWNLOADER_CORE_DOWNLOAD_OPERATION_H
#define KCENON_FILE_DOWNLOADER_CORE_DOWNLOAD_OPERATION_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "kcenon/file_downloader/client/remote_client.h"
#include "kcenon/file_downloader/core/download_result.h"
#include "kcenon/file_downloader/core/remote_file.h"

namespace kcenon::file_downloader {

/**
 * @brief Progress sample reported while a download runs
 */
struct download_progress {
    uint64_t progress_rate = 0;      ///< Bytes since the previous sample
    uint64_t transferred_bytes = 0;  ///< Bytes so far
    int64_t total_bytes = -1;        ///< -1 when the server did not declare a length
    std::string file_name;

    [[nodiscard]] auto percent() const -> int {
        if (total_bytes <= 0) {
            return -1;
        }
        return static_cast<int>((transferred_bytes * 100) / static_cast<uint64_t>(total_bytes));
    }
};

enum class operation_state : int {
    pending = 0,
    running = 1,
    committed = 2,
    cancelled = 3
};

class download_operation {
public:
    using progress_callback = std::function<void(const download_progress&)>;
    using callback_id = uint64_t;

    static constexpr std::size_t default_chunk_size = 4096;

    download_operation(download_request request,
                       std::filesystem::path save_path,
                       std::filesystem::path tmp_path,
                       std::size_t chunk_size = default_chunk_size);

    download_operation(const download_operation&) = delete;
    auto operator=(const download_operation&) -> download_operation& = delete;

    /**
     * @brief Run the download against a client
     *
     * Remote clients may throw, the temporary file is removed in that case
     * and the exception propagates to the caller.
     */
    [[nodiscard]] auto execute(remote_client& client) -> download_result;

    /**
     * @brief Request cancellation
     * @return false if the operation already committed its file
     */
    auto cancel() -> bool;

    [[nodiscard]] auto is_cancelled() const -> bool;
    [[nodiscard]] auto state() const -> operation_state;

    auto add_progress_callback(progress_callback callback) -> callback_id;
    void remove_progress_callback(callback_id id);

    [[nodiscard]] auto owner() const -> const std::string& { return request_.owner; }
    [[nodiscard]] auto remote_path() const -> const std::string& { return request_.file.remote_path; }
    [[nodiscard]] auto request() const -> const download_request& { return request_; }

    /**
     * @brief File descriptor, refreshed with server metadata after execute()
     */
    [[nodiscard]] auto file() const -> remote_file;

    [[nodiscard]] auto save_path() const -> const std::filesystem::path& { return save_path_; }
    [[nodiscard]] auto tmp_path() const -> const std::filesystem::path& { return tmp_path_; }
    [[nodiscard]] auto transferred_bytes() const -> uint64_t { return transferred_.load(); }

private:
    auto download_to_tmp(remote_client& client) -> download_result;
    auto commit() -> download_result;
    void notify_progress(const download_progress& progress);
    [[nodiscard]] auto failure_from(const error& err) const -> download_result;

    download_request request_;
    std::filesystem::path save_path_;
    std::filesystem::path tmp_path_;
    std::size_t chunk_size_;

    std::atomic<int> state_{static_cast<int>(operation_state::pending)};
    std::atomic<uint64_t> transferred_{0};

    mutable std::mutex mutex_;
    std::vector<std::pair<callback_id, progress_callback>> callbacks_;
    callback_id next_callback_id_{1};
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_CORE_DOWNLOAD_OPERATION_H
