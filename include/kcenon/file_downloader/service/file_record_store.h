/**
 * @file file_record_store.h
 * @brief Persistent metadata of synchronized files
 */

#ifndef KCENON_FILE_DOWNLOADER_SERVICE_FILE_RECORD_STORE_H
#define KCENON_FILE_DOWNLOADER_SERVICE_FILE_RECORD_STORE_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/file_downloader/core/remote_file.h"
#include "kcenon/file_downloader/core/types.h"

namespace kcenon::file_downloader {

/**
 * @brief Metadata persisted for one remote file
 *
 * Timestamps are milliseconds since epoch.
 */
struct file_record {
    int64_t id = 0;
    std::optional<int64_t> parent_id;
    std::string owner;
    std::string remote_path;
    std::string remote_id;
    std::string name;
    int64_t length = 0;
    int64_t creation_timestamp = 0;
    int64_t modification_timestamp = 0;
    int64_t modified_at_last_sync_for_data = 0;
    int64_t last_sync_date_for_properties = 0;
    int64_t last_sync_date_for_data = 0;
    std::string mime_type;
    std::string etag;
    std::optional<std::string> etag_in_conflict;
    std::string storage_path;
    bool needs_thumbnail_update = false;
    bool available_offline = false;

    /**
     * @brief Build a record from a remote file descriptor
     */
    [[nodiscard]] static auto from_remote(const std::string& owner, const remote_file& file)
        -> file_record {
        file_record record;
        record.id = file.id.value_or(0);
        record.parent_id = file.parent_id;
        record.owner = owner;
        record.remote_path = file.remote_path;
        record.remote_id = file.remote_id;
        record.name = file.file_name();
        record.length = file.length < 0 ? 0 : file.length;
        record.creation_timestamp = file.creation_timestamp;
        record.modification_timestamp = file.modification_timestamp;
        record.mime_type = file.mime_type;
        record.etag = file.etag;
        record.storage_path = file.storage_path;
        return record;
    }
};

/**
 * @brief Store of file records for one account
 *
 * save_file() is an idempotent upsert keyed by record id.
 */
class file_record_store {
public:
    virtual ~file_record_store() = default;

    [[nodiscard]] virtual auto save_file(const file_record& record) -> result<void> = 0;

    /**
     * @brief Set or clear the conflicting etag of a record
     */
    [[nodiscard]] virtual auto save_conflict(const file_record& record,
                                             std::optional<std::string> etag_in_conflict)
        -> result<void> = 0;

    [[nodiscard]] virtual auto get_file_by_id(int64_t id) -> result<file_record> = 0;

    [[nodiscard]] virtual auto get_file_by_path(const std::string& remote_path)
        -> result<file_record> = 0;
};

/**
 * @brief Opens the record store of an account
 */
class file_record_store_factory {
public:
    virtual ~file_record_store_factory() = default;

    [[nodiscard]] virtual auto store_for(const std::string& owner)
        -> result<std::shared_ptr<file_record_store>> = 0;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_SERVICE_FILE_RECORD_STORE_H
