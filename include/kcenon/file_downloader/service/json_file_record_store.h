/**
 * @file json_file_record_store.h
 * @brief File record store persisting one JSON document per file
 *
 * Records of an account live in <state_directory>/<id>.json and are cached
 * in memory after the first access.
 */

#ifndef KCENON_FILE_DOWNLOADER_SERVICE_JSON_FILE_RECORD_STORE_H
#define KCENON_FILE_DOWNLOADER_SERVICE_JSON_FILE_RECORD_STORE_H

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/file_downloader/service/file_record_store.h"

namespace kcenon::file_downloader {

class json_file_record_store : public file_record_store {
public:
    /**
     * @brief Open (and create if needed) a store directory
     */
    explicit json_file_record_store(std::filesystem::path state_directory);
    ~json_file_record_store() override;

    json_file_record_store(const json_file_record_store&) = delete;
    auto operator=(const json_file_record_store&) -> json_file_record_store& = delete;

    [[nodiscard]] auto save_file(const file_record& record) -> result<void> override;

    [[nodiscard]] auto save_conflict(const file_record& record,
                                     std::optional<std::string> etag_in_conflict)
        -> result<void> override;

    [[nodiscard]] auto get_file_by_id(int64_t id) -> result<file_record> override;

    [[nodiscard]] auto get_file_by_path(const std::string& remote_path)
        -> result<file_record> override;

    [[nodiscard]] auto remove_file(int64_t id) -> result<void>;

    [[nodiscard]] auto list_files() -> std::vector<file_record>;

    [[nodiscard]] auto state_directory() const -> const std::filesystem::path&;

    /**
     * @brief Serialize a record to the on-disk JSON format
     */
    [[nodiscard]] static auto to_json(const file_record& record) -> std::string;

    [[nodiscard]] static auto from_json(const std::string& json) -> result<file_record>;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Factory placing each account's store under <root>/<encoded owner>
 */
class json_file_record_store_factory : public file_record_store_factory {
public:
    explicit json_file_record_store_factory(std::filesystem::path root);

    [[nodiscard]] auto store_for(const std::string& owner)
        -> result<std::shared_ptr<file_record_store>> override;

private:
    std::filesystem::path root_;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_SERVICE_JSON_FILE_RECORD_STORE_H
