/**
 * @file json_file_record_store.cpp
 * @brief Implementation of json_file_record_store
 */

#include <kcenon/file_downloader/service/json_file_record_store.h>
#include <kcenon/file_downloader/core/logging.h>
#include <kcenon/file_downloader/core/storage_layout.h>

#include <fstream>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <sstream>

namespace kcenon::file_downloader {

// ============================================================================
// JSON serialization helpers
// ============================================================================

namespace {

auto escape_json_string(const std::string& s) -> std::string {
    return detail::escape_json_string(s);
}

void append_utf8(std::string& out, unsigned int code) {
    if (code < 0x80) {
        out += static_cast<char>(code);
    } else if (code < 0x800) {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    }
}

auto unescape_json_string(const std::string& s) -> std::string {
    std::string result;
    result.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 >= s.size()) {
            result += s[i];
            continue;
        }
        switch (s[i + 1]) {
            case '"': result += '"'; ++i; break;
            case '\\': result += '\\'; ++i; break;
            case '/': result += '/'; ++i; break;
            case 'b': result += '\b'; ++i; break;
            case 'f': result += '\f'; ++i; break;
            case 'n': result += '\n'; ++i; break;
            case 'r': result += '\r'; ++i; break;
            case 't': result += '\t'; ++i; break;
            case 'u':
                if (i + 5 < s.size()) {
                    append_utf8(result, static_cast<unsigned int>(
                        std::stoul(s.substr(i + 2, 4), nullptr, 16)));
                    i += 5;
                }
                break;
            default: result += s[i]; break;
        }
    }
    return result;
}

/**
 * @brief Raw value for a key; strings are returned unquoted and still escaped
 * @return std::nullopt when the key is missing
 */
auto extract_json_value(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto key_pos = json.find("\"" + key + "\":");
    if (key_pos == std::string::npos) {
        return std::nullopt;
    }

    auto value_start = key_pos + key.size() + 3;
    while (value_start < json.size() &&
           (json[value_start] == ' ' || json[value_start] == '\n' ||
            json[value_start] == '\t')) {
        ++value_start;
    }
    if (value_start >= json.size()) {
        return std::nullopt;
    }

    if (json[value_start] == '"') {
        auto end = value_start + 1;
        while (end < json.size() && json[end] != '"') {
            end += json[end] == '\\' ? 2 : 1;
        }
        if (end >= json.size()) {
            return std::nullopt;
        }
        return json.substr(value_start + 1, end - value_start - 1);
    }

    auto value_end = value_start;
    while (value_end < json.size() &&
           json[value_end] != ',' && json[value_end] != '\n' &&
           json[value_end] != '}') {
        ++value_end;
    }
    auto value = json.substr(value_start, value_end - value_start);
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) {
        value.pop_back();
    }
    return value;
}

auto get_record_file_path(const std::filesystem::path& dir, int64_t id) -> std::filesystem::path {
    return dir / (std::to_string(id) + ".json");
}

}  // namespace

auto json_file_record_store::to_json(const file_record& record) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"id\": " << record.id << ",\n";
    if (record.parent_id) {
        oss << "  \"parent_id\": " << *record.parent_id << ",\n";
    } else {
        oss << "  \"parent_id\": null,\n";
    }
    oss << "  \"owner\": \"" << escape_json_string(record.owner) << "\",\n";
    oss << "  \"remote_path\": \"" << escape_json_string(record.remote_path) << "\",\n";
    oss << "  \"remote_id\": \"" << escape_json_string(record.remote_id) << "\",\n";
    oss << "  \"name\": \"" << escape_json_string(record.name) << "\",\n";
    oss << "  \"length\": " << record.length << ",\n";
    oss << "  \"creation_timestamp\": " << record.creation_timestamp << ",\n";
    oss << "  \"modification_timestamp\": " << record.modification_timestamp << ",\n";
    oss << "  \"modified_at_last_sync_for_data\": " << record.modified_at_last_sync_for_data << ",\n";
    oss << "  \"last_sync_date_for_properties\": " << record.last_sync_date_for_properties << ",\n";
    oss << "  \"last_sync_date_for_data\": " << record.last_sync_date_for_data << ",\n";
    oss << "  \"mime_type\": \"" << escape_json_string(record.mime_type) << "\",\n";
    oss << "  \"etag\": \"" << escape_json_string(record.etag) << "\",\n";
    if (record.etag_in_conflict) {
        oss << "  \"etag_in_conflict\": \"" << escape_json_string(*record.etag_in_conflict) << "\",\n";
    } else {
        oss << "  \"etag_in_conflict\": null,\n";
    }
    oss << "  \"storage_path\": \"" << escape_json_string(record.storage_path) << "\",\n";
    oss << "  \"needs_thumbnail_update\": " << (record.needs_thumbnail_update ? "true" : "false") << ",\n";
    oss << "  \"available_offline\": " << (record.available_offline ? "true" : "false") << "\n";
    oss << "}";
    return oss.str();
}

auto json_file_record_store::from_json(const std::string& json) -> result<file_record> {
    file_record record;

    auto id = extract_json_value(json, "id");
    auto remote_path = extract_json_value(json, "remote_path");
    if (!id || !remote_path) {
        return unexpected(error(error_code::record_store_error, "missing required field"));
    }

    auto text = [&json](const char* key) {
        auto value = extract_json_value(json, key);
        return value ? unescape_json_string(*value) : std::string{};
    };
    auto number = [&json](const char* key) -> int64_t {
        auto value = extract_json_value(json, key);
        return value && !value->empty() ? std::stoll(*value) : 0;
    };
    auto flag = [&json](const char* key) {
        auto value = extract_json_value(json, key);
        return value && *value == "true";
    };

    try {
        record.id = std::stoll(*id);
        auto parent = extract_json_value(json, "parent_id");
        if (parent && *parent != "null") {
            record.parent_id = std::stoll(*parent);
        }
        record.length = number("length");
        record.creation_timestamp = number("creation_timestamp");
        record.modification_timestamp = number("modification_timestamp");
        record.modified_at_last_sync_for_data = number("modified_at_last_sync_for_data");
        record.last_sync_date_for_properties = number("last_sync_date_for_properties");
        record.last_sync_date_for_data = number("last_sync_date_for_data");

        record.owner = text("owner");
        record.remote_path = unescape_json_string(*remote_path);
        record.remote_id = text("remote_id");
        record.name = text("name");
        record.mime_type = text("mime_type");
        record.etag = text("etag");
        auto conflict = extract_json_value(json, "etag_in_conflict");
        if (conflict && *conflict != "null") {
            record.etag_in_conflict = unescape_json_string(*conflict);
        }
        record.storage_path = text("storage_path");
    } catch (const std::exception&) {
        return unexpected(error(error_code::record_store_error, "invalid field value"));
    }

    record.needs_thumbnail_update = flag("needs_thumbnail_update");
    record.available_offline = flag("available_offline");
    return record;
}

// ============================================================================
// json_file_record_store::impl
// ============================================================================

class json_file_record_store::impl {
public:
    explicit impl(std::filesystem::path dir) : directory_(std::move(dir)) {
        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec) {
            FD_LOG_WARN(log_category::store,
                "Cannot create record directory " + directory_.string() + ": " + ec.message());
        }
    }

    auto save(const file_record& record) -> result<void> {
        std::unique_lock lock(mutex_);

        auto path = get_record_file_path(directory_, record.id);
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            FD_LOG_ERROR(log_category::store, "Failed to open record file: " + path.string());
            return unexpected(error(error_code::record_store_error,
                "failed to open record file for writing"));
        }
        file << json_file_record_store::to_json(record);
        if (!file) {
            FD_LOG_ERROR(log_category::store, "Failed to write record file: " + path.string());
            return unexpected(error(error_code::record_store_error, "failed to write record file"));
        }

        cache_[record.id] = record;
        FD_LOG_TRACE(log_category::store, "Record persisted to: " + path.string());
        return {};
    }

    auto load(int64_t id) -> result<file_record> {
        {
            std::shared_lock lock(mutex_);
            auto it = cache_.find(id);
            if (it != cache_.end()) {
                return it->second;
            }
        }

        auto path = get_record_file_path(directory_, id);
        auto loaded = read_file(path);
        if (!loaded) {
            return loaded;
        }

        std::unique_lock lock(mutex_);
        cache_[id] = loaded.value();
        return loaded;
    }

    auto find_by_path(const std::string& remote_path) -> result<file_record> {
        for (const auto& record : list()) {
            if (record.remote_path == remote_path) {
                return record;
            }
        }
        return unexpected(error(error_code::record_not_found, "no record for " + remote_path));
    }

    auto remove(int64_t id) -> result<void> {
        std::unique_lock lock(mutex_);
        cache_.erase(id);

        auto path = get_record_file_path(directory_, id);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            FD_LOG_ERROR(log_category::store,
                "Failed to delete record file: " + path.string() + " (" + ec.message() + ")");
            return unexpected(error(error_code::record_store_error,
                "failed to delete record file: " + ec.message()));
        }
        return {};
    }

    auto list() -> std::vector<file_record> {
        std::vector<file_record> records;
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
            if (entry.path().extension() != ".json") {
                continue;
            }
            auto loaded = read_file(entry.path());
            if (loaded) {
                records.push_back(std::move(loaded.value()));
            } else {
                FD_LOG_WARN(log_category::store,
                    "Skipping unreadable record " + entry.path().string() + ": " +
                    loaded.error().message);
            }
        }
        return records;
    }

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return directory_; }

private:
    static auto read_file(const std::filesystem::path& path) -> result<file_record> {
        std::ifstream file(path);
        if (!file) {
            return unexpected(error(error_code::record_not_found,
                "record file not found: " + path.string()));
        }
        std::ostringstream oss;
        oss << file.rdbuf();
        return json_file_record_store::from_json(oss.str());
    }

    std::filesystem::path directory_;
    mutable std::shared_mutex mutex_;
    std::map<int64_t, file_record> cache_;
};

// ============================================================================
// json_file_record_store
// ============================================================================

json_file_record_store::json_file_record_store(std::filesystem::path state_directory)
    : impl_(std::make_unique<impl>(std::move(state_directory))) {}

json_file_record_store::~json_file_record_store() = default;

auto json_file_record_store::save_file(const file_record& record) -> result<void> {
    FD_LOG_DEBUG(log_category::store,
        "Saving record " + std::to_string(record.id) + " (" + record.remote_path + ")");
    return impl_->save(record);
}

auto json_file_record_store::save_conflict(const file_record& record,
                                           std::optional<std::string> etag_in_conflict)
    -> result<void> {
    auto stored = impl_->load(record.id);
    file_record updated = stored ? stored.value() : record;
    updated.etag_in_conflict = std::move(etag_in_conflict);
    return impl_->save(updated);
}

auto json_file_record_store::get_file_by_id(int64_t id) -> result<file_record> {
    return impl_->load(id);
}

auto json_file_record_store::get_file_by_path(const std::string& remote_path)
    -> result<file_record> {
    return impl_->find_by_path(remote_path);
}

auto json_file_record_store::remove_file(int64_t id) -> result<void> {
    return impl_->remove(id);
}

auto json_file_record_store::list_files() -> std::vector<file_record> {
    return impl_->list();
}

auto json_file_record_store::state_directory() const -> const std::filesystem::path& {
    return impl_->directory();
}

// ============================================================================
// json_file_record_store_factory
// ============================================================================

json_file_record_store_factory::json_file_record_store_factory(std::filesystem::path root)
    : root_(std::move(root)) {}

auto json_file_record_store_factory::store_for(const std::string& owner)
    -> result<std::shared_ptr<file_record_store>> {
    if (owner.empty()) {
        return unexpected(error(error_code::missing_account));
    }
    auto dir = root_ / storage_layout::encode_owner(owner);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return unexpected(error(error_code::record_store_error,
            "cannot create " + dir.string() + ": " + ec.message()));
    }
    return std::shared_ptr<file_record_store>(std::make_shared<json_file_record_store>(dir));
}

}  // namespace kcenon::file_downloader
