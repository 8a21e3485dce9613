/**
 * @file storage_layout.h
 * @brief Local storage paths for downloaded files
 *
 * Layout:
 * - save path: <root>/<encoded owner>/<remote path>
 * - temporary: <root>/tmp/<encoded owner>/<remote path>
 */

#ifndef KCENON_FILE_DOWNLOADER_CORE_STORAGE_LAYOUT_H
#define KCENON_FILE_DOWNLOADER_CORE_STORAGE_LAYOUT_H

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>

namespace kcenon::file_downloader {

class storage_layout {
public:
    storage_layout() = default;

    explicit storage_layout(std::filesystem::path root) : root_(std::move(root)) {}

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

    [[nodiscard]] auto save_path(const std::string& owner, const std::string& remote_path) const
        -> std::filesystem::path {
        return root_ / encode_owner(owner) / relative(remote_path);
    }

    [[nodiscard]] auto tmp_path(const std::string& owner, const std::string& remote_path) const
        -> std::filesystem::path {
        return root_ / "tmp" / encode_owner(owner) / relative(remote_path);
    }

    /**
     * @brief True if the path stays below the storage root once normalized
     */
    [[nodiscard]] auto contains(const std::filesystem::path& path) const -> bool {
        auto base = root_.lexically_normal();
        auto target = path.lexically_normal();
        auto rel = target.lexically_relative(base);
        if (rel.empty() || rel == ".") {
            return false;
        }
        return *rel.begin() != "..";
    }

    /**
     * @brief Percent-encode an account name for use as a directory name
     *
     * Alphanumerics and "-_.~@" are kept as they are.
     */
    [[nodiscard]] static auto encode_owner(const std::string& owner) -> std::string {
        std::string encoded;
        encoded.reserve(owner.size());
        for (unsigned char c : owner) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '@') {
                encoded += static_cast<char>(c);
            } else {
                char buf[4];
                std::snprintf(buf, sizeof(buf), "%%%02X", c);
                encoded += buf;
            }
        }
        return encoded;
    }

private:
    [[nodiscard]] static auto relative(const std::string& remote_path) -> std::filesystem::path {
        auto start = remote_path.find_first_not_of('/');
        if (start == std::string::npos) {
            return {};
        }
        return std::filesystem::path(remote_path.substr(start));
    }

    std::filesystem::path root_;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_CORE_STORAGE_LAYOUT_H
