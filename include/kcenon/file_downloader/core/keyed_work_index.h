/**
 * @file keyed_work_index.h
 * @brief Forest index of pending work keyed by account and remote path
 *
 * Every queued path is a node linked under its closest queued ancestor.
 * Intermediate directories that are not queued themselves are kept as
 * placeholder nodes (no payload) so that a later request for a directory
 * can absorb the files already queued below it.
 */

#ifndef KCENON_FILE_DOWNLOADER_CORE_KEYED_WORK_INDEX_H
#define KCENON_FILE_DOWNLOADER_CORE_KEYED_WORK_INDEX_H

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::file_downloader {

/**
 * @brief Result of a successful insertion
 */
struct index_insertion {
    std::string key;
    std::string linked_to_path;  ///< Closest existing ancestor, "/" when none
};

/**
 * @brief Thread-safe forest index of pending operations
 *
 * All public members take the internal mutex for their own duration only.
 *
 * @tparam T Payload type, held through std::shared_ptr
 */
template <typename T>
class keyed_work_index {
public:
    using payload_ptr = std::shared_ptr<T>;
    using removal = std::pair<payload_ptr, std::optional<std::string>>;

    keyed_work_index() = default;

    keyed_work_index(const keyed_work_index&) = delete;
    auto operator=(const keyed_work_index&) -> keyed_work_index& = delete;

    /**
     * @brief Key of an (owner, path) pair
     *
     * The owner is length-prefixed so that owners containing '/' cannot
     * collide with another owner's path.
     */
    [[nodiscard]] static auto build_key(const std::string& owner, const std::string& path)
        -> std::string {
        return std::to_string(owner.size()) + ':' + owner + path;
    }

    /**
     * @brief Insert a payload unless one is already queued for the key
     * @return Key and linked ancestor path, or std::nullopt for a duplicate
     */
    auto put_if_absent(const std::string& owner, const std::string& path, payload_ptr payload)
        -> std::optional<index_insertion> {
        std::lock_guard<std::mutex> lock(mutex_);

        auto key = build_key(owner, path);
        auto it = nodes_.find(key);
        if (it != nodes_.end()) {
            if (it->second.payload) {
                return std::nullopt;
            }
            // placeholder directory becomes a real entry
            it->second.payload = std::move(payload);
            std::string linked = "/";
            if (it->second.parent_key) {
                linked = nodes_.at(*it->second.parent_key).path;
            }
            return index_insertion{key, linked};
        }

        nodes_.emplace(key, node{owner, path, std::move(payload), std::nullopt, {}});

        std::optional<std::string> linked_to;
        std::string child_key = key;
        auto parent = parent_path(path);
        while (parent) {
            auto parent_key = build_key(owner, *parent);
            auto parent_it = nodes_.find(parent_key);
            bool existed = parent_it != nodes_.end();
            if (!existed) {
                parent_it = nodes_.emplace(parent_key,
                    node{owner, *parent, nullptr, std::nullopt, {}}).first;
            }
            parent_it->second.children.insert(child_key);
            nodes_.at(child_key).parent_key = parent_key;
            if (existed) {
                linked_to = *parent;
                break;
            }
            child_key = parent_key;
            parent = parent_path(*parent);
        }

        return index_insertion{key, linked_to.value_or("/")};
    }

    /**
     * @brief Payload stored for a key, nullptr when absent or placeholder
     */
    [[nodiscard]] auto get(const std::string& key) const -> payload_ptr {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nodes_.find(key);
        return it == nodes_.end() ? nullptr : it->second.payload;
    }

    /**
     * @brief True if the path is queued, has queued descendants, or lies
     *        under a queued directory
     */
    [[nodiscard]] auto contains(const std::string& owner, const std::string& path) const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        if (nodes_.count(build_key(owner, path)) > 0) {
            return true;
        }
        auto parent = parent_path(path);
        while (parent) {
            auto it = nodes_.find(build_key(owner, *parent));
            if (it != nodes_.end() && it->second.payload) {
                return true;
            }
            parent = parent_path(*parent);
        }
        return false;
    }

    /**
     * @brief Remove a node together with its whole subtree
     * @return Removed payload and the first surviving ancestor path
     */
    auto remove(const std::string& owner, const std::string& path) -> removal {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = build_key(owner, path);
        auto it = nodes_.find(key);
        if (it == nodes_.end()) {
            return {nullptr, std::nullopt};
        }

        auto payload = it->second.payload;
        auto parent_key = it->second.parent_key;
        erase_subtree(key);
        return {payload, unlink_and_prune(key, parent_key)};
    }

    /**
     * @brief Drop the payload after execution
     *
     * The node itself is removed only when nothing is queued below it.
     * When expected is set, nothing happens unless it is the stored payload.
     */
    auto remove_payload(const std::string& owner, const std::string& path,
                        const payload_ptr& expected = nullptr) -> removal {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = build_key(owner, path);
        auto it = nodes_.find(key);
        if (it == nodes_.end()) {
            return {nullptr, std::nullopt};
        }
        if (expected && it->second.payload != expected) {
            return {nullptr, std::nullopt};
        }

        auto payload = std::move(it->second.payload);
        it->second.payload = nullptr;
        if (!it->second.children.empty()) {
            return {payload, std::nullopt};
        }

        auto parent_key = it->second.parent_key;
        nodes_.erase(it);
        return {payload, unlink_and_prune(key, parent_key)};
    }

    /**
     * @brief Remove every node of exactly this owner
     * @return Payloads that were queued for the owner
     */
    auto remove_all(const std::string& owner) -> std::vector<payload_ptr> {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<payload_ptr> removed;
        for (auto it = nodes_.begin(); it != nodes_.end();) {
            if (it->second.owner == owner) {
                if (it->second.payload) {
                    removed.push_back(it->second.payload);
                }
                it = nodes_.erase(it);
            } else {
                ++it;
            }
        }
        return removed;
    }

    /**
     * @brief Number of nodes carrying a payload
     */
    [[nodiscard]] auto pending_count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0;
        for (const auto& [key, n] : nodes_) {
            if (n.payload) {
                ++count;
            }
        }
        return count;
    }

    [[nodiscard]] auto node_count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return nodes_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return nodes_.empty();
    }

    /**
     * @brief Parent directory of a remote path, std::nullopt for "/"
     */
    [[nodiscard]] static auto parent_path(const std::string& path) -> std::optional<std::string> {
        if (path.empty() || path == "/") {
            return std::nullopt;
        }
        auto trimmed = path;
        if (trimmed.back() == '/') {
            trimmed.pop_back();
        }
        auto pos = trimmed.find_last_of('/');
        if (pos == std::string::npos) {
            return std::string("/");
        }
        return trimmed.substr(0, pos + 1);
    }

private:
    struct node {
        std::string owner;
        std::string path;
        payload_ptr payload;
        std::optional<std::string> parent_key;
        std::set<std::string> children;
    };

    void erase_subtree(const std::string& key) {
        auto it = nodes_.find(key);
        if (it == nodes_.end()) {
            return;
        }
        auto children = it->second.children;
        nodes_.erase(it);
        for (const auto& child : children) {
            erase_subtree(child);
        }
    }

    // Detaches an erased child and removes ancestors that only existed for it.
    auto unlink_and_prune(const std::string& child_key, std::optional<std::string> parent_key)
        -> std::optional<std::string> {
        std::string removed = child_key;
        while (parent_key) {
            auto it = nodes_.find(*parent_key);
            if (it == nodes_.end()) {
                return std::nullopt;
            }
            it->second.children.erase(removed);
            if (it->second.payload || !it->second.children.empty()) {
                return it->second.path;
            }
            removed = it->first;
            parent_key = it->second.parent_key;
            nodes_.erase(it);
        }
        return std::nullopt;
    }

    mutable std::mutex mutex_;
    std::map<std::string, node> nodes_;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_CORE_KEYED_WORK_INDEX_H
