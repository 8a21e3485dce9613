/**
 * @file http_remote_client.cpp
 * @brief Implementation of http_remote_client
 */

#include "kcenon/file_downloader/client/http_remote_client.h"
#include "kcenon/file_downloader/core/download_result.h"
#include "kcenon/file_downloader/core/logging.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <vector>

#include "kcenon/file_downloader/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::file_downloader {

namespace {

constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

auto base64_encode(const std::string& data) -> std::string {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(static_cast<unsigned char>(data[i + 2]));

        out += BASE64_CHARS[(n >> 18) & 0x3F];
        out += BASE64_CHARS[(n >> 12) & 0x3F];
        out += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        out += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }
    return out;
}

// Percent-encodes a remote path, keeping '/' separators.
auto encode_path(const std::string& path) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : path) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(uc);
        }
    }
    return escaped.str();
}

// RFC 1123 date, e.g. "Tue, 15 Nov 1994 08:12:31 GMT"
auto parse_http_date(const std::string& value) -> std::optional<int64_t> {
    std::tm tm = {};
    std::istringstream ss(value);
    ss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    auto seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(seconds) * 1000;
}

auto find_header(const std::map<std::string, std::string>& headers, const std::string& name)
    -> std::optional<std::string> {
    for (const auto& [key, value] : headers) {
        if (key.size() == name.size() &&
            std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) ==
                       std::tolower(static_cast<unsigned char>(b));
            })) {
            return value;
        }
    }
    return std::nullopt;
}

/**
 * @brief Stream over a fully received response body
 */
class buffered_download_stream : public remote_download_stream {
public:
    buffered_download_stream(std::vector<std::byte> body,
                             const std::map<std::string, std::string>& headers)
        : body_(std::move(body)) {
        etag_ = find_header(headers, "ETag");
        mime_type_ = find_header(headers, "Content-Type");
        if (auto modified = find_header(headers, "Last-Modified")) {
            modified_ = parse_http_date(*modified);
        }
        if (auto length = find_header(headers, "Content-Length")) {
            try {
                total_ = std::stoull(*length);
            } catch (const std::exception&) {
                total_ = std::nullopt;
            }
        }
        if (!total_) {
            total_ = body_.size();
        }
    }

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        auto count = std::min(buffer.size(), body_.size() - offset_);
        if (count > 0) {
            std::memcpy(buffer.data(), body_.data() + offset_, count);
            offset_ += count;
        }
        return count;
    }

    [[nodiscard]] auto has_more() const -> bool override { return offset_ < body_.size(); }
    [[nodiscard]] auto total_size() const -> std::optional<uint64_t> override { return total_; }
    [[nodiscard]] auto etag() const -> std::optional<std::string> override { return etag_; }
    [[nodiscard]] auto mime_type() const -> std::optional<std::string> override {
        return mime_type_;
    }
    [[nodiscard]] auto modification_timestamp() const -> std::optional<int64_t> override {
        return modified_;
    }

private:
    std::vector<std::byte> body_;
    std::size_t offset_ = 0;
    std::optional<uint64_t> total_;
    std::optional<std::string> etag_;
    std::optional<std::string> mime_type_;
    std::optional<int64_t> modified_;
};

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct http_remote_client::impl {
    std::string owner;
    account_credentials credentials;
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif

    impl(std::string account, account_credentials creds, std::chrono::milliseconds timeout)
        : owner(std::move(account)), credentials(std::move(creds)) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
#else
        (void)timeout;
#endif
    }
};

http_remote_client::http_remote_client(std::string owner, account_credentials credentials,
                                       std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(std::move(owner), std::move(credentials), timeout)) {}

http_remote_client::~http_remote_client() = default;

auto http_remote_client::owner() const -> const std::string& {
    return impl_->owner;
}

auto http_remote_client::url_for(const std::string& remote_path) const -> std::string {
    auto base = impl_->credentials.base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    auto path = encode_path(remote_path);
    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    return base + path;
}

auto http_remote_client::authorization() const -> std::string {
    const auto& creds = impl_->credentials;
    if (creds.kind == credentials_kind::bearer) {
        return "Bearer " + creds.secret;
    }
    return "Basic " + base64_encode(creds.username + ":" + creds.secret);
}

auto http_remote_client::map_status(int status_code) -> error_code {
    switch (status_code) {
        case 401:
            return error_code::unauthorized;
        case 403:
            return error_code::forbidden;
        case 404:
            return error_code::file_not_found;
        case 503:
            return error_code::service_unavailable;
        default:
            break;
    }
    if (status_code >= 500 && status_code < 600) {
        return error_code::server_error;
    }
    return error_code::unhandled_http_code;
}

auto http_remote_client::open_download(const std::string& remote_path)
    -> result<std::unique_ptr<remote_download_stream>> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::not_initialized, "HTTP client not initialized"}};
    }

    auto url = url_for(remote_path);
    std::map<std::string, std::string> headers{{"Authorization", authorization()}};

    auto response = impl_->client->get(url, {}, headers);
    if (response.is_err()) {
        FD_LOG_WARN(log_category::client, "GET request failed for account " + impl_->owner);
        throw remote_exception(error_code::connection_failed, "HTTP GET request failed: " + url);
    }

    const auto& http = response.value();
    if (http.status_code < 200 || http.status_code >= 300) {
        auto code = map_status(http.status_code);
        return unexpected{error{code,
            "HTTP " + std::to_string(http.status_code) + " for " + remote_path}};
    }

    std::vector<std::byte> body(http.body.size());
    std::transform(http.body.begin(), http.body.end(), body.begin(),
                   [](auto b) { return static_cast<std::byte>(b); });
    return std::unique_ptr<remote_download_stream>(
        std::make_unique<buffered_download_stream>(std::move(body), http.headers));
#else
    (void)remote_path;
    return unexpected{error{error_code::not_initialized,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

// ============================================================================
// Factory
// ============================================================================

http_remote_client_factory::http_remote_client_factory(
    std::shared_ptr<credentials_provider> credentials, std::chrono::milliseconds timeout)
    : credentials_(std::move(credentials)), timeout_(timeout) {}

auto http_remote_client_factory::client_for(const std::string& owner)
    -> result<std::shared_ptr<remote_client>> {
    if (!credentials_) {
        return unexpected{error{error_code::not_initialized, "no credentials provider"}};
    }
    auto creds = credentials_->credentials_for(owner);
    if (!creds) {
        return unexpected{creds.error()};
    }
    if (creds.value().base_url.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "no base URL for account " + owner}};
    }
    return std::shared_ptr<remote_client>(
        std::make_shared<http_remote_client>(owner, creds.value(), timeout_));
}

}  // namespace kcenon::file_downloader
