/**
 * @file download_queue_example.cpp
 * @brief Queue downloads from a WebDAV-style server and wait for them
 *
 * This example demonstrates:
 * - Wiring a file_downloader with HTTP clients and JSON file records
 * - Listening to per-file progress
 * - Waiting for finished events
 */

#include <kcenon/file_downloader/file_downloader.h>

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::file_downloader;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

class console_progress : public download_progress_listener {
public:
    void on_transfer_progress(const download_progress& progress) override {
        std::cout << "\r  " << progress.file_name << ": "
                  << format_bytes(progress.transferred_bytes);
        if (progress.percent() >= 0) {
            std::cout << " (" << progress.percent() << "%)";
        }
        std::cout << std::flush;
    }
};

}  // namespace

void print_usage(const char* program) {
    std::cout << "Download Queue Example - File Downloader" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <remote_path>..." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -u, --url <url>         Base URL of the account" << std::endl;
    std::cout << "  -a, --account <name>    Account name (default: user@host)" << std::endl;
    std::cout << "  --user <name>           User for basic authentication" << std::endl;
    std::cout << "  --password <secret>     Password for basic authentication" << std::endl;
    std::cout << "  --token <token>         Bearer token instead of a password" << std::endl;
    std::cout << "  -s, --storage <dir>     Local storage root (default: ./downloads)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Example:" << std::endl;
    std::cout << "  " << program
              << " -u https://cloud.example.com/remote.php/webdav --user alice"
              << " --password secret /Docs/report.pdf /Photos/" << std::endl;
}

int main(int argc, char* argv[]) {
    account_credentials creds;
    std::string account;
    std::filesystem::path storage = "./downloads";
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* name) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << name << " requires an argument" << std::endl;
                return nullptr;
            }
            return argv[i];
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }

        const char* value = nullptr;
        if (arg == "-u" || arg == "--url") {
            if (!(value = next("--url"))) return 1;
            creds.base_url = value;
        } else if (arg == "-a" || arg == "--account") {
            if (!(value = next("--account"))) return 1;
            account = value;
        } else if (arg == "--user") {
            if (!(value = next("--user"))) return 1;
            creds.username = value;
        } else if (arg == "--password") {
            if (!(value = next("--password"))) return 1;
            creds.kind = credentials_kind::basic;
            creds.secret = value;
        } else if (arg == "--token") {
            if (!(value = next("--token"))) return 1;
            creds.kind = credentials_kind::bearer;
            creds.secret = value;
        } else if (arg == "-s" || arg == "--storage") {
            if (!(value = next("--storage"))) return 1;
            storage = value;
        } else if (arg[0] != '-') {
            paths.push_back(arg);
        }
    }

    if (creds.base_url.empty() || paths.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
    if (account.empty()) {
        account = creds.username.empty() ? "user@host" : creds.username + "@host";
    }

    auto credentials = std::make_shared<static_credentials_provider>();
    credentials->set(account, creds);
    auto accounts = std::make_shared<static_account_registry>();
    accounts->add(account);

    auto downloader_result = file_downloader::builder()
        .with_storage_root(storage / "files")
        .with_client_factory(std::make_shared<http_remote_client_factory>(credentials))
        .with_account_registry(accounts)
        .with_record_store_factory(std::make_shared<json_file_record_store_factory>(storage / "records"))
        .build();

    if (!downloader_result.has_value()) {
        std::cerr << "Failed to create downloader: " << downloader_result.error().message << std::endl;
        return 1;
    }
    auto& downloader = downloader_result.value();

    std::mutex mutex;
    std::condition_variable cv;
    std::size_t finished = 0;
    std::size_t failed = 0;

    downloader.events().subscribe([&](const download_event& event) {
        if (event.kind != download_event_kind::finished) {
            return;
        }
        std::cout << std::endl;
        if (event.success) {
            std::cout << "Downloaded " << event.remote_path << " -> " << event.local_path << std::endl;
        } else {
            std::cout << "Failed " << event.remote_path << ": " << to_string(event.code) << std::endl;
        }
        std::lock_guard<std::mutex> lock(mutex);
        ++finished;
        if (!event.success) {
            ++failed;
        }
        cv.notify_all();
    });

    auto progress = std::make_shared<console_progress>();
    int64_t next_id = 1;
    for (const auto& path : paths) {
        download_request request;
        request.owner = account;
        request.file.id = next_id;
        request.file.remote_path = path;
        downloader.add_progress_listener(account, next_id, progress);
        ++next_id;

        auto queued = downloader.request_download(request);
        if (!queued.has_value()) {
            std::cerr << "Not queued " << path << ": " << queued.error().message << std::endl;
            return 1;
        }
    }

    std::cout << "Queued " << paths.size() << " download(s) for " << account << std::endl;
    auto started = downloader.start();
    if (!started.has_value()) {
        std::cerr << "Failed to start: " << started.error().message << std::endl;
        return 1;
    }

    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&] { return finished >= paths.size(); });
    }

    auto stopped = downloader.stop();
    if (!stopped.has_value()) {
        std::cerr << "Failed to stop: " << stopped.error().message << std::endl;
    }

    std::cout << std::endl;
    std::cout << "Finished: " << (paths.size() - failed) << " succeeded, "
              << failed << " failed" << std::endl;
    return failed == 0 ? 0 : 1;
}
