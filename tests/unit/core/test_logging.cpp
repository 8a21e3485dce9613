/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <kcenon/file_downloader/core/logging.h>

#include <optional>
#include <string>
#include <vector>

namespace kcenon::file_downloader::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

TEST(MaskingConfigTest, DefaultConfig) {
    masking_config config;

    EXPECT_FALSE(config.mask_paths);
    EXPECT_FALSE(config.mask_accounts);
    EXPECT_EQ(config.mask_char, "*");
    EXPECT_EQ(config.visible_chars, 3u);
}

TEST(MaskingConfigTest, AllMaskedConfig) {
    auto config = masking_config::all_masked();

    EXPECT_TRUE(config.mask_paths);
    EXPECT_TRUE(config.mask_accounts);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {
protected:
    sensitive_info_masker masked_{masking_config::all_masked()};
};

TEST_F(SensitiveInfoMaskerTest, NoMaskingByDefault) {
    sensitive_info_masker masker;

    EXPECT_EQ(masker.mask_path("/Photos/holiday.jpg"), "/Photos/holiday.jpg");
    EXPECT_EQ(masker.mask_account("alice@cloud.example.com"), "alice@cloud.example.com");
}

TEST_F(SensitiveInfoMaskerTest, MaskPathKeepsFileName) {
    auto result = masked_.mask_path("/Documents/private/report.pdf");

    EXPECT_EQ(result, "******************/report.pdf");
    EXPECT_EQ(result.find("private"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskPathAtRootIsUnchanged) {
    EXPECT_EQ(masked_.mask_path("/report.pdf"), "/report.pdf");
}

TEST_F(SensitiveInfoMaskerTest, MaskAccountKeepsHost) {
    EXPECT_EQ(masked_.mask_account("alice@cloud.example.com"), "ali**@cloud.example.com");
}

TEST_F(SensitiveInfoMaskerTest, ShortAccountFullyMasked) {
    EXPECT_EQ(masked_.mask_account("bob@host"), "***@host");
}

TEST_F(SensitiveInfoMaskerTest, UpdateConfig) {
    sensitive_info_masker masker;
    masker.set_config(masking_config::all_masked());

    EXPECT_TRUE(masker.get_config().mask_paths);
    EXPECT_NE(masker.mask_path("/a/b/c.txt"), "/a/b/c.txt");
}

// =============================================================================
// Download Log Context Tests
// =============================================================================

TEST(DownloadLogContextTest, EmptyContextToJson) {
    download_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST(DownloadLogContextTest, AllFieldsToJson) {
    download_log_context ctx;
    ctx.account = "alice@cloud";
    ctx.remote_path = "/Photos/a.jpg";
    ctx.local_path = "/data/alice@cloud/Photos/a.jpg";
    ctx.file_id = 42;
    ctx.file_size = 1024;
    ctx.bytes_transferred = 512;
    ctx.result_code = -121;
    ctx.job_id = 7;
    ctx.error_message = "connection failed";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"account\":\"alice@cloud\""), std::string::npos);
    EXPECT_NE(json.find("\"remote_path\":\"/Photos/a.jpg\""), std::string::npos);
    EXPECT_NE(json.find("\"file_id\":42"), std::string::npos);
    EXPECT_NE(json.find("\"size\":1024"), std::string::npos);
    EXPECT_NE(json.find("\"bytes_transferred\":512"), std::string::npos);
    EXPECT_NE(json.find("\"result_code\":-121"), std::string::npos);
    EXPECT_NE(json.find("\"job_id\":7"), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"connection failed\""), std::string::npos);
}

TEST(DownloadLogContextTest, JsonWithMasking) {
    download_log_context ctx;
    ctx.account = "alice@cloud";
    ctx.remote_path = "/Private/secret.txt";

    sensitive_info_masker masker(masking_config::all_masked());
    auto json = ctx.to_json_with_masking(&masker);

    EXPECT_EQ(json.find("Private"), std::string::npos);
    EXPECT_NE(json.find("secret.txt"), std::string::npos);
    EXPECT_NE(json.find("ali**@cloud"), std::string::npos);
}

TEST(DownloadLogContextTest, JsonEscaping) {
    download_log_context ctx;
    ctx.remote_path = "/quote\"and\\slash\n.txt";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\\\""), std::string::npos);
    EXPECT_NE(json.find("\\\\"), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);
}

// =============================================================================
// Message Formatting Tests
// =============================================================================

TEST(LogFormatTest, JsonCarriesContextFields) {
    download_log_context ctx;
    ctx.account = "alice@cloud";
    ctx.remote_path = "/a.txt";
    ctx.job_id = 99;

    auto json = file_downloader_logger::format_message(
        log_output_format::json, log_level::warn, log_category::retry, "Download deferred",
        &ctx, sensitive_info_masker{}, "retry_scheduler.cpp", 42);

    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_NE(json.find("\"level\":\"WARN\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"file_downloader.retry\""), std::string::npos);
    EXPECT_NE(json.find("\"account\":\"alice@cloud\""), std::string::npos);
    EXPECT_NE(json.find("\"job_id\":99"), std::string::npos);
    EXPECT_NE(json.find("\"line\":42"), std::string::npos);
    EXPECT_NE(json.find("\"timestamp\":\""), std::string::npos);
}

TEST(LogFormatTest, JsonMasksContext) {
    download_log_context ctx;
    ctx.remote_path = "/Documents/private/report.pdf";

    auto json = file_downloader_logger::format_message(
        log_output_format::json, log_level::info, log_category::worker, "Download finished",
        &ctx, sensitive_info_masker{masking_config::all_masked()});

    EXPECT_EQ(json.find("private"), std::string::npos);
    EXPECT_NE(json.find("report.pdf"), std::string::npos);
    EXPECT_EQ(json.find("\"source\""), std::string::npos);
}

TEST(LogFormatTest, TextPrefixesCategory) {
    auto text = file_downloader_logger::format_message(
        log_output_format::text, log_level::info, log_category::queue, "Queued", nullptr,
        sensitive_info_masker{});

    EXPECT_EQ(text, "[file_downloader.queue] Queued");
}

TEST(LogLevelTest, LogLevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

// =============================================================================
// Logger Tests
// =============================================================================

class FileDownloaderLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_level(log_level::trace);
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(log_level::info);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_masking_config(masking_config::none());
    }
};

TEST_F(FileDownloaderLoggerTest, EnableJsonOutput) {
    get_logger().enable_json_output();
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    get_logger().enable_json_output(false);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

TEST_F(FileDownloaderLoggerTest, LogCallbackReceivesContext) {
    std::vector<std::string> categories;
    std::optional<int32_t> job_id;
    get_logger().set_callback(
        [&](log_level, std::string_view category, std::string_view,
            const download_log_context* ctx) {
            categories.emplace_back(category);
            if (ctx) {
                job_id = ctx->job_id;
            }
        });

    download_log_context ctx;
    ctx.job_id = 1234;
    FD_LOG_INFO_CTX(log_category::retry, "Deferred", ctx);
    FD_LOG_DEBUG(log_category::queue, "Queued");

    ASSERT_EQ(categories.size(), 2u);
    EXPECT_EQ(categories[0], "file_downloader.retry");
    EXPECT_EQ(categories[1], "file_downloader.queue");
    ASSERT_TRUE(job_id.has_value());
    EXPECT_EQ(*job_id, 1234);
}

TEST_F(FileDownloaderLoggerTest, LogLevelFiltering) {
    int calls = 0;
    get_logger().set_callback(
        [&](log_level, std::string_view, std::string_view, const download_log_context*) {
            ++calls;
        });

    get_logger().set_level(log_level::warn);
    FD_LOG_DEBUG(log_category::worker, "hidden");
    FD_LOG_INFO(log_category::worker, "hidden");
    FD_LOG_WARN(log_category::worker, "shown");
    FD_LOG_ERROR(log_category::worker, "shown");

    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::fatal));
}

TEST_F(FileDownloaderLoggerTest, InitializeIsIdempotent) {
    get_logger().initialize();
    get_logger().initialize();
    EXPECT_TRUE(get_logger().is_initialized());
}

}  // namespace kcenon::file_downloader::test
