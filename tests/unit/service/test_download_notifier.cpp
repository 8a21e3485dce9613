/**
 * @file test_download_notifier.cpp
 * @brief Unit tests for download_notifier
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <kcenon/file_downloader/adapters/thread_pool_adapter.h>
#include <kcenon/file_downloader/service/download_notifier.h>

namespace kcenon::file_downloader::test {

using namespace std::chrono_literals;

class DownloadNotifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<recording_notification_sink>();
        notifier_ = std::make_unique<download_notifier>(sink_, 10ms);
        operation_ = make_operation("/Docs/report.pdf", 200);
    }

    static auto make_operation(const std::string& path, int64_t length)
        -> std::unique_ptr<download_operation> {
        return std::make_unique<download_operation>(
            make_request("alice@cloud", path, 42, length), "/tmp/save", "/tmp/save.tmp");
    }

    static auto progress(uint64_t so_far, int64_t total) -> download_progress {
        return download_progress{1, so_far, total, "report.pdf"};
    }

    std::shared_ptr<recording_notification_sink> sink_;
    std::unique_ptr<download_notifier> notifier_;
    std::unique_ptr<download_operation> operation_;
};

// =============================================================================
// Ongoing notification
// =============================================================================

TEST_F(DownloadNotifierTest, StartPostsOngoingNotification) {
    notifier_->on_download_started(*operation_);

    auto posted = sink_->posted();
    ASSERT_EQ(posted.size(), 1u);
    EXPECT_EQ(posted[0].id, 42);
    EXPECT_EQ(posted[0].kind, notification_kind::ongoing);
    EXPECT_EQ(posted[0].text, "report.pdf");
    EXPECT_EQ(posted[0].percent, 0);
    EXPECT_EQ(posted[0].action, notification_action::show_details);
}

TEST_F(DownloadNotifierTest, UnknownLengthIsIndeterminate) {
    auto op = make_operation("/a.bin", -1);
    notifier_->on_download_started(*op);

    ASSERT_EQ(sink_->posted().size(), 1u);
    EXPECT_EQ(sink_->posted()[0].percent, -1);
}

TEST_F(DownloadNotifierTest, ProgressPostedOnlyWhenPercentChanges) {
    notifier_->on_download_started(*operation_);

    notifier_->on_progress(*operation_, progress(1, 200));    // 0%
    notifier_->on_progress(*operation_, progress(2, 200));    // 1%
    notifier_->on_progress(*operation_, progress(3, 200));    // 1%
    notifier_->on_progress(*operation_, progress(100, 200));  // 50%

    auto posted = sink_->posted();
    ASSERT_EQ(posted.size(), 3u);
    EXPECT_EQ(posted[1].percent, 1);
    EXPECT_EQ(posted[2].percent, 50);
}

// =============================================================================
// Terminal notification
// =============================================================================

TEST_F(DownloadNotifierTest, SuccessAutoDismisses) {
    notifier_->on_download_finished(*operation_, download_result::ok());

    auto posted = sink_->posted();
    ASSERT_EQ(posted.size(), 1u);
    EXPECT_EQ(posted[0].kind, notification_kind::succeeded);
    EXPECT_EQ(posted[0].percent, 100);
    EXPECT_EQ(posted[0].auto_dismiss, 10ms);
}

TEST_F(DownloadNotifierTest, SuccessDismissedThroughPool) {
    auto pool = std::make_shared<adapters::standalone_transfer_pool>(1);
    download_notifier notifier(sink_, 10ms, pool);

    notifier.on_download_finished(*operation_, download_result::ok());

    EXPECT_TRUE(wait_until([&] { return sink_->cancelled().size() == 1; }));
    EXPECT_EQ(sink_->cancelled()[0], 42);
    pool->shutdown();
}

TEST_F(DownloadNotifierTest, CancelledDismissesWithoutTerminalNotification) {
    notifier_->on_download_started(*operation_);
    notifier_->on_download_finished(*operation_, download_result::cancelled());

    EXPECT_EQ(sink_->posted().size(), 1u);
    ASSERT_EQ(sink_->cancelled().size(), 1u);
    EXPECT_EQ(sink_->cancelled()[0], 42);
}

TEST_F(DownloadNotifierTest, AuthorizationFailureOffersCredentialRefresh) {
    notifier_->on_download_finished(*operation_,
                                    download_result::failure(error_code::unauthorized));

    auto posted = sink_->posted();
    ASSERT_EQ(posted.size(), 1u);
    EXPECT_EQ(posted[0].kind, notification_kind::credentials_error);
    EXPECT_EQ(posted[0].action, notification_action::refresh_credentials);
    EXPECT_EQ(posted[0].code, error_code::unauthorized);
}

TEST_F(DownloadNotifierTest, OtherFailureShowsDetails) {
    notifier_->on_download_finished(*operation_,
                                    download_result::failure(error_code::file_not_found, "gone"));

    auto posted = sink_->posted();
    ASSERT_EQ(posted.size(), 1u);
    EXPECT_EQ(posted[0].kind, notification_kind::failed);
    EXPECT_EQ(posted[0].action, notification_action::show_details);
    EXPECT_NE(posted[0].text.find("report.pdf"), std::string::npos);
    EXPECT_EQ(posted[0].auto_dismiss, 0ms);
}

TEST_F(DownloadNotifierTest, DeferredDownloadWaitsForNetwork) {
    auto deferred = download_result::failure_with_cause(
        error_code::connection_lost, failure_cause{error_code::connection_lost, "reset"});
    deferred.mark_deferred();

    notifier_->on_download_finished(*operation_, deferred);

    auto posted = sink_->posted();
    ASSERT_EQ(posted.size(), 1u);
    EXPECT_EQ(posted[0].kind, notification_kind::waiting_for_network);
    EXPECT_EQ(posted[0].code, error_code::no_network_connection);
}

TEST_F(DownloadNotifierTest, NullSinkIsIgnored) {
    download_notifier notifier(nullptr);

    EXPECT_NO_THROW(notifier.on_download_started(*operation_));
    EXPECT_NO_THROW(notifier.on_progress(*operation_, progress(10, 200)));
    EXPECT_NO_THROW(notifier.on_download_finished(*operation_, download_result::ok()));
}

TEST(LoggingNotificationSinkTest, PostAndCancelDoNotThrow) {
    logging_notification_sink sink;
    download_notification n;
    n.id = 1;
    n.kind = notification_kind::failed;
    n.title = "Download failed";
    n.code = error_code::server_error;

    EXPECT_NO_THROW(sink.post(n));
    EXPECT_NO_THROW(sink.cancel(1));
}

}  // namespace kcenon::file_downloader::test
