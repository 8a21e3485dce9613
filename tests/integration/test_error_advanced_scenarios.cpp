/**
 * @file test_error_advanced_scenarios.cpp
 * @brief Failure, retry and account scenarios for the download queue
 */

#include "test_fixtures.h"

namespace kcenon::file_downloader::test {

class DownloadFailureTest : public DownloaderFixture {};

// =============================================================================
// Retry deferral
// =============================================================================

TEST_F(DownloadFailureTest, ConnectionLossIsDeferred) {
    remote_content content;
    content.body = "0123456789";
    content.read_error = error_code::connection_lost;
    server_->put(ALICE, "/a.bin", content);

    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/a.bin", 1)).has_value());
    ASSERT_TRUE(downloader_->start().has_value());
    ASSERT_TRUE(wait_for_finished(1));

    auto finished = recorder_.finished();
    EXPECT_FALSE(finished[0].success);
    EXPECT_TRUE(finished[0].deferred);
    EXPECT_EQ(finished[0].code, error_code::no_network_connection);

    auto jobs = scheduler_->jobs();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].owner, ALICE);
    EXPECT_EQ(jobs[0].remote_path, "/a.bin");
    EXPECT_EQ(jobs[0].job_id, retry_classifier::build_job_id(ALICE, "/a.bin"));

    ASSERT_FALSE(sink_->posted().empty());
    EXPECT_EQ(sink_->posted().back().kind, notification_kind::waiting_for_network);
    EXPECT_EQ(sink_->posted().back().code, error_code::no_network_connection);
}

TEST_F(DownloadFailureTest, ThrowingClientIsDeferred) {
    remote_content content;
    content.throw_on_open = error_code::connection_timeout;
    server_->put(ALICE, "/a.bin", content);

    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/a.bin", 1)).has_value());
    ASSERT_TRUE(downloader_->start().has_value());
    ASSERT_TRUE(wait_for_finished(1));

    EXPECT_EQ(recorder_.finished()[0].code, error_code::no_network_connection);
    EXPECT_EQ(scheduler_->jobs().size(), 1u);
}

TEST_F(DownloadFailureTest, RepeatedFailuresKeepSameJobId) {
    remote_content content;
    content.body = "0123456789";
    content.read_error = error_code::connection_lost;
    server_->put(ALICE, "/a.bin", content);
    ASSERT_TRUE(downloader_->start().has_value());

    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/a.bin", 1)).has_value());
    ASSERT_TRUE(wait_for_finished(1));
    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/a.bin", 1)).has_value());
    ASSERT_TRUE(wait_for_finished(2));

    auto jobs = scheduler_->jobs();
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].job_id, jobs[1].job_id);
}

TEST_F(DownloadFailureTest, SchedulerFailureReportsOriginalError) {
    scheduler_->set_fail(true);
    remote_content content;
    content.body = "0123456789";
    content.read_error = error_code::connection_lost;
    server_->put(ALICE, "/a.bin", content);

    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/a.bin", 1)).has_value());
    ASSERT_TRUE(downloader_->start().has_value());
    ASSERT_TRUE(wait_for_finished(1));

    auto finished = recorder_.finished();
    EXPECT_EQ(finished[0].code, error_code::connection_lost);
    EXPECT_FALSE(finished[0].deferred);
    ASSERT_FALSE(sink_->posted().empty());
    EXPECT_EQ(sink_->posted().back().kind, notification_kind::failed);
}

TEST_F(DownloadFailureTest, UnscheduledNoNetworkFailureIsNotDeferred) {
    scheduler_->set_fail(true);
    remote_content content;
    content.body = "0123456789";
    content.read_error = error_code::no_network_connection;
    server_->put(ALICE, "/a.bin", content);

    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/a.bin", 1)).has_value());
    ASSERT_TRUE(downloader_->start().has_value());
    ASSERT_TRUE(wait_for_finished(1));

    auto finished = recorder_.finished();
    EXPECT_EQ(finished[0].code, error_code::no_network_connection);
    EXPECT_FALSE(finished[0].deferred);
    ASSERT_FALSE(sink_->posted().empty());
    EXPECT_EQ(sink_->posted().back().kind, notification_kind::failed);
}

TEST_F(DownloadFailureTest, RemoteRejectionIsNotRetried) {
    remote_content content;
    content.open_error = error_code::forbidden;
    server_->put(ALICE, "/a.bin", content);
    connectivity_->set_network_active(false);

    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/a.bin", 1)).has_value());
    ASSERT_TRUE(downloader_->start().has_value());
    ASSERT_TRUE(wait_for_finished(1));

    EXPECT_EQ(recorder_.finished()[0].code, error_code::forbidden);
    EXPECT_TRUE(scheduler_->jobs().empty());
}

TEST_F(DownloadFailureTest, UnauthorizedAsksForCredentials) {
    remote_content content;
    content.open_error = error_code::unauthorized;
    server_->put(ALICE, "/a.bin", content);

    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/a.bin", 1)).has_value());
    ASSERT_TRUE(downloader_->start().has_value());
    ASSERT_TRUE(wait_for_finished(1));

    ASSERT_FALSE(sink_->posted().empty());
    EXPECT_EQ(sink_->posted().back().kind, notification_kind::credentials_error);
    EXPECT_EQ(sink_->posted().back().action, notification_action::refresh_credentials);
}

// =============================================================================
// Accounts
// =============================================================================

TEST_F(DownloadFailureTest, RemovedAccountIsDroppedWithoutTouchingOthers) {
    server_->put_file(ALICE, "/a.txt", "alice");
    server_->put_file(ALICE, "/b.txt", "alice");
    server_->put_file(BOB, "/c.txt", "bob");
    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/a.txt", 1)).has_value());
    ASSERT_TRUE(downloader_->request_download(make_request(ALICE, "/b.txt", 2)).has_value());
    ASSERT_TRUE(downloader_->request_download(make_request(BOB, "/c.txt", 3)).has_value());

    accounts_->remove(ALICE);
    ASSERT_TRUE(downloader_->start().has_value());
    ASSERT_TRUE(wait_for_finished(2));

    auto finished = recorder_.finished();
    ASSERT_EQ(finished.size(), 2u);
    EXPECT_EQ(finished[0].owner, ALICE);
    EXPECT_EQ(finished[0].code, error_code::account_not_found);
    EXPECT_EQ(finished[1].owner, BOB);
    EXPECT_TRUE(finished[1].success);

    EXPECT_EQ(server_->open_count(ALICE), 0u);
    EXPECT_EQ(server_->open_count(BOB), 1u);
    EXPECT_FALSE(downloader_->is_downloading(ALICE, "/b.txt"));
    for (const auto& n : sink_->posted()) {
        EXPECT_NE(n.owner, ALICE);
    }
}

// =============================================================================
// Resubmission
// =============================================================================

TEST_F(DownloadFailureTest, ResubmitUsesStoredRecord) {
    server_->put_file(ALICE, "/Docs/a.txt", "again");
    file_record record;
    record.id = 11;
    record.owner = ALICE;
    record.remote_path = "/Docs/a.txt";
    record.remote_id = "rid-11";
    record.available_offline = true;
    stores_->store(ALICE)->seed(record);

    ASSERT_TRUE(downloader_->resubmit(ALICE, "/Docs/a.txt").has_value());
    ASSERT_TRUE(downloader_->start().has_value());
    ASSERT_TRUE(wait_for_finished(1));

    EXPECT_TRUE(recorder_.finished()[0].success);
    auto stored = stores_->store(ALICE)->get_file_by_id(11);
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored.value().available_offline);
    EXPECT_EQ(stored.value().length, 5);
}

TEST_F(DownloadFailureTest, ResubmitUnknownRecordFails) {
    auto result = downloader_->resubmit(ALICE, "/nothing.txt");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::record_not_found);
}

TEST_F(DownloadFailureTest, ResubmitForRemovedAccountFails) {
    accounts_->remove(BOB);

    auto result = downloader_->resubmit(BOB, "/a.txt");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::account_not_found);
}

// =============================================================================
// Built-in retry scheduler
// =============================================================================

class BuiltInRetryTest : public TempDirectoryFixture {};

TEST_F(BuiltInRetryTest, DeferredDownloadIsRetriedWhenNetworkReturns) {
    auto server = std::make_shared<fake_remote_server>();
    auto accounts = std::make_shared<static_account_registry>();
    accounts->add("alice@cloud");
    auto stores = std::make_shared<memory_record_store_factory>();
    auto connectivity = std::make_shared<manual_connectivity_monitor>(true);

    remote_content failing;
    failing.body = "0123456789";
    failing.read_error = error_code::connection_lost;
    server->put("alice@cloud", "/a.bin", failing);

    file_record record;
    record.id = 1;
    record.owner = "alice@cloud";
    record.remote_path = "/a.bin";
    stores->store("alice@cloud")->seed(record);

    auto built = file_downloader::builder()
        .with_storage_root(storage_dir_)
        .with_client_factory(std::make_shared<fake_client_factory>(server))
        .with_account_registry(accounts)
        .with_record_store_factory(stores)
        .with_connectivity_monitor(connectivity)
        .with_retry_policy(retry_policy{50, std::chrono::milliseconds(10), std::chrono::milliseconds(50), 2.0})
        .with_notification_sink(std::make_shared<recording_notification_sink>())
        .build();
    ASSERT_TRUE(built.has_value());
    auto downloader = std::move(built.value());

    event_recorder recorder;
    recorder.attach(downloader.events());
    connectivity->set_network_active(false);
    ASSERT_TRUE(downloader.request_download(make_request("alice@cloud", "/a.bin", 1)).has_value());
    ASSERT_TRUE(downloader.start().has_value());

    ASSERT_TRUE(wait_until([&] {
        downloader.events().flush();
        return !recorder.finished().empty();
    }));
    EXPECT_EQ(recorder.finished()[0].code, error_code::no_network_connection);

    server->put_file("alice@cloud", "/a.bin", "0123456789");
    connectivity->set_network_active(true);

    ASSERT_TRUE(wait_until([&] {
        downloader.events().flush();
        auto finished = recorder.finished();
        return !finished.empty() && finished.back().success;
    }));
    EXPECT_EQ(read_file(storage_layout(storage_dir_).save_path("alice@cloud", "/a.bin")),
              "0123456789");
    ASSERT_TRUE(downloader.stop().has_value());
}

}  // namespace kcenon::file_downloader::test
