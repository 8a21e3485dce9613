/**
 * @file test_http_remote_client.cpp
 * @brief Unit tests for http_remote_client request building
 */

#include <gtest/gtest.h>

#include <kcenon/file_downloader/client/http_remote_client.h>

namespace kcenon::file_downloader::test {

namespace {

auto basic_credentials() -> account_credentials {
    account_credentials creds;
    creds.kind = credentials_kind::basic;
    creds.username = "alice";
    creds.secret = "secret";
    creds.base_url = "https://cloud.example.com/remote.php/webdav/";
    return creds;
}

}  // namespace

// =============================================================================
// Request building
// =============================================================================

TEST(HttpRemoteClientTest, UrlJoinsBaseAndEncodedPath) {
    http_remote_client client("alice@cloud", basic_credentials());

    EXPECT_EQ(client.url_for("/Docs/annual report.pdf"),
              "https://cloud.example.com/remote.php/webdav/Docs/annual%20report.pdf");
    EXPECT_EQ(client.url_for("a.txt"),
              "https://cloud.example.com/remote.php/webdav/a.txt");
    EXPECT_EQ(client.owner(), "alice@cloud");
}

TEST(HttpRemoteClientTest, BasicAuthorization) {
    http_remote_client client("alice@cloud", basic_credentials());

    EXPECT_EQ(client.authorization(), "Basic YWxpY2U6c2VjcmV0");
}

TEST(HttpRemoteClientTest, BasicAuthorizationPadding) {
    auto creds = basic_credentials();
    creds.username = "ab";
    creds.secret = "c";
    http_remote_client client("ab@cloud", creds);

    EXPECT_EQ(client.authorization(), "Basic YWI6Yw==");
}

TEST(HttpRemoteClientTest, BearerAuthorization) {
    auto creds = basic_credentials();
    creds.kind = credentials_kind::bearer;
    creds.secret = "token-123";
    http_remote_client client("alice@cloud", creds);

    EXPECT_EQ(client.authorization(), "Bearer token-123");
}

TEST(HttpRemoteClientTest, StatusCodeMapping) {
    EXPECT_EQ(http_remote_client::map_status(401), error_code::unauthorized);
    EXPECT_EQ(http_remote_client::map_status(403), error_code::forbidden);
    EXPECT_EQ(http_remote_client::map_status(404), error_code::file_not_found);
    EXPECT_EQ(http_remote_client::map_status(503), error_code::service_unavailable);
    EXPECT_EQ(http_remote_client::map_status(500), error_code::server_error);
    EXPECT_EQ(http_remote_client::map_status(507), error_code::server_error);
    EXPECT_EQ(http_remote_client::map_status(302), error_code::unhandled_http_code);
    EXPECT_EQ(http_remote_client::map_status(418), error_code::unhandled_http_code);
}

// =============================================================================
// http_remote_client_factory
// =============================================================================

TEST(HttpRemoteClientFactoryTest, CreatesClientForKnownAccount) {
    auto provider = std::make_shared<static_credentials_provider>();
    provider->set("alice@cloud", basic_credentials());
    http_remote_client_factory factory(provider);

    auto client = factory.client_for("alice@cloud");

    ASSERT_TRUE(client.has_value());
    EXPECT_EQ(client.value()->owner(), "alice@cloud");
}

TEST(HttpRemoteClientFactoryTest, UnknownAccountIsReported) {
    auto provider = std::make_shared<static_credentials_provider>();
    http_remote_client_factory factory(provider);

    auto client = factory.client_for("nobody@cloud");

    ASSERT_FALSE(client.has_value());
    EXPECT_EQ(client.error().code, error_code::account_not_found);
}

TEST(HttpRemoteClientFactoryTest, MissingBaseUrlIsInvalid) {
    auto provider = std::make_shared<static_credentials_provider>();
    auto creds = basic_credentials();
    creds.base_url.clear();
    provider->set("alice@cloud", creds);
    http_remote_client_factory factory(provider);

    auto client = factory.client_for("alice@cloud");

    ASSERT_FALSE(client.has_value());
    EXPECT_EQ(client.error().code, error_code::invalid_configuration);
}

TEST(HttpRemoteClientFactoryTest, MissingProviderIsNotInitialized) {
    http_remote_client_factory factory(nullptr);

    auto client = factory.client_for("alice@cloud");

    ASSERT_FALSE(client.has_value());
    EXPECT_EQ(client.error().code, error_code::not_initialized);
}

TEST(HttpRemoteClientFactoryTest, RefreshedCredentialsArePickedUp) {
    auto provider = std::make_shared<static_credentials_provider>();
    auto creds = basic_credentials();
    creds.kind = credentials_kind::bearer;
    creds.secret = "old";
    provider->set("alice@cloud", creds);
    http_remote_client_factory factory(provider);

    auto first = factory.client_for("alice@cloud");
    creds.secret = "new";
    provider->set("alice@cloud", creds);
    auto second = factory.client_for("alice@cloud");

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    auto* refreshed = dynamic_cast<http_remote_client*>(second.value().get());
    ASSERT_NE(refreshed, nullptr);
    EXPECT_EQ(refreshed->authorization(), "Bearer new");
}

}  // namespace kcenon::file_downloader::test
