/**
 * @file test_session_negotiator.cpp
 * @brief Unit tests for session_negotiator
 */

#include <gtest/gtest.h>

#include "mock_http_client.h"

#include <kcenon/package_upload/upload/session_negotiator.h>

#include <memory>

namespace kcenon::package_upload::test {

class SessionNegotiatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<mock_http_client>();
        auth_ = std::make_shared<static_token_provider>("secret-token");
        target_ = upload_target{"org", "pkg", "ver", "Mac_Intel", "Setup.pkg",
                                100 * chunk_config::mebibyte};
    }

    auto make_negotiator() -> session_negotiator {
        return session_negotiator(client_, auth_, api_endpoint::for_region(region::europe));
    }

    std::shared_ptr<mock_http_client> client_;
    std::shared_ptr<auth_provider> auth_;
    upload_target target_;
    upload_config config_;
};

TEST_F(SessionNegotiatorTest, ByteRangeInitSendsExpectedRequest) {
    client_->set_handler([](const recorded_request&) {
        return mock_http_client::respond(308, {{"X-Upload-Location", "/API/up?upload_id=7"}});
    });

    auto session = make_negotiator().open(target_, config_);
    ASSERT_TRUE(session);

    auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 1u);
    const auto& req = requests[0];
    EXPECT_EQ(req.method, "POST");
    EXPECT_NE(req.url.find("/software-repository/org/pkg/versions/ver/upload?platform=Mac_Intel"),
              std::string::npos);
    EXPECT_TRUE(req.text_body.empty());
    EXPECT_EQ(req.header("Authorization"), "Bearer secret-token");
    EXPECT_EQ(req.header("Content-Type"), "application/json");
    EXPECT_EQ(req.header("X-Upload-Content-Type"), "application/octet-stream");
    EXPECT_EQ(req.header("X-Upload-Content-Length"), "104857600");
}

TEST_F(SessionNegotiatorTest, ByteRangeSessionCarriesNormalizedLocation) {
    client_->set_handler([](const recorded_request&) {
        return mock_http_client::respond(308, {{"x-upload-location", "/API/up?upload_id=7"}});
    });

    auto session = make_negotiator().open(target_, config_);
    ASSERT_TRUE(session);

    const auto& s = session.value();
    EXPECT_EQ(s.protocol, protocol_variant::byte_range_resumable);
    EXPECT_EQ(s.endpoint, "https://app.eu.action1.com/api/3.0/up?upload_id=7");
    EXPECT_EQ(s.total_chunks, 5u);
    EXPECT_EQ(s.chunk_size, 24 * chunk_config::mebibyte);
    EXPECT_EQ(s.file_name, "Setup.pkg");
}

TEST_F(SessionNegotiatorTest, MissingLocationHeader) {
    client_->set_handler([](const recorded_request&) {
        return mock_http_client::respond(308, {}, "{}");
    });

    auto session = make_negotiator().open(target_, config_);
    ASSERT_FALSE(session);
    EXPECT_EQ(session.error().err.code, error_code::missing_upload_location);
    EXPECT_EQ(session.error().status_code, 308);
}

TEST_F(SessionNegotiatorTest, NonResumeStatusIsProtocolError) {
    client_->set_handler([](const recorded_request&) {
        return mock_http_client::respond(200, {{"X-Upload-Location", "/x"}}, "not resumable");
    });

    auto session = make_negotiator().open(target_, config_);
    ASSERT_FALSE(session);
    EXPECT_EQ(session.error().err.code, error_code::unexpected_status);
    EXPECT_EQ(session.error().status_code, 200);
    EXPECT_EQ(session.error().body, "not resumable");
}

TEST_F(SessionNegotiatorTest, RejectedCredentials) {
    client_->set_handler([](const recorded_request&) {
        return mock_http_client::respond(401, {}, "unauthorized");
    });

    auto session = make_negotiator().open(target_, config_);
    ASSERT_FALSE(session);
    EXPECT_EQ(session.error().err.code, error_code::auth_failed);
    EXPECT_EQ(classify(session.error().err.code), failure_kind::auth_error);
}

TEST_F(SessionNegotiatorTest, TransportFailureIsPropagated) {
    client_->set_handler([](const recorded_request&) {
        return mock_http_client::transport_failure(error_code::connection_timeout, "timed out");
    });

    auto session = make_negotiator().open(target_, config_);
    ASSERT_FALSE(session);
    EXPECT_EQ(session.error().err.code, error_code::connection_timeout);
    EXPECT_EQ(session.error().status_code, 0);
}

TEST_F(SessionNegotiatorTest, MissingTokenSendsNothing) {
    session_negotiator negotiator(client_, std::make_shared<static_token_provider>(""),
                                  api_endpoint::for_region(region::europe));

    auto session = negotiator.open(target_, config_);
    ASSERT_FALSE(session);
    EXPECT_EQ(session.error().err.code, error_code::auth_failed);
    EXPECT_EQ(client_->request_count(), 0u);
}

TEST_F(SessionNegotiatorTest, InvalidConfigSendsNothing) {
    config_.chunk_size = chunk_config::mebibyte;

    auto session = make_negotiator().open(target_, config_);
    ASSERT_FALSE(session);
    EXPECT_EQ(session.error().err.code, error_code::invalid_chunk_size);
    EXPECT_EQ(client_->request_count(), 0u);
}

TEST_F(SessionNegotiatorTest, ChunkIdSessionIsLocal) {
    config_.protocol = protocol_variant::chunk_id_finalize;
    config_.metadata = {{"version", "1.2.3"}};

    auto first = make_negotiator().open(target_, config_);
    auto second = make_negotiator().open(target_, config_);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    EXPECT_EQ(client_->request_count(), 0u);
    EXPECT_EQ(first.value().endpoint.size(), 32u);
    EXPECT_NE(first.value().endpoint, second.value().endpoint);
    EXPECT_NE(first.value().chunk_url.find("/upload/chunk"), std::string::npos);
    EXPECT_NE(first.value().finalize_url.find("/upload/finalize"), std::string::npos);
    EXPECT_EQ(first.value().metadata.at("version"), "1.2.3");
}

}  // namespace kcenon::package_upload::test
