/**
 * @file test_chunk_transmitter.cpp
 * @brief Unit tests for chunk_transmitter and finalizer
 */

#include <gtest/gtest.h>

#include "mock_http_client.h"

#include <kcenon/package_upload/core/encoding.h>
#include <kcenon/package_upload/upload/chunk_transmitter.h>
#include <kcenon/package_upload/upload/finalizer.h>

#include <memory>

namespace kcenon::package_upload::test {

class ChunkTransmitterTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<mock_http_client>();
        auth_ = std::make_shared<static_token_provider>("tok-123456");

        byte_range_.protocol = protocol_variant::byte_range_resumable;
        byte_range_.endpoint = "https://upload.example.test/session?upload_id=1";
        byte_range_.total_size = 1000;
        byte_range_.total_chunks = 2;
        byte_range_.file_name = "Setup.pkg";

        chunk_id_.protocol = protocol_variant::chunk_id_finalize;
        chunk_id_.endpoint = "abcdef0123456789";
        chunk_id_.total_size = 1000;
        chunk_id_.total_chunks = 2;
        chunk_id_.file_name = "Setup.pkg";
        chunk_id_.chunk_url = "https://api.example.test/upload/chunk";
        chunk_id_.finalize_url = "https://api.example.test/upload/finalize";
        chunk_id_.metadata = {{"version", "2.0"}};
    }

    static auto payload(std::size_t n) -> std::vector<uint8_t> {
        std::vector<uint8_t> data(n);
        for (std::size_t i = 0; i < n; ++i) {
            data[i] = static_cast<uint8_t>(i & 0xff);
        }
        return data;
    }

    std::shared_ptr<mock_http_client> client_;
    std::shared_ptr<auth_provider> auth_;
    upload_session byte_range_;
    upload_session chunk_id_;
    chunk first_{1, 0, 599, 600};
    chunk second_{2, 600, 999, 400};
};

TEST_F(ChunkTransmitterTest, ByteRangePutCarriesContentRange) {
    client_->set_handler([](const recorded_request&) { return mock_http_client::respond(308); });
    chunk_transmitter transmitter(client_, auth_);

    auto outcome = transmitter.transmit(second_, payload(400), byte_range_);
    EXPECT_EQ(outcome.kind, chunk_outcome::kind_type::continue_upload);

    auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "PUT");
    EXPECT_EQ(requests[0].url, byte_range_.endpoint);
    EXPECT_EQ(requests[0].header("Content-Range"), "bytes 600-999/1000");
    EXPECT_EQ(requests[0].header("Content-Length"), "400");
    EXPECT_EQ(requests[0].header("Content-Type"), "application/octet-stream");
    EXPECT_EQ(requests[0].header("Authorization"), "Bearer tok-123456");
    EXPECT_EQ(requests[0].binary_body, payload(400));
}

TEST_F(ChunkTransmitterTest, ClassifyByteRangeStatuses) {
    http_response resp;

    resp.status_code = 308;
    EXPECT_EQ(chunk_transmitter::classify_byte_range(resp).kind,
              chunk_outcome::kind_type::continue_upload);

    for (int status : {200, 201, 204}) {
        resp.status_code = status;
        EXPECT_EQ(chunk_transmitter::classify_byte_range(resp).kind,
                  chunk_outcome::kind_type::complete);
    }

    resp.status_code = 500;
    auto rejected = chunk_transmitter::classify_byte_range(resp);
    EXPECT_TRUE(rejected.is_fatal());
    EXPECT_EQ(rejected.code, error_code::chunk_rejected);

    resp.status_code = 403;
    EXPECT_EQ(chunk_transmitter::classify_byte_range(resp).code, error_code::auth_failed);
}

TEST_F(ChunkTransmitterTest, RejectionKeepsResponseBody) {
    client_->set_handler([](const recorded_request&) {
        return mock_http_client::respond(400, {}, "Content-Range mismatch");
    });
    chunk_transmitter transmitter(client_, auth_);

    auto outcome = transmitter.transmit(first_, payload(600), byte_range_);
    ASSERT_TRUE(outcome.is_fatal());
    EXPECT_EQ(outcome.status_code, 400);
    EXPECT_EQ(outcome.body, "Content-Range mismatch");
}

TEST_F(ChunkTransmitterTest, TransportFailureHasNoStatus) {
    client_->set_handler([](const recorded_request&) {
        return mock_http_client::transport_failure();
    });
    chunk_transmitter transmitter(client_, auth_);

    auto outcome = transmitter.transmit(first_, payload(600), byte_range_);
    ASSERT_TRUE(outcome.is_fatal());
    EXPECT_EQ(outcome.code, error_code::connection_failed);
    EXPECT_EQ(outcome.status_code, 0);
}

TEST_F(ChunkTransmitterTest, PayloadSizeMismatchSendsNothing) {
    chunk_transmitter transmitter(client_, auth_);

    auto outcome = transmitter.transmit(first_, payload(10), byte_range_);
    ASSERT_TRUE(outcome.is_fatal());
    EXPECT_EQ(outcome.code, error_code::internal_error);
    EXPECT_EQ(client_->request_count(), 0u);
}

TEST_F(ChunkTransmitterTest, ChunkIdBodyFields) {
    auto data = payload(600);
    auto body = chunk_transmitter::build_chunk_body(first_, data, chunk_id_);

    EXPECT_EQ(encoding::extract_json_value(body, "uploadId").value_or(""), chunk_id_.endpoint);
    EXPECT_EQ(encoding::extract_json_value(body, "fileName").value_or(""), "Setup.pkg");
    EXPECT_EQ(encoding::extract_json_value(body, "chunkNumber").value_or(""), "1");
    EXPECT_EQ(encoding::extract_json_value(body, "totalChunks").value_or(""), "2");
    EXPECT_EQ(encoding::extract_json_value(body, "version").value_or(""), "2.0");

    auto decoded =
        encoding::base64_decode(encoding::extract_json_value(body, "chunkData").value_or(""));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

TEST_F(ChunkTransmitterTest, MetadataOnlyOnFirstChunk) {
    auto body = chunk_transmitter::build_chunk_body(second_, payload(400), chunk_id_);

    EXPECT_FALSE(encoding::extract_json_value(body, "version").has_value());
    EXPECT_EQ(encoding::extract_json_value(body, "chunkNumber").value_or(""), "2");
}

TEST_F(ChunkTransmitterTest, ChunkIdPostSucceedsOn2xx) {
    client_->set_handler([](const recorded_request&) { return mock_http_client::respond(202); });
    chunk_transmitter transmitter(client_, auth_);

    auto outcome = transmitter.transmit(first_, payload(600), chunk_id_);
    EXPECT_EQ(outcome.kind, chunk_outcome::kind_type::continue_upload);

    auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(requests[0].url, chunk_id_.chunk_url);
    EXPECT_EQ(requests[0].header("Content-Type"), "application/json");
}

TEST_F(ChunkTransmitterTest, ChunkIdRejection) {
    http_response resp;
    resp.status_code = 308;
    EXPECT_TRUE(chunk_transmitter::classify_chunk_id(resp).is_fatal());

    resp.status_code = 401;
    EXPECT_EQ(chunk_transmitter::classify_chunk_id(resp).code, error_code::auth_failed);
}

// =============================================================================
// Finalizer
// =============================================================================

TEST_F(ChunkTransmitterTest, FinalizeNotRequiredForByteRange) {
    finalizer fin(client_, auth_);

    EXPECT_FALSE(finalizer::required(byte_range_));
    EXPECT_TRUE(fin.commit(byte_range_));
    EXPECT_EQ(client_->request_count(), 0u);
}

TEST_F(ChunkTransmitterTest, FinalizePostsSessionSummary) {
    client_->set_handler([](const recorded_request&) { return mock_http_client::respond(200); });
    finalizer fin(client_, auth_);

    ASSERT_TRUE(finalizer::required(chunk_id_));
    EXPECT_TRUE(fin.commit(chunk_id_));

    auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, chunk_id_.finalize_url);
    const auto& body = requests[0].text_body;
    EXPECT_EQ(encoding::extract_json_value(body, "uploadId").value_or(""), chunk_id_.endpoint);
    EXPECT_EQ(encoding::extract_json_value(body, "fileName").value_or(""), "Setup.pkg");
    EXPECT_EQ(encoding::extract_json_value(body, "totalChunks").value_or(""), "2");
}

TEST_F(ChunkTransmitterTest, FinalizeRejected) {
    client_->set_handler([](const recorded_request&) {
        return mock_http_client::respond(409, {}, "missing chunk 2");
    });
    finalizer fin(client_, auth_);

    auto committed = fin.commit(chunk_id_);
    ASSERT_FALSE(committed);
    EXPECT_EQ(committed.error().err.code, error_code::finalize_rejected);
    EXPECT_EQ(committed.error().status_code, 409);
    EXPECT_EQ(committed.error().body, "missing chunk 2");
}

}  // namespace kcenon::package_upload::test
