/**
 * @file chunk_transmitter.cpp
 * @brief Single-chunk transmission for both wire protocols
 */

#include <kcenon/package_upload/upload/chunk_transmitter.h>

#include <kcenon/package_upload/core/encoding.h>

#include <sstream>

namespace kcenon::package_upload {

namespace {

auto rejected(const http_response& response) -> chunk_outcome {
    auto status = response.status_code;
    auto code = is_auth_status(status) ? error_code::auth_failed : error_code::chunk_rejected;
    return chunk_outcome::failed(code, "chunk rejected with HTTP " + std::to_string(status),
                                 status, response.get_body_string());
}

}  // namespace

chunk_transmitter::chunk_transmitter(std::shared_ptr<http_client_interface> client,
                                     std::shared_ptr<auth_provider> auth)
    : client_(std::move(client)), auth_(std::move(auth)) {}

auto chunk_transmitter::transmit(const chunk& c,
                                 const std::vector<uint8_t>& payload,
                                 const upload_session& session) -> chunk_outcome {
    if (payload.size() != c.size) {
        return chunk_outcome::failed(
            error_code::internal_error,
            "payload of chunk " + std::to_string(c.number) + " has " +
                std::to_string(payload.size()) + " bytes, planned " + std::to_string(c.size));
    }

    auto token = auth_->get_token();
    if (!token) {
        return chunk_outcome::failed(error_code::auth_failed, token.error().message);
    }

    if (session.protocol == protocol_variant::chunk_id_finalize) {
        return send_chunk_id(c, payload, session, token.value());
    }
    return send_byte_range(c, payload, session, token.value());
}

auto chunk_transmitter::classify_byte_range(const http_response& response) -> chunk_outcome {
    switch (response.status_code) {
        case http_status::resume_incomplete:
            return chunk_outcome::proceed(response.status_code);
        case http_status::ok:
        case http_status::created:
        case http_status::no_content:
            return chunk_outcome::done(response.status_code);
        default:
            return rejected(response);
    }
}

auto chunk_transmitter::classify_chunk_id(const http_response& response) -> chunk_outcome {
    if (response.is_success()) {
        return chunk_outcome::proceed(response.status_code);
    }
    return rejected(response);
}

auto chunk_transmitter::send_byte_range(const chunk& c,
                                        const std::vector<uint8_t>& payload,
                                        const upload_session& session,
                                        const std::string& token) -> chunk_outcome {
    http_headers headers = {
        {"Authorization", bearer(token)},
        {"Content-Type", "application/octet-stream"},
        {"Content-Length", std::to_string(c.size)},
        {"Content-Range", c.content_range(session.total_size)},
    };

    auto response = client_->put(session.endpoint, payload, headers);
    if (!response) {
        return chunk_outcome::failed(response.error().code, response.error().message);
    }
    return classify_byte_range(response.value());
}

auto chunk_transmitter::send_chunk_id(const chunk& c,
                                      const std::vector<uint8_t>& payload,
                                      const upload_session& session,
                                      const std::string& token) -> chunk_outcome {
    http_headers headers = {
        {"Authorization", bearer(token)},
        {"Content-Type", "application/json"},
        {"Accept", "application/json"},
    };

    auto response = client_->post(session.chunk_url, build_chunk_body(c, payload, session),
                                  headers);
    if (!response) {
        return chunk_outcome::failed(response.error().code, response.error().message);
    }
    return classify_chunk_id(response.value());
}

auto chunk_transmitter::build_chunk_body(const chunk& c,
                                         const std::vector<uint8_t>& payload,
                                         const upload_session& session) -> std::string {
    std::ostringstream oss;
    oss << "{";
    oss << "\"uploadId\":\"" << encoding::json_escape(session.endpoint) << "\"";
    oss << ",\"fileName\":\"" << encoding::json_escape(session.file_name) << "\"";
    oss << ",\"chunkNumber\":" << c.number;
    oss << ",\"totalChunks\":" << session.total_chunks;

    if (c.number == 1) {
        for (const auto& [key, value] : session.metadata) {
            oss << ",\"" << encoding::json_escape(key) << "\":\""
                << encoding::json_escape(value) << "\"";
        }
    }

    oss << ",\"chunkData\":\"" << encoding::base64_encode(payload) << "\"";
    oss << "}";
    return oss.str();
}

}  // namespace kcenon::package_upload
