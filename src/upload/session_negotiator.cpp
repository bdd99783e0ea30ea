/**
 * @file session_negotiator.cpp
 * @brief Upload session negotiation for both wire protocols
 */

#include <kcenon/package_upload/upload/session_negotiator.h>

#include <kcenon/package_upload/core/encoding.h>
#include <kcenon/package_upload/core/logging.h>

namespace kcenon::package_upload {

namespace {

using negotiation_unexpected = basic_unexpected<negotiation_error>;

auto fail(error_code code, std::string message, int status = 0, std::string body = {})
    -> negotiation_unexpected {
    return negotiation_unexpected{
        negotiation_error{error{code, std::move(message)}, status, std::move(body)}};
}

}  // namespace

session_negotiator::session_negotiator(std::shared_ptr<http_client_interface> client,
                                       std::shared_ptr<auth_provider> auth,
                                       api_endpoint endpoint)
    : client_(std::move(client)), auth_(std::move(auth)), endpoint_(std::move(endpoint)) {}

auto session_negotiator::open(const upload_target& target, const upload_config& config)
    -> result<upload_session, negotiation_error> {
    if (auto valid = config.validate(); !valid) {
        return negotiation_unexpected{negotiation_error{valid.error()}};
    }
    if (target.total_size == 0) {
        return fail(error_code::empty_file, "cannot open a session for an empty file");
    }

    upload_session session;
    session.protocol = config.protocol;
    session.chunk_size = config.chunk_size;
    session.total_size = target.total_size;
    session.total_chunks =
        static_cast<uint32_t>(config.chunking().calculate_chunk_count(target.total_size));
    session.file_name = target.file_name;

    if (config.protocol == protocol_variant::chunk_id_finalize) {
        session.metadata = config.metadata;
        return open_chunk_id(target, std::move(session));
    }
    return open_byte_range(target, std::move(session));
}

auto session_negotiator::open_byte_range(const upload_target& target, upload_session session)
    -> result<upload_session, negotiation_error> {
    auto token = auth_->get_token();
    if (!token) {
        return fail(error_code::auth_failed, token.error().message);
    }

    auto url = endpoint_.upload_init_url(target);

    upload_log_context ctx;
    ctx.file_name = target.file_name;
    ctx.platform = target.platform;
    ctx.total_size = target.total_size;
    PU_LOG_INFO_CTX(log_category::session, "Initializing resumable upload", ctx);

    http_headers headers = {
        {"Authorization", bearer(token.value())},
        {"Content-Type", "application/json"},
        {"Accept", "application/json"},
        {"X-Upload-Content-Type", "application/octet-stream"},
        {"X-Upload-Content-Length", std::to_string(target.total_size)},
    };

    auto response = client_->post(url, "", headers);
    if (!response) {
        ctx.error_message = response.error().message;
        PU_LOG_ERROR_CTX(log_category::session, "Upload init request failed", ctx);
        return fail(response.error().code, response.error().message);
    }

    const auto& resp = response.value();
    ctx.status_code = resp.status_code;

    if (is_auth_status(resp.status_code)) {
        PU_LOG_ERROR_CTX(log_category::session, "Upload init rejected credentials", ctx);
        return fail(error_code::auth_failed,
                    "upload init rejected with HTTP " + std::to_string(resp.status_code),
                    resp.status_code, resp.get_body_string());
    }

    if (resp.status_code != http_status::resume_incomplete) {
        ctx.error_message = resp.get_body_string();
        PU_LOG_ERROR_CTX(log_category::session, "Upload init failed (expected 308)", ctx);
        return fail(error_code::unexpected_status,
                    "upload init failed (expected 308), got HTTP " +
                        std::to_string(resp.status_code),
                    resp.status_code, resp.get_body_string());
    }

    auto location = resp.get_header(upload_location_header);
    if (!location || location->empty()) {
        PU_LOG_ERROR_CTX(log_category::session,
                         "Upload init succeeded but X-Upload-Location missing", ctx);
        return fail(error_code::missing_upload_location,
                    "upload init returned 308 without X-Upload-Location",
                    resp.status_code, resp.get_body_string());
    }

    auto normalized = endpoint_.normalize_location(*location);
    if (!normalized) {
        return fail(normalized.error().code, normalized.error().message, resp.status_code);
    }

    session.endpoint = normalized.value();
    ctx.upload_location = session.endpoint;
    ctx.total_chunks = session.total_chunks;
    PU_LOG_INFO_CTX(log_category::session, "Upload session opened", ctx);

    return session;
}

auto session_negotiator::open_chunk_id(const upload_target& target, upload_session session)
    -> result<upload_session, negotiation_error> {
    session.endpoint = encoding::generate_random_hex(16);
    session.chunk_url = endpoint_.chunk_url(target);
    session.finalize_url = endpoint_.finalize_url(target);

    upload_log_context ctx;
    ctx.upload_id = session.endpoint;
    ctx.file_name = target.file_name;
    ctx.platform = target.platform;
    ctx.total_size = target.total_size;
    ctx.total_chunks = session.total_chunks;
    PU_LOG_INFO_CTX(log_category::session, "Chunked upload session created", ctx);

    return session;
}

}  // namespace kcenon::package_upload
