/**
 * @file finalizer.cpp
 * @brief Chunk-id finalize call
 */

#include <kcenon/package_upload/upload/finalizer.h>

#include <kcenon/package_upload/core/encoding.h>
#include <kcenon/package_upload/core/logging.h>

#include <sstream>

namespace kcenon::package_upload {

namespace {

using finalize_unexpected = basic_unexpected<finalize_error>;

}  // namespace

finalizer::finalizer(std::shared_ptr<http_client_interface> client,
                     std::shared_ptr<auth_provider> auth)
    : client_(std::move(client)), auth_(std::move(auth)) {}

auto finalizer::build_finalize_body(const upload_session& session) -> std::string {
    std::ostringstream oss;
    oss << "{";
    oss << "\"uploadId\":\"" << encoding::json_escape(session.endpoint) << "\"";
    oss << ",\"fileName\":\"" << encoding::json_escape(session.file_name) << "\"";
    oss << ",\"totalChunks\":" << session.total_chunks;
    oss << "}";
    return oss.str();
}

auto finalizer::commit(const upload_session& session) -> result<void, finalize_error> {
    if (!required(session)) {
        return {};
    }

    upload_log_context ctx;
    ctx.upload_id = session.endpoint;
    ctx.file_name = session.file_name;
    ctx.total_chunks = session.total_chunks;

    auto token = auth_->get_token();
    if (!token) {
        return finalize_unexpected{
            finalize_error{error{error_code::auth_failed, token.error().message}}};
    }

    http_headers headers = {
        {"Authorization", bearer(token.value())},
        {"Content-Type", "application/json"},
        {"Accept", "application/json"},
    };

    PU_LOG_INFO_CTX(log_category::finalize, "Finalizing chunked upload", ctx);

    auto response = client_->post(session.finalize_url, build_finalize_body(session), headers);
    if (!response) {
        ctx.error_message = response.error().message;
        PU_LOG_ERROR_CTX(log_category::finalize, "Finalize request failed", ctx);
        return finalize_unexpected{finalize_error{response.error()}};
    }

    const auto& resp = response.value();
    ctx.status_code = resp.status_code;

    if (!resp.is_success()) {
        auto code = is_auth_status(resp.status_code) ? error_code::auth_failed
                                                     : error_code::finalize_rejected;
        ctx.error_message = resp.get_body_string();
        PU_LOG_ERROR_CTX(log_category::finalize, "Finalize rejected", ctx);
        return finalize_unexpected{finalize_error{
            error{code, "finalize rejected with HTTP " + std::to_string(resp.status_code)},
            resp.status_code, resp.get_body_string()}};
    }

    PU_LOG_INFO_CTX(log_category::finalize, "Upload finalized", ctx);
    return {};
}

}  // namespace kcenon::package_upload
