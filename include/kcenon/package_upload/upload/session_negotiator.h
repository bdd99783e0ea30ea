/**
 * @file session_negotiator.h
 * @brief Opens an upload session with the software repository service
 */

#ifndef KCENON_PACKAGE_UPLOAD_UPLOAD_SESSION_NEGOTIATOR_H
#define KCENON_PACKAGE_UPLOAD_UPLOAD_SESSION_NEGOTIATOR_H

#include <kcenon/package_upload/http/http_types.h>
#include <kcenon/package_upload/upload/api_endpoint.h>
#include <kcenon/package_upload/upload/auth_provider.h>
#include <kcenon/package_upload/upload/upload_types.h>

#include <memory>

namespace kcenon::package_upload {

/**
 * @brief Response header naming the resumable upload URL
 */
inline constexpr const char* upload_location_header = "X-Upload-Location";

/**
 * @brief Error returned by negotiation, with the HTTP status when one was received
 */
struct negotiation_error {
    error err;
    int status_code = 0;
    std::string body;
};

class session_negotiator {
public:
    session_negotiator(std::shared_ptr<http_client_interface> client,
                       std::shared_ptr<auth_provider> auth,
                       api_endpoint endpoint);

    /**
     * @brief Open a session for one upload attempt
     *
     * Byte-range: POSTs the initiator and requires 308 plus an upload
     * location header. Chunk-id: generates the upload id locally without
     * any request.
     */
    [[nodiscard]] auto open(const upload_target& target, const upload_config& config)
        -> result<upload_session, negotiation_error>;

    [[nodiscard]] auto endpoint() const -> const api_endpoint& { return endpoint_; }

private:
    [[nodiscard]] auto open_byte_range(const upload_target& target,
                                       upload_session session)
        -> result<upload_session, negotiation_error>;

    [[nodiscard]] auto open_chunk_id(const upload_target& target, upload_session session)
        -> result<upload_session, negotiation_error>;

    std::shared_ptr<http_client_interface> client_;
    std::shared_ptr<auth_provider> auth_;
    api_endpoint endpoint_;
};

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_UPLOAD_SESSION_NEGOTIATOR_H
