/**
 * @file finalizer.h
 * @brief Completion call of the chunk-id protocol
 */

#ifndef KCENON_PACKAGE_UPLOAD_UPLOAD_FINALIZER_H
#define KCENON_PACKAGE_UPLOAD_UPLOAD_FINALIZER_H

#include <kcenon/package_upload/http/http_types.h>
#include <kcenon/package_upload/upload/auth_provider.h>
#include <kcenon/package_upload/upload/upload_types.h>

#include <memory>
#include <string>

namespace kcenon::package_upload {

/**
 * @brief Error returned by finalize, with the HTTP status when one was received
 */
struct finalize_error {
    error err;
    int status_code = 0;
    std::string body;
};

/**
 * @brief Second phase of the chunk-id two-phase commit
 *
 * For byte-range sessions commit() returns immediately without a request;
 * completion was already signalled by the last chunk's response.
 */
class finalizer {
public:
    finalizer(std::shared_ptr<http_client_interface> client,
              std::shared_ptr<auth_provider> auth);

    /**
     * @brief Whether the session's protocol needs an explicit commit
     */
    [[nodiscard]] static auto required(const upload_session& session) -> bool {
        return session.protocol == protocol_variant::chunk_id_finalize;
    }

    /**
     * @brief Send {uploadId, fileName, totalChunks} to the finalize endpoint
     * @return finalize_rejected on any non-2xx status
     */
    [[nodiscard]] auto commit(const upload_session& session) -> result<void, finalize_error>;

    [[nodiscard]] static auto build_finalize_body(const upload_session& session) -> std::string;

private:
    std::shared_ptr<http_client_interface> client_;
    std::shared_ptr<auth_provider> auth_;
};

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_UPLOAD_FINALIZER_H
