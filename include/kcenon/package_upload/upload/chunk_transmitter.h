/**
 * @file chunk_transmitter.h
 * @brief Sends one chunk and classifies the server's answer
 */

#ifndef KCENON_PACKAGE_UPLOAD_UPLOAD_CHUNK_TRANSMITTER_H
#define KCENON_PACKAGE_UPLOAD_UPLOAD_CHUNK_TRANSMITTER_H

#include <kcenon/package_upload/core/chunk_planner.h>
#include <kcenon/package_upload/http/http_types.h>
#include <kcenon/package_upload/upload/auth_provider.h>
#include <kcenon/package_upload/upload/upload_types.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::package_upload {

/**
 * @brief Classified result of one chunk transmission
 */
struct chunk_outcome {
    enum class kind_type {
        continue_upload,  ///< Accepted, more chunks expected
        complete,         ///< Accepted, the server considers the upload done
        fatal,            ///< Rejected or not delivered
    };

    kind_type kind = kind_type::fatal;
    int status_code = 0;
    error_code code = error_code::success;
    std::string message;
    std::string body;

    [[nodiscard]] auto is_fatal() const -> bool { return kind == kind_type::fatal; }

    [[nodiscard]] static auto proceed(int status) -> chunk_outcome {
        return {kind_type::continue_upload, status, error_code::success, {}, {}};
    }

    [[nodiscard]] static auto done(int status) -> chunk_outcome {
        return {kind_type::complete, status, error_code::success, {}, {}};
    }

    [[nodiscard]] static auto failed(error_code code, std::string message, int status = 0,
                                     std::string body = {}) -> chunk_outcome {
        return {kind_type::fatal, status, code, std::move(message), std::move(body)};
    }
};

class chunk_transmitter {
public:
    chunk_transmitter(std::shared_ptr<http_client_interface> client,
                      std::shared_ptr<auth_provider> auth);

    /**
     * @brief Send one chunk using the session's protocol
     * @param c The planned chunk
     * @param payload Exactly c.size bytes read from the source file
     */
    [[nodiscard]] auto transmit(const chunk& c,
                                const std::vector<uint8_t>& payload,
                                const upload_session& session) -> chunk_outcome;

    /**
     * @brief JSON body of a chunk-id request
     *
     * {uploadId, fileName, chunkNumber, totalChunks, chunkData}; chunk 1 also
     * carries the session metadata as extra string fields.
     */
    [[nodiscard]] static auto build_chunk_body(const chunk& c,
                                               const std::vector<uint8_t>& payload,
                                               const upload_session& session) -> std::string;

    /**
     * @brief Map a byte-range PUT status to an outcome
     */
    [[nodiscard]] static auto classify_byte_range(const http_response& response)
        -> chunk_outcome;

    /**
     * @brief Map a chunk-id POST status to an outcome
     */
    [[nodiscard]] static auto classify_chunk_id(const http_response& response)
        -> chunk_outcome;

private:
    [[nodiscard]] auto send_byte_range(const chunk& c,
                                       const std::vector<uint8_t>& payload,
                                       const upload_session& session,
                                       const std::string& token) -> chunk_outcome;

    [[nodiscard]] auto send_chunk_id(const chunk& c,
                                     const std::vector<uint8_t>& payload,
                                     const upload_session& session,
                                     const std::string& token) -> chunk_outcome;

    std::shared_ptr<http_client_interface> client_;
    std::shared_ptr<auth_provider> auth_;
};

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_UPLOAD_CHUNK_TRANSMITTER_H
