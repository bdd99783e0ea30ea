/**
 * @file http_types.h
 * @brief HTTP request/response types and the client seam used by uploads
 */

#ifndef KCENON_PACKAGE_UPLOAD_HTTP_HTTP_TYPES_H
#define KCENON_PACKAGE_UPLOAD_HTTP_HTTP_TYPES_H

#include <kcenon/package_upload/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::package_upload {

using http_headers = std::map<std::string, std::string>;

/**
 * @brief HTTP status codes the upload protocols depend on
 */
namespace http_status {
inline constexpr int ok = 200;
inline constexpr int created = 201;
inline constexpr int no_content = 204;
/// "Resume Incomplete": the server accepted data and expects more
inline constexpr int resume_incomplete = 308;
inline constexpr int unauthorized = 401;
inline constexpr int forbidden = 403;
}  // namespace http_status

/**
 * @brief HTTP response
 */
struct http_response {
    int status_code = 0;
    http_headers headers;
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return s;
        };

        auto lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief HTTP client interface for dependency injection
 *
 * Only the two verbs the upload wire protocols use are required. A
 * transport-level failure (no response at all) is reported as an error
 * classified as network_error; any response, whatever its status, is a
 * value.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    /**
     * @brief Execute POST request with a text body
     */
    virtual auto post(const std::string& url,
                      const std::string& body,
                      const http_headers& headers) -> result<http_response> = 0;

    /**
     * @brief Execute PUT request with a binary body
     */
    virtual auto put(const std::string& url,
                     const std::vector<uint8_t>& body,
                     const http_headers& headers) -> result<http_response> = 0;
};

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_HTTP_HTTP_TYPES_H
