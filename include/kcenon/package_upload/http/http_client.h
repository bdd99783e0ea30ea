/**
 * @file http_client.h
 * @brief HTTP client backed by the network_system HTTP client
 */

#ifndef KCENON_PACKAGE_UPLOAD_HTTP_HTTP_CLIENT_H
#define KCENON_PACKAGE_UPLOAD_HTTP_HTTP_CLIENT_H

#include <kcenon/package_upload/http/http_types.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::package_upload {

/**
 * @brief Production HTTP client
 *
 * Wraps kcenon::network::core::http_client. Without network_system in the
 * build every request fails with transport_unavailable, so tests inject a
 * mock through http_client_interface instead.
 *
 * @note Thread-safe for concurrent requests.
 */
class http_client : public http_client_interface {
public:
    explicit http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(300000));

    ~http_client() override;

    http_client(const http_client&) = delete;
    auto operator=(const http_client&) -> http_client& = delete;
    http_client(http_client&&) noexcept;
    auto operator=(http_client&&) noexcept -> http_client&;

    [[nodiscard]] auto post(const std::string& url,
                            const std::string& body,
                            const http_headers& headers)
        -> result<http_response> override;

    [[nodiscard]] auto put(const std::string& url,
                           const std::vector<uint8_t>& body,
                           const http_headers& headers)
        -> result<http_response> override;

    /**
     * @brief Check if the HTTP transport is compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

    /**
     * @brief Per-request timeout fixed at construction
     */
    [[nodiscard]] auto timeout() const noexcept -> std::chrono::milliseconds;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

[[nodiscard]] auto make_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(300000))
    -> std::shared_ptr<http_client>;

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_HTTP_HTTP_CLIENT_H
