/**
 * @file http_client.cpp
 * @brief network_system backed HTTP client
 */

#include "kcenon/package_upload/http/http_client.h"

#include "kcenon/package_upload/config/feature_flags.h"

#include <algorithm>
#include <cctype>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::package_upload {

namespace {

[[maybe_unused]] auto transport_error(const std::string& verb, const std::string& detail)
    -> error {
    std::string lower = detail;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto code = (lower.find("timeout") != std::string::npos ||
                 lower.find("timed out") != std::string::npos)
                    ? error_code::connection_timeout
                    : error_code::connection_failed;
    return error{code, "HTTP " + verb + " request failed: " + detail};
}

}  // namespace

struct http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;
    std::chrono::milliseconds timeout;

    explicit impl(std::chrono::milliseconds request_timeout) : timeout(request_timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(const kcenon::network::internal::http_response& resp)
        -> http_response {
        http_response out;
        out.status_code = resp.status_code;
        out.headers = resp.headers;
        out.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return out;
    }
#endif
};

http_client::http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

http_client::~http_client() = default;

http_client::http_client(http_client&&) noexcept = default;
auto http_client::operator=(http_client&&) noexcept -> http_client& = default;

auto http_client::post(const std::string& url,
                       const std::string& body,
                       const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::not_initialized, "HTTP client not initialized"}};
    }

    auto response = impl_->client->post(url, body, headers);
    if (response.is_err()) {
        return unexpected{transport_error("POST", response.error().message)};
    }
    return impl::convert_response(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return unexpected{error{error_code::transport_unavailable,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto http_client::put(const std::string& url,
                      const std::vector<uint8_t>& body,
                      const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::not_initialized, "HTTP client not initialized"}};
    }

    std::string body_str(body.begin(), body.end());
    auto response = impl_->client->put(url, body_str, headers);
    if (response.is_err()) {
        return unexpected{transport_error("PUT", response.error().message)};
    }
    return impl::convert_response(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return unexpected{error{error_code::transport_unavailable,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

auto http_client::timeout() const noexcept -> std::chrono::milliseconds {
    return impl_->timeout;
}

auto make_http_client(std::chrono::milliseconds timeout) -> std::shared_ptr<http_client> {
    return std::make_shared<http_client>(timeout);
}

}  // namespace kcenon::package_upload
