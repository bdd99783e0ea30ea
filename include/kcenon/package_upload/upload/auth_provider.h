/**
 * @file auth_provider.h
 * @brief Source of the bearer token attached to every upload request
 */

#ifndef KCENON_PACKAGE_UPLOAD_UPLOAD_AUTH_PROVIDER_H
#define KCENON_PACKAGE_UPLOAD_UPLOAD_AUTH_PROVIDER_H

#include <kcenon/package_upload/core/types.h>

#include <functional>
#include <memory>
#include <string>

namespace kcenon::package_upload {

/**
 * @brief Supplies bearer tokens
 *
 * Token acquisition and refresh live outside the upload engine. The engine
 * asks for a token before each request, so a provider that refreshes is
 * picked up mid-upload.
 */
class auth_provider {
public:
    virtual ~auth_provider() = default;

    /**
     * @brief Current bearer token
     * @return The token, or auth_failed when none can be obtained
     */
    [[nodiscard]] virtual auto get_token() -> result<std::string> = 0;
};

/**
 * @brief Provider for a token fixed at construction
 */
class static_token_provider : public auth_provider {
public:
    explicit static_token_provider(std::string token);

    [[nodiscard]] auto get_token() -> result<std::string> override;

private:
    std::string token_;
};

/**
 * @brief Provider that delegates to a callable
 */
class callback_token_provider : public auth_provider {
public:
    using token_fn = std::function<result<std::string>()>;

    explicit callback_token_provider(token_fn fn);

    [[nodiscard]] auto get_token() -> result<std::string> override;

private:
    token_fn fn_;
};

/**
 * @brief Format an Authorization header value
 */
[[nodiscard]] auto bearer(const std::string& token) -> std::string;

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_UPLOAD_AUTH_PROVIDER_H
