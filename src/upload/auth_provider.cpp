/**
 * @file auth_provider.cpp
 * @brief Bearer token providers
 */

#include <kcenon/package_upload/upload/auth_provider.h>

namespace kcenon::package_upload {

static_token_provider::static_token_provider(std::string token)
    : token_(std::move(token)) {}

auto static_token_provider::get_token() -> result<std::string> {
    if (token_.empty()) {
        return unexpected(error{error_code::auth_failed, "no bearer token configured"});
    }
    return token_;
}

callback_token_provider::callback_token_provider(token_fn fn) : fn_(std::move(fn)) {}

auto callback_token_provider::get_token() -> result<std::string> {
    if (!fn_) {
        return unexpected(error{error_code::auth_failed, "no token callback configured"});
    }
    auto token = fn_();
    if (!token) {
        return unexpected(error{error_code::auth_failed, token.error().message});
    }
    if (token.value().empty()) {
        return unexpected(error{error_code::auth_failed, "token callback returned empty token"});
    }
    return token;
}

auto bearer(const std::string& token) -> std::string {
    return "Bearer " + token;
}

}  // namespace kcenon::package_upload
