/**
 * @file types.h
 * @brief Core type definitions for package_upload
 */

#ifndef KCENON_PACKAGE_UPLOAD_CORE_TYPES_H
#define KCENON_PACKAGE_UPLOAD_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::package_upload {

/**
 * @brief Error codes for upload operations
 */
enum class error_code {
    success = 0,

    // File errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    file_read_error = -102,
    empty_file = -103,

    // Configuration errors (-140 to -159)
    invalid_chunk_size = -140,
    invalid_configuration = -141,
    size_mismatch = -142,

    // Authentication errors (-150 to -159)
    auth_failed = -150,

    // Protocol errors (-160 to -179)
    unexpected_status = -160,
    missing_upload_location = -161,
    malformed_response = -162,

    // Network errors (-180 to -199)
    connection_failed = -180,
    connection_timeout = -181,
    transport_unavailable = -182,

    // Transfer errors (-200 to -219)
    chunk_rejected = -200,
    finalize_rejected = -201,

    // Internal errors (-220 to -239)
    internal_error = -220,
    not_initialized = -221,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::empty_file:
            return "empty file";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::size_mismatch:
            return "size mismatch";
        case error_code::auth_failed:
            return "authentication failed";
        case error_code::unexpected_status:
            return "unexpected status";
        case error_code::missing_upload_location:
            return "missing upload location";
        case error_code::malformed_response:
            return "malformed response";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::transport_unavailable:
            return "transport unavailable";
        case error_code::chunk_rejected:
            return "chunk rejected";
        case error_code::finalize_rejected:
            return "finalize rejected";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for an unexpected error value (used with result<T, E>)
 */
template <typename E>
struct basic_unexpected {
    E err;

    explicit basic_unexpected(E e) : err(std::move(e)) {}
};

using unexpected = basic_unexpected<error>;

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error of type E.
 */
template <typename T, typename E = error>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(basic_unexpected<E> u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const E& { return error_; }

private:
    std::optional<T> value_;
    E error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <typename E>
class result<void, E> {
public:
    result() : has_value_(true) {}

    result(basic_unexpected<E> u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const E& { return error_; }

private:
    bool has_value_;
    E error_;
};

/**
 * @brief Failure taxonomy reported to callers
 */
enum class failure_kind {
    none,
    config_error,
    auth_error,
    protocol_error,
    network_error,
    chunk_failure,
    finalize_failure,
    io_error,  ///< Source file became unreadable after validation
    internal_failure,
};

[[nodiscard]] constexpr auto to_string(failure_kind kind) -> const char* {
    switch (kind) {
        case failure_kind::none: return "none";
        case failure_kind::config_error: return "config_error";
        case failure_kind::auth_error: return "auth_error";
        case failure_kind::protocol_error: return "protocol_error";
        case failure_kind::network_error: return "network_error";
        case failure_kind::chunk_failure: return "chunk_failure";
        case failure_kind::finalize_failure: return "finalize_failure";
        case failure_kind::io_error: return "io_error";
        case failure_kind::internal_failure: return "internal_failure";
        default: return "unknown";
    }
}

/**
 * @brief Map an error code onto the failure taxonomy
 */
[[nodiscard]] constexpr auto classify(error_code code) -> failure_kind {
    switch (code) {
        case error_code::success:
            return failure_kind::none;
        case error_code::file_not_found:
        case error_code::file_access_denied:
        case error_code::empty_file:
        case error_code::invalid_chunk_size:
        case error_code::invalid_configuration:
        case error_code::size_mismatch:
            return failure_kind::config_error;
        case error_code::auth_failed:
            return failure_kind::auth_error;
        case error_code::unexpected_status:
        case error_code::missing_upload_location:
        case error_code::malformed_response:
            return failure_kind::protocol_error;
        case error_code::connection_failed:
        case error_code::connection_timeout:
        case error_code::transport_unavailable:
            return failure_kind::network_error;
        case error_code::chunk_rejected:
            return failure_kind::chunk_failure;
        case error_code::finalize_rejected:
            return failure_kind::finalize_failure;
        case error_code::file_read_error:
            return failure_kind::io_error;
        default:
            return failure_kind::internal_failure;
    }
}

/**
 * @brief Check whether an HTTP status denotes rejected credentials
 *
 * 401 and 403 are authentication failures wherever they occur.
 */
[[nodiscard]] constexpr auto is_auth_status(int status_code) noexcept -> bool {
    return status_code == 401 || status_code == 403;
}

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_CORE_TYPES_H
