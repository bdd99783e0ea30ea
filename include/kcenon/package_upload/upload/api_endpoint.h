/**
 * @file api_endpoint.h
 * @brief API base URL, regional defaults and upload URL construction
 */

#ifndef KCENON_PACKAGE_UPLOAD_UPLOAD_API_ENDPOINT_H
#define KCENON_PACKAGE_UPLOAD_UPLOAD_API_ENDPOINT_H

#include <kcenon/package_upload/core/types.h>
#include <kcenon/package_upload/upload/upload_types.h>

#include <string>
#include <string_view>

namespace kcenon::package_upload {

/**
 * @brief Hosting regions of the software repository service
 */
enum class region {
    north_america,
    europe,
    australia,
};

[[nodiscard]] constexpr auto to_string(region r) -> const char* {
    switch (r) {
        case region::north_america: return "NorthAmerica";
        case region::europe: return "Europe";
        case region::australia: return "Australia";
        default: return "unknown";
    }
}

/**
 * @brief Versioned API base (e.g. https://app.eu.action1.com/api/3.0)
 *
 * @code
 * auto endpoint = api_endpoint::from_region_name("eu");
 * auto url = endpoint.value().upload_init_url(target);
 * @endcode
 */
class api_endpoint {
public:
    static constexpr region default_region = region::europe;

    /// Versioned path that legacy "/API/..." locations are rewritten onto
    static constexpr std::string_view api_path_prefix = "/api/3.0";

    [[nodiscard]] static auto base_url_for(region r) -> std::string;

    /**
     * @brief Parse a region name
     *
     * Accepts NorthAmerica, north_america, na, us, global, Europe, eu,
     * Australia and au, case-insensitively.
     */
    [[nodiscard]] static auto parse_region(std::string_view name) -> result<region>;

    [[nodiscard]] static auto for_region(region r) -> api_endpoint;

    [[nodiscard]] static auto from_region_name(std::string_view name) -> result<api_endpoint>;

    /**
     * @brief Use an explicit base URL
     * @return invalid_configuration unless it is an absolute http(s) URL
     */
    [[nodiscard]] static auto from_base_url(std::string_view url) -> result<api_endpoint>;

    /**
     * @brief Explicit base URL when given, region name otherwise, Europe by default
     */
    [[nodiscard]] static auto resolve(std::string_view base_url, std::string_view region_name)
        -> result<api_endpoint>;

    [[nodiscard]] auto base_url() const -> const std::string& { return base_url_; }

    /**
     * @brief scheme://host[:port] of the base URL
     */
    [[nodiscard]] auto origin() const -> const std::string& { return origin_; }

    /**
     * @brief {base}/software-repository/{org}/{package}/versions/{version}
     */
    [[nodiscard]] auto version_url(const upload_target& target) const -> std::string;

    /**
     * @brief Resumable upload initiator, with the platform as query parameter
     */
    [[nodiscard]] auto upload_init_url(const upload_target& target) const -> std::string;

    [[nodiscard]] auto chunk_url(const upload_target& target) const -> std::string;

    [[nodiscard]] auto finalize_url(const upload_target& target) const -> std::string;

    /**
     * @brief Turn an upload-location header into an absolute URL
     *
     * Absolute http(s) locations are returned unchanged. A leading "/API"
     * segment is rewritten to the versioned API path. Anything else is
     * joined to the origin.
     */
    [[nodiscard]] auto normalize_location(std::string_view location) const
        -> result<std::string>;

private:
    api_endpoint(std::string base_url, std::string origin);

    std::string base_url_;
    std::string origin_;
};

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_UPLOAD_API_ENDPOINT_H
