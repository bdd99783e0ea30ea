/**
 * @file api_endpoint.cpp
 * @brief API base URL handling
 */

#include <kcenon/package_upload/upload/api_endpoint.h>

#include <kcenon/package_upload/core/encoding.h>

#include <algorithm>
#include <cctype>

namespace kcenon::package_upload {

namespace {

auto to_lower(std::string_view s) -> std::string {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

auto is_http_url(std::string_view s) -> bool {
    auto lower = to_lower(s.substr(0, 8));
    return lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0;
}

}  // namespace

api_endpoint::api_endpoint(std::string base_url, std::string origin)
    : base_url_(std::move(base_url)), origin_(std::move(origin)) {}

auto api_endpoint::base_url_for(region r) -> std::string {
    switch (r) {
        case region::north_america:
            return "https://app.action1.com/api/3.0";
        case region::australia:
            return "https://app.au.action1.com/api/3.0";
        case region::europe:
        default:
            return "https://app.eu.action1.com/api/3.0";
    }
}

auto api_endpoint::parse_region(std::string_view name) -> result<region> {
    auto key = to_lower(trim(name));
    if (key == "europe" || key == "eu") {
        return region::europe;
    }
    if (key == "northamerica" || key == "north_america" || key == "na" || key == "us" ||
        key == "global") {
        return region::north_america;
    }
    if (key == "australia" || key == "au") {
        return region::australia;
    }
    return unexpected(error{error_code::invalid_configuration,
                            "unknown region: " + std::string(name)});
}

auto api_endpoint::for_region(region r) -> api_endpoint {
    // Regional bases are known-good absolute URLs
    auto parsed = from_base_url(base_url_for(r));
    return parsed.value();
}

auto api_endpoint::from_region_name(std::string_view name) -> result<api_endpoint> {
    auto r = parse_region(name);
    if (!r) {
        return unexpected(r.error());
    }
    return for_region(r.value());
}

auto api_endpoint::from_base_url(std::string_view url) -> result<api_endpoint> {
    auto base = std::string(trim(url));
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    if (!is_http_url(base)) {
        return unexpected(error{error_code::invalid_configuration,
                                "API base URL must start with http:// or https://"});
    }

    auto host_start = base.find("://") + 3;
    auto path_start = base.find('/', host_start);
    auto origin = path_start == std::string::npos ? base : base.substr(0, path_start);

    if (origin.size() <= host_start) {
        return unexpected(error{error_code::invalid_configuration,
                                "API base URL has no host: " + base});
    }

    return api_endpoint{std::move(base), std::move(origin)};
}

auto api_endpoint::resolve(std::string_view base_url, std::string_view region_name)
    -> result<api_endpoint> {
    if (!trim(base_url).empty()) {
        return from_base_url(base_url);
    }
    if (!trim(region_name).empty()) {
        return from_region_name(region_name);
    }
    return for_region(default_region);
}

auto api_endpoint::version_url(const upload_target& target) const -> std::string {
    return base_url_ + "/software-repository/" + encoding::url_encode(target.organization_id) +
           "/" + encoding::url_encode(target.package_id) + "/versions/" +
           encoding::url_encode(target.version_id);
}

auto api_endpoint::upload_init_url(const upload_target& target) const -> std::string {
    return version_url(target) + "/upload?platform=" + encoding::url_encode(target.platform);
}

auto api_endpoint::chunk_url(const upload_target& target) const -> std::string {
    return version_url(target) + "/upload/chunk";
}

auto api_endpoint::finalize_url(const upload_target& target) const -> std::string {
    return version_url(target) + "/upload/finalize";
}

auto api_endpoint::normalize_location(std::string_view location) const
    -> result<std::string> {
    auto loc = std::string(trim(location));
    if (loc.empty()) {
        return unexpected(error{error_code::missing_upload_location,
                                "upload location header is empty"});
    }

    if (is_http_url(loc)) {
        return loc;
    }

    constexpr std::string_view legacy_prefix = "/API";
    if (loc.rfind(legacy_prefix, 0) == 0 &&
        (loc.size() == legacy_prefix.size() || loc[legacy_prefix.size()] == '/')) {
        loc = std::string(api_path_prefix) + loc.substr(legacy_prefix.size());
    }

    if (loc.front() == '/') {
        return origin_ + loc;
    }
    return origin_ + "/" + loc;
}

}  // namespace kcenon::package_upload
