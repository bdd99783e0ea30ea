/**
 * @file encoding.h
 * @brief Text-safe encodings used on the upload wire
 *
 * Chunk payloads of the chunk-id protocol travel inside JSON request bodies,
 * so they are base64 encoded. Upload paths and query values are percent
 * encoded, and upload ids are random hex strings.
 */

#ifndef KCENON_PACKAGE_UPLOAD_CORE_ENCODING_H
#define KCENON_PACKAGE_UPLOAD_CORE_ENCODING_H

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::package_upload::encoding {

/**
 * @brief Convert bytes to a lowercase hexadecimal string
 */
auto bytes_to_hex(std::span<const uint8_t> bytes) -> std::string;

/**
 * @brief Base64 encode bytes (RFC 4648, padded)
 */
auto base64_encode(std::span<const uint8_t> data) -> std::string;

/**
 * @brief Base64 decode a padded string
 * @return Decoded bytes, or nullopt if the input contains characters outside
 *         the base64 alphabet or has an invalid length
 */
auto base64_decode(std::string_view encoded) -> std::optional<std::vector<uint8_t>>;

/**
 * @brief URL encode a string (RFC 3986 unreserved characters kept)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes (default: true)
 */
auto url_encode(std::string_view value, bool encode_slash = true) -> std::string;

/**
 * @brief Escape a string for inclusion in a JSON string literal
 */
auto json_escape(std::string_view input) -> std::string;

/**
 * @brief Generate a random hex string
 * @param byte_count Number of random bytes (result will be 2x this length)
 */
auto generate_random_hex(std::size_t byte_count) -> std::string;

/**
 * @brief Extract a top-level value from a flat JSON object
 *
 * String values are returned unescaped; other values are returned as their
 * literal text. Only flat objects produced by the upload wire format are
 * supported.
 */
auto extract_json_value(std::string_view json, std::string_view key)
    -> std::optional<std::string>;

}  // namespace kcenon::package_upload::encoding

#endif  // KCENON_PACKAGE_UPLOAD_CORE_ENCODING_H
