/**
 * @file encoding.cpp
 * @brief Text-safe encodings used on the upload wire
 */

#include "kcenon/package_upload/core/encoding.h"

#include <cctype>
#include <cstdio>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::package_upload::encoding {

namespace {

constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

auto base64_value(char c) -> int {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Appends the UTF-8 form of a \uXXXX escape (BMP only)
void append_utf8(std::string& out, unsigned int cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto json_unescape(std::string_view input) -> std::string {
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c != '\\' || i + 1 >= input.size()) {
            out += c;
            continue;
        }
        char next = input[++i];
        switch (next) {
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'u': {
                unsigned int cp = 0;
                bool valid = i + 4 < input.size();
                for (std::size_t k = 1; valid && k <= 4; ++k) {
                    int v = hex_value(input[i + k]);
                    if (v < 0) {
                        valid = false;
                    } else {
                        cp = (cp << 4) | static_cast<unsigned int>(v);
                    }
                }
                if (valid) {
                    append_utf8(out, cp);
                    i += 4;
                } else {
                    out += "\\u";
                }
                break;
            }
            default: out += next; break;
        }
    }
    return out;
}

}  // namespace

auto bytes_to_hex(std::span<const uint8_t> bytes) -> std::string {
    std::ostringstream oss;
    for (auto byte : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(byte);
    }
    return oss.str();
}

auto base64_encode(std::span<const uint8_t> data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

auto base64_decode(std::string_view encoded) -> std::optional<std::vector<uint8_t>> {
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> result;
    result.reserve((encoded.size() / 4) * 3);

    uint32_t bits = 0;
    int bit_count = 0;
    std::size_t padding = 0;

    for (std::size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        if (c == '=') {
            // Padding is only legal in the last two positions
            if (i + 2 < encoded.size()) return std::nullopt;
            ++padding;
            continue;
        }
        if (padding > 0) return std::nullopt;

        int val = base64_value(c);
        if (val < 0) return std::nullopt;

        bits = (bits << 6) | static_cast<uint32_t>(val);
        bit_count += 6;

        if (bit_count >= 8) {
            bit_count -= 8;
            result.push_back(static_cast<uint8_t>((bits >> bit_count) & 0xFF));
        }
    }

    return result;
}

auto url_encode(std::string_view value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto json_escape(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

auto generate_random_hex(std::size_t byte_count) -> std::string {
    std::vector<uint8_t> bytes(byte_count);
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    for (auto& b : bytes) {
        b = static_cast<uint8_t>(dis(gen));
    }

    return bytes_to_hex(bytes);
}

auto extract_json_value(std::string_view json, std::string_view key)
    -> std::optional<std::string> {
    std::string search = "\"" + std::string(key) + "\"";
    auto pos = json.find(search);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }

    pos = json.find_first_not_of(" \t\n\r", pos + search.length());
    if (pos == std::string_view::npos || json[pos] != ':') {
        return std::nullopt;
    }

    pos = json.find_first_not_of(" \t\n\r", pos + 1);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }

    if (json[pos] == '"') {
        auto end_pos = pos + 1;
        while (end_pos < json.size()) {
            if (json[end_pos] == '\\') {
                end_pos += 2;
                continue;
            }
            if (json[end_pos] == '"') {
                break;
            }
            ++end_pos;
        }
        if (end_pos >= json.size()) {
            return std::nullopt;
        }
        return json_unescape(json.substr(pos + 1, end_pos - pos - 1));
    }

    auto end_pos = json.find_first_of(",}\n", pos);
    if (end_pos == std::string_view::npos) {
        end_pos = json.size();
    }
    auto literal = json.substr(pos, end_pos - pos);
    while (!literal.empty() && std::isspace(static_cast<unsigned char>(literal.back()))) {
        literal.remove_suffix(1);
    }
    return std::string(literal);
}

}  // namespace kcenon::package_upload::encoding
