/**
 * @file chunk_reader.cpp
 * @brief Implementation of lazy chunk reads
 */

#include <kcenon/package_upload/core/chunk_reader.h>

#include <fstream>
#include <system_error>

namespace kcenon::package_upload {

chunk_reader::chunk_reader(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

auto chunk_reader::file_size() const -> result<uint64_t> {
    std::error_code ec;
    if (!std::filesystem::exists(file_path_, ec)) {
        return unexpected(error{error_code::file_not_found,
                                "file not found: " + file_path_.string()});
    }

    if (!std::filesystem::is_regular_file(file_path_, ec)) {
        return unexpected(error{error_code::file_access_denied,
                                "not a regular file: " + file_path_.string()});
    }

    auto size = std::filesystem::file_size(file_path_, ec);
    if (ec) {
        return unexpected(error{error_code::file_access_denied,
                                "cannot stat file: " + ec.message()});
    }

    std::ifstream file(file_path_, std::ios::binary);
    if (!file.is_open()) {
        return unexpected(error{error_code::file_access_denied,
                                "cannot open file: " + file_path_.string()});
    }

    return static_cast<uint64_t>(size);
}

auto chunk_reader::read(const chunk& c) const -> result<std::vector<uint8_t>> {
    std::ifstream file(file_path_, std::ios::binary);
    if (!file.is_open()) {
        return unexpected(error{error_code::file_access_denied,
                                "cannot open file: " + file_path_.string()});
    }

    file.seekg(static_cast<std::streamoff>(c.start), std::ios::beg);
    if (!file.good()) {
        return unexpected(error{error_code::file_read_error,
                                "seek failed for chunk " + std::to_string(c.number)});
    }

    std::vector<uint8_t> buffer(static_cast<std::size_t>(c.size));
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(c.size));
    auto bytes_read = static_cast<uint64_t>(file.gcount());

    if (bytes_read != c.size) {
        return unexpected(error{
            error_code::file_read_error,
            "short read for chunk " + std::to_string(c.number) + ": expected " +
                std::to_string(c.size) + " bytes, got " + std::to_string(bytes_read)});
    }

    return buffer;
}

}  // namespace kcenon::package_upload
