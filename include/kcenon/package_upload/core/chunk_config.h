/**
 * @file chunk_config.h
 * @brief Chunk sizing for resumable uploads
 */

#ifndef KCENON_PACKAGE_UPLOAD_CORE_CHUNK_CONFIG_H
#define KCENON_PACKAGE_UPLOAD_CORE_CHUNK_CONFIG_H

#include <kcenon/package_upload/core/types.h>

#include <cstdint>
#include <string>

namespace kcenon::package_upload {

/**
 * @brief Chunk sizing for one upload
 *
 * The remote service rejects resumable chunks smaller than 5 MiB (except
 * the final one), so the floor is enforced before any session is opened.
 */
struct chunk_config {
    static constexpr uint64_t mebibyte = 1024ULL * 1024ULL;

    /// Default chunk size (24 MiB)
    static constexpr uint64_t default_chunk_size = 24 * mebibyte;

    /// Minimum allowed chunk size (5 MiB)
    static constexpr uint64_t min_chunk_size = 5 * mebibyte;

    uint64_t chunk_size = default_chunk_size;

    chunk_config() = default;

    explicit chunk_config(uint64_t size) : chunk_size(size) {}

    /// Largest whole-mebibyte count whose byte size fits in uint64_t
    static constexpr uint64_t max_megabytes = UINT64_MAX / mebibyte;

    /**
     * @brief Build a configuration from a size in whole mebibytes
     * @return invalid_chunk_size when the byte size would overflow
     */
    [[nodiscard]] static auto from_megabytes(uint64_t mb) -> result<chunk_config> {
        if (mb > max_megabytes) {
            return unexpected(error{error_code::invalid_chunk_size,
                                    "chunk size of " + std::to_string(mb) +
                                        " MiB is out of range"});
        }
        return chunk_config{mb * mebibyte};
    }

    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size < min_chunk_size) {
            return unexpected(error{
                error_code::invalid_chunk_size,
                "chunk size too small (minimum: " + std::to_string(min_chunk_size) + " bytes)"});
        }
        return {};
    }

    /**
     * @brief Calculate number of chunks for a given file size
     */
    [[nodiscard]] auto calculate_chunk_count(uint64_t file_size) const -> uint64_t {
        if (file_size == 0 || chunk_size == 0) return 0;
        return (file_size + chunk_size - 1) / chunk_size;
    }
};

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_CORE_CHUNK_CONFIG_H
