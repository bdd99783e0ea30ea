/**
 * @file chunk_planner.h
 * @brief Splits a byte count into the ordered chunk plan of an upload
 */

#ifndef KCENON_PACKAGE_UPLOAD_CORE_CHUNK_PLANNER_H
#define KCENON_PACKAGE_UPLOAD_CORE_CHUNK_PLANNER_H

#include <kcenon/package_upload/core/chunk_config.h>
#include <kcenon/package_upload/core/types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::package_upload {

/**
 * @brief One planned byte range of the source file
 *
 * Chunk numbers are 1-based and contiguous. end is inclusive, matching the
 * Content-Range header that carries it.
 */
struct chunk {
    uint32_t number = 0;
    uint64_t start = 0;
    uint64_t end = 0;
    uint64_t size = 0;

    /**
     * @brief Format as a Content-Range value ("bytes start-end/total")
     */
    [[nodiscard]] auto content_range(uint64_t total_size) const -> std::string {
        return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" +
               std::to_string(total_size);
    }

    auto operator==(const chunk&) const -> bool = default;
};

/**
 * @brief Ordered chunk plan for a file
 */
struct chunk_plan {
    uint64_t total_size = 0;
    uint64_t chunk_size = 0;
    std::vector<chunk> chunks;

    [[nodiscard]] auto total_chunks() const -> uint32_t {
        return static_cast<uint32_t>(chunks.size());
    }

    [[nodiscard]] auto empty() const -> bool { return chunks.empty(); }
};

/**
 * @brief Pure planner from (total size, chunk size) to byte ranges
 *
 * The same inputs always produce the same plan.
 */
class chunk_planner {
public:
    /**
     * @brief Plan chunks for a file
     * @param total_size File size in bytes, must be non-zero
     * @param config Chunk sizing, must pass chunk_config::validate()
     * @return The plan, or empty_file / invalid_chunk_size
     */
    [[nodiscard]] static auto plan(uint64_t total_size, const chunk_config& config)
        -> result<chunk_plan>;
};

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_CORE_CHUNK_PLANNER_H
