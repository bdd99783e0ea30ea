/**
 * @file chunk_planner.cpp
 * @brief Implementation of chunk planning
 */

#include <kcenon/package_upload/core/chunk_planner.h>

#include <limits>

namespace kcenon::package_upload {

auto chunk_planner::plan(uint64_t total_size, const chunk_config& config)
    -> result<chunk_plan> {
    if (total_size == 0) {
        return unexpected(error{error_code::empty_file, "cannot plan chunks for an empty file"});
    }

    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }

    auto count = config.calculate_chunk_count(total_size);
    if (count > std::numeric_limits<uint32_t>::max()) {
        return unexpected(error{error_code::invalid_chunk_size,
                                "chunk count exceeds the chunk number range"});
    }

    chunk_plan out;
    out.total_size = total_size;
    out.chunk_size = config.chunk_size;
    out.chunks.reserve(static_cast<std::size_t>(count));

    for (uint64_t i = 0; i < count; ++i) {
        chunk c;
        c.number = static_cast<uint32_t>(i + 1);
        c.start = i * config.chunk_size;
        c.size = (i == count - 1) ? total_size - c.start : config.chunk_size;
        c.end = c.start + c.size - 1;
        out.chunks.push_back(c);
    }

    return out;
}

}  // namespace kcenon::package_upload
