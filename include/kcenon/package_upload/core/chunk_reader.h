/**
 * @file chunk_reader.h
 * @brief Lazy reads of planned chunk payloads from the source file
 */

#ifndef KCENON_PACKAGE_UPLOAD_CORE_CHUNK_READER_H
#define KCENON_PACKAGE_UPLOAD_CORE_CHUNK_READER_H

#include <kcenon/package_upload/core/chunk_planner.h>
#include <kcenon/package_upload/core/types.h>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace kcenon::package_upload {

/**
 * @brief Reads the payload of one chunk at a time
 *
 * Every read opens its own read-only stream, so concurrent workers never
 * share a file position. Only the chunks currently in flight are held in
 * memory.
 */
class chunk_reader {
public:
    explicit chunk_reader(std::filesystem::path file_path);

    /**
     * @brief Check that the source file is a readable regular file
     * @return Its size in bytes, or file_not_found / file_access_denied
     */
    [[nodiscard]] auto file_size() const -> result<uint64_t>;

    /**
     * @brief Read the bytes of one planned chunk
     * @return Exactly c.size bytes, or file_read_error on short read
     */
    [[nodiscard]] auto read(const chunk& c) const -> result<std::vector<uint8_t>>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return file_path_; }

private:
    std::filesystem::path file_path_;
};

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_CORE_CHUNK_READER_H
