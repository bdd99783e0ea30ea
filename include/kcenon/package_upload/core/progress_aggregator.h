/**
 * @file progress_aggregator.h
 * @brief Thread-safe read model over the progress table
 */

#ifndef KCENON_PACKAGE_UPLOAD_CORE_PROGRESS_AGGREGATOR_H
#define KCENON_PACKAGE_UPLOAD_CORE_PROGRESS_AGGREGATOR_H

#include <kcenon/package_upload/core/progress_table.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace kcenon::package_upload {

/**
 * @brief Point-in-time projection of an upload's progress
 */
struct progress_snapshot {
    uint64_t total_bytes = 0;
    uint64_t committed_bytes = 0;
    uint32_t total_chunks = 0;
    uint32_t committed_chunks = 0;
    uint32_t in_flight_chunks = 0;
    uint32_t failed_chunks = 0;
    double percent = 0.0;       ///< committed_bytes / total_bytes * 100
    double rate_mbps = 0.0;     ///< Committed megabits per elapsed second
    duration elapsed{0};
    std::vector<chunk_progress> chunks;

    [[nodiscard]] auto is_complete() const -> bool {
        return total_chunks > 0 && committed_chunks == total_chunks;
    }
};

/**
 * @brief Renders progress for an external presentation layer
 *
 * The engine attaches the table of the upload attempt in progress. A
 * renderer may call snapshot() from any thread at any interval; the call
 * only reads atomics and never blocks a transmitting worker. Percent is
 * derived from committed bytes, which only grow during one attempt.
 *
 * @code
 * auto progress = std::make_shared<progress_aggregator>();
 * std::thread renderer([&] {
 *     while (!done) {
 *         auto snap = progress->snapshot();
 *         draw(snap.percent, snap.rate_mbps);
 *         std::this_thread::sleep_for(200ms);
 *     }
 * });
 * engine.upload(path, target, config, progress);
 * @endcode
 */
class progress_aggregator {
public:
    progress_aggregator() = default;

    /**
     * @brief Start reporting on a new attempt's table
     */
    void attach(std::shared_ptr<const progress_table> table);

    /**
     * @brief Stop reporting; later snapshots are empty
     */
    void detach();

    [[nodiscard]] auto is_attached() const -> bool;

    /**
     * @brief Summary without the per-chunk list
     */
    [[nodiscard]] auto summary() const -> progress_snapshot;

    /**
     * @brief Summary plus every chunk's state
     */
    [[nodiscard]] auto snapshot() const -> progress_snapshot;

private:
    [[nodiscard]] auto current() const -> std::shared_ptr<const progress_table>;
    [[nodiscard]] static auto summarize(const progress_table& table) -> progress_snapshot;

    mutable std::mutex mutex_;
    std::shared_ptr<const progress_table> table_;
};

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_CORE_PROGRESS_AGGREGATOR_H
