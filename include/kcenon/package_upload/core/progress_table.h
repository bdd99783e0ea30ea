/**
 * @file progress_table.h
 * @brief Per-chunk status map shared by upload workers
 *
 * The table is the only mutable state shared between the coordinator's
 * workers. Every field is atomic, so writers never lock and readers take
 * consistent-enough snapshots without stalling a transfer.
 */

#ifndef KCENON_PACKAGE_UPLOAD_CORE_PROGRESS_TABLE_H
#define KCENON_PACKAGE_UPLOAD_CORE_PROGRESS_TABLE_H

#include <kcenon/package_upload/core/chunk_planner.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace kcenon::package_upload {

using duration = std::chrono::milliseconds;

/**
 * @brief Lifecycle of one chunk
 *
 * pending -> in_flight -> committed, or pending/in_flight -> failed.
 * committed and failed are terminal.
 */
enum class chunk_status : uint8_t {
    pending = 0,
    in_flight = 1,
    committed = 2,
    failed = 3,
};

[[nodiscard]] constexpr auto to_string(chunk_status status) -> const char* {
    switch (status) {
        case chunk_status::pending: return "pending";
        case chunk_status::in_flight: return "in_flight";
        case chunk_status::committed: return "committed";
        case chunk_status::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Read-only view of one chunk's progress
 */
struct chunk_progress {
    uint32_t number = 0;
    chunk_status status = chunk_status::pending;
    uint64_t size = 0;
    uint64_t bytes_transferred = 0;  ///< size once committed, otherwise 0
    duration elapsed{0};             ///< Since the chunk went in flight
    double rate_mbps = 0.0;          ///< Megabits per second, committed chunks only
};

class progress_table {
public:
    explicit progress_table(const chunk_plan& plan);

    progress_table(const progress_table&) = delete;
    auto operator=(const progress_table&) -> progress_table& = delete;

    /**
     * @brief pending -> in_flight
     * @return false if the chunk is unknown or not pending
     */
    auto mark_in_flight(uint32_t number) -> bool;

    /**
     * @brief in_flight -> committed
     * @return false if the chunk is unknown or not in flight
     */
    auto mark_committed(uint32_t number) -> bool;

    /**
     * @brief pending or in_flight -> failed
     * @return false if the chunk is unknown or already terminal
     */
    auto mark_failed(uint32_t number) -> bool;

    [[nodiscard]] auto status(uint32_t number) const -> chunk_status;

    [[nodiscard]] auto total_chunks() const -> uint32_t { return count_; }
    [[nodiscard]] auto total_bytes() const -> uint64_t { return total_bytes_; }
    [[nodiscard]] auto committed_bytes() const -> uint64_t { return committed_bytes_.load(); }
    [[nodiscard]] auto committed_count() const -> uint32_t { return committed_count_.load(); }
    [[nodiscard]] auto failed_count() const -> uint32_t { return failed_count_.load(); }
    [[nodiscard]] auto in_flight_count() const -> uint32_t { return in_flight_.load(); }

    /**
     * @brief Highest number of chunks simultaneously in flight so far
     */
    [[nodiscard]] auto peak_in_flight() const -> uint32_t { return peak_in_flight_.load(); }

    [[nodiscard]] auto all_committed() const -> bool {
        return committed_count_.load() == count_;
    }

    /**
     * @brief Time since the table was created
     */
    [[nodiscard]] auto elapsed() const -> duration;

    /**
     * @brief Copy out every chunk's current state
     */
    [[nodiscard]] auto entries() const -> std::vector<chunk_progress>;

private:
    struct entry {
        uint64_t size = 0;
        std::atomic<uint8_t> status{static_cast<uint8_t>(chunk_status::pending)};
        std::atomic<int64_t> started_ns{0};
        std::atomic<int64_t> finished_ns{0};
    };

    [[nodiscard]] auto find(uint32_t number) const -> entry*;
    [[nodiscard]] auto now_ns() const -> int64_t;
    auto transition(entry& e, chunk_status from, chunk_status to) -> bool;

    uint32_t count_;
    uint64_t total_bytes_;
    std::unique_ptr<entry[]> entries_;
    std::chrono::steady_clock::time_point created_;

    std::atomic<uint64_t> committed_bytes_{0};
    std::atomic<uint32_t> committed_count_{0};
    std::atomic<uint32_t> failed_count_{0};
    std::atomic<uint32_t> in_flight_{0};
    std::atomic<uint32_t> peak_in_flight_{0};
};

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_CORE_PROGRESS_TABLE_H
