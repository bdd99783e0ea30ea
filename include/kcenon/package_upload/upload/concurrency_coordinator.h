/**
 * @file concurrency_coordinator.h
 * @brief Drives chunk transmissions sequentially or through a bounded pool
 */

#ifndef KCENON_PACKAGE_UPLOAD_UPLOAD_CONCURRENCY_COORDINATOR_H
#define KCENON_PACKAGE_UPLOAD_UPLOAD_CONCURRENCY_COORDINATOR_H

#include <kcenon/package_upload/adapters/thread_pool_adapter.h>
#include <kcenon/package_upload/core/chunk_planner.h>
#include <kcenon/package_upload/core/chunk_reader.h>
#include <kcenon/package_upload/core/progress_table.h>
#include <kcenon/package_upload/upload/chunk_transmitter.h>
#include <kcenon/package_upload/upload/upload_types.h>

#include <cstddef>
#include <memory>
#include <vector>

namespace kcenon::package_upload {

/**
 * @brief Terminal state of a successful coordinator run
 */
struct coordinator_report {
    execution_policy policy = execution_policy::sequential;
    uint32_t chunks_sent = 0;

    /// The server returned completion before the last planned chunk
    bool completed_early = false;
    uint32_t completed_at = 0;
};

/**
 * @brief Everything one coordinator run works on
 */
struct coordinator_job {
    const chunk_plan& plan;
    const upload_session& session;
    const chunk_reader& reader;
    progress_table& table;
};

/**
 * @brief Schedules chunk transmissions and records their status
 *
 * Sequential: one chunk at a time, in order, stopping at the first fatal
 * outcome or the first completion response.
 *
 * Bounded-parallel: exactly min(throttle, chunks) pull-workers are handed
 * to the worker pool. Each worker claims the next unsent chunk, reads it,
 * sends it and records the result. After the first failure no new chunk is
 * claimed; workers already sending finish, and every failure is reported.
 */
class concurrency_coordinator {
public:
    /**
     * @param transmitter Sends individual chunks
     * @param pool Worker pool for bounded_parallel; may be null when only the
     *             sequential policy is used
     */
    concurrency_coordinator(std::shared_ptr<chunk_transmitter> transmitter,
                            std::shared_ptr<adapters::worker_pool_interface> pool);

    /**
     * @brief Run every chunk of the plan to a terminal state
     * @param policy sequential or bounded_parallel (automatic is resolved
     *               from the session protocol)
     * @param throttle_limit Upper bound on chunks in flight
     */
    [[nodiscard]] auto run(const coordinator_job& job,
                           execution_policy policy,
                           std::size_t throttle_limit)
        -> result<coordinator_report, upload_error>;

    static constexpr const char* stage_name = "chunk_upload";

private:
    [[nodiscard]] auto run_sequential(const coordinator_job& job)
        -> result<coordinator_report, upload_error>;

    [[nodiscard]] auto run_parallel(const coordinator_job& job, std::size_t throttle_limit)
        -> result<coordinator_report, upload_error>;

    /**
     * @brief Read, send and record one chunk
     *
     * An exception from the transmitter or the reader becomes a fatal
     * internal_error outcome for this chunk, and the chunk is marked failed.
     */
    [[nodiscard]] auto process(const chunk& c, const coordinator_job& job) -> chunk_outcome;

    [[nodiscard]] auto send(const chunk& c, const coordinator_job& job) -> chunk_outcome;

    std::shared_ptr<chunk_transmitter> transmitter_;
    std::shared_ptr<adapters::worker_pool_interface> pool_;
};

/**
 * @brief Aggregate error for a transmit phase that saw chunk failures
 *
 * Kind is auth_error if any chunk was rejected for credentials, otherwise
 * chunk_failure if the server rejected any chunk, otherwise the kind of the
 * first failure (network_error when chunks were never delivered).
 */
[[nodiscard]] auto make_transmit_error(std::vector<chunk_failure> failures) -> upload_error;

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_UPLOAD_CONCURRENCY_COORDINATOR_H
