/**
 * @file concurrency_coordinator.cpp
 * @brief Sequential and bounded-parallel chunk scheduling
 */

#include <kcenon/package_upload/upload/concurrency_coordinator.h>

#include <kcenon/package_upload/core/logging.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>

namespace kcenon::package_upload {

namespace {

auto to_failure(const chunk& c, const chunk_outcome& outcome) -> chunk_failure {
    chunk_failure f;
    f.chunk_number = c.number;
    f.status_code = outcome.status_code;
    f.code = outcome.code;
    f.message = outcome.message;
    f.body = outcome.body;
    return f;
}

auto chunk_context(const chunk& c, const upload_session& session) -> upload_log_context {
    upload_log_context ctx;
    ctx.upload_id = session.protocol == protocol_variant::chunk_id_finalize ? session.endpoint
                                                                            : std::string{};
    ctx.file_name = session.file_name;
    ctx.chunk_number = c.number;
    ctx.total_chunks = session.total_chunks;
    return ctx;
}

}  // namespace

auto make_transmit_error(std::vector<chunk_failure> failures) -> upload_error {
    std::sort(failures.begin(), failures.end(),
              [](const chunk_failure& a, const chunk_failure& b) {
                  return a.chunk_number < b.chunk_number;
              });

    upload_error err;
    err.phase = upload_phase::transmit;

    if (failures.empty()) {
        err.kind = failure_kind::internal_failure;
        err.code = error_code::internal_error;
        err.message = "transmission failed without a recorded chunk failure";
        return err;
    }

    const chunk_failure* primary = &failures.front();
    auto any_of_code = [&](error_code code) -> const chunk_failure* {
        for (const auto& f : failures) {
            if (f.code == code) return &f;
        }
        return nullptr;
    };

    if (auto* auth = any_of_code(error_code::auth_failed)) {
        primary = auth;
    } else if (auto* rejected = any_of_code(error_code::chunk_rejected)) {
        primary = rejected;
    }

    err.kind = classify(primary->code);
    err.code = primary->code;
    err.status_code = primary->status_code;
    err.message = std::to_string(failures.size()) + " chunk(s) failed; first: chunk " +
                  std::to_string(primary->chunk_number) + ": " + primary->message;
    err.chunk_failures = std::move(failures);
    return err;
}

concurrency_coordinator::concurrency_coordinator(
    std::shared_ptr<chunk_transmitter> transmitter,
    std::shared_ptr<adapters::worker_pool_interface> pool)
    : transmitter_(std::move(transmitter)), pool_(std::move(pool)) {}

auto concurrency_coordinator::run(const coordinator_job& job,
                                  execution_policy policy,
                                  std::size_t throttle_limit)
    -> result<coordinator_report, upload_error> {
    if (job.plan.empty()) {
        return upload_unexpected{upload_error::from(
            upload_phase::transmit, error{error_code::internal_error, "empty chunk plan"})};
    }

    if (policy == execution_policy::automatic) {
        policy = job.session.protocol == protocol_variant::byte_range_resumable
                     ? execution_policy::sequential
                     : execution_policy::bounded_parallel;
    }

    if (policy == execution_policy::bounded_parallel) {
        if (job.session.protocol == protocol_variant::byte_range_resumable) {
            return upload_unexpected{upload_error::from(
                upload_phase::transmit,
                error{error_code::invalid_configuration,
                      "byte-range uploads cannot be transmitted in parallel"})};
        }
        if (throttle_limit == 0) {
            return upload_unexpected{upload_error::from(
                upload_phase::transmit,
                error{error_code::invalid_configuration, "throttle limit must be at least 1"})};
        }
        return run_parallel(job, throttle_limit);
    }
    return run_sequential(job);
}

auto concurrency_coordinator::process(const chunk& c, const coordinator_job& job)
    -> chunk_outcome {
    try {
        return send(c, job);
    } catch (const std::exception& e) {
        // Whatever state the chunk reached, it ends failed
        job.table.mark_failed(c.number);
        auto ctx = chunk_context(c, job.session);
        ctx.error_message = e.what();
        PU_LOG_ERROR_CTX(log_category::chunk, "Chunk upload threw", ctx);
        return chunk_outcome::failed(error_code::internal_error,
                                     std::string("chunk upload threw: ") + e.what());
    }
}

auto concurrency_coordinator::send(const chunk& c, const coordinator_job& job)
    -> chunk_outcome {
    auto ctx = chunk_context(c, job.session);

    if (!job.table.mark_in_flight(c.number)) {
        return chunk_outcome::failed(error_code::internal_error,
                                     "chunk " + std::to_string(c.number) + " was not pending");
    }
    PU_LOG_DEBUG_CTX(log_category::chunk, "Chunk in flight", ctx);

    auto payload = job.reader.read(c);
    if (!payload) {
        job.table.mark_failed(c.number);
        ctx.error_message = payload.error().message;
        PU_LOG_ERROR_CTX(log_category::chunk, "Chunk read failed", ctx);
        return chunk_outcome::failed(payload.error().code, payload.error().message);
    }

    auto outcome = transmitter_->transmit(c, payload.value(), job.session);
    ctx.status_code = outcome.status_code;

    if (outcome.is_fatal()) {
        job.table.mark_failed(c.number);
        ctx.error_message = outcome.message;
        PU_LOG_ERROR_CTX(log_category::chunk, "Chunk failed", ctx);
        return outcome;
    }

    job.table.mark_committed(c.number);
    PU_LOG_DEBUG_CTX(log_category::chunk, "Chunk committed", ctx);
    return outcome;
}

auto concurrency_coordinator::run_sequential(const coordinator_job& job)
    -> result<coordinator_report, upload_error> {
    coordinator_report report;
    report.policy = execution_policy::sequential;

    const auto last = job.plan.total_chunks();
    const bool byte_range = job.session.protocol == protocol_variant::byte_range_resumable;

    for (const auto& c : job.plan.chunks) {
        auto outcome = process(c, job);
        ++report.chunks_sent;

        if (outcome.is_fatal()) {
            return upload_unexpected{make_transmit_error({to_failure(c, outcome)})};
        }

        if (outcome.kind == chunk_outcome::kind_type::complete) {
            report.completed_at = c.number;
            if (c.number != last) {
                report.completed_early = true;
                auto ctx = chunk_context(c, job.session);
                ctx.status_code = outcome.status_code;
                PU_LOG_WARN_CTX(log_category::coordinator,
                                "Server reported completion before the last planned chunk",
                                ctx);
            }
            return report;
        }

        if (byte_range && c.number == last) {
            auto ctx = chunk_context(c, job.session);
            ctx.status_code = outcome.status_code;
            PU_LOG_WARN_CTX(log_category::coordinator,
                            "Final chunk answered 308; treating upload as complete", ctx);
        }
    }

    report.completed_at = last;
    return report;
}

auto concurrency_coordinator::run_parallel(const coordinator_job& job,
                                           std::size_t throttle_limit)
    -> result<coordinator_report, upload_error> {
    const auto total = job.plan.chunks.size();
    const auto workers = std::min(throttle_limit, total);

    auto pool = pool_ ? pool_ : adapters::worker_pool_factory::create(workers);

    std::atomic<std::size_t> next{0};
    std::atomic<bool> stop{false};
    std::atomic<uint32_t> sent{0};
    std::mutex failures_mutex;
    std::vector<chunk_failure> failures;

    auto record = [&](chunk_failure f) {
        std::lock_guard<std::mutex> lock(failures_mutex);
        failures.push_back(std::move(f));
        stop.store(true);
    };

    auto worker = [&]() {
        while (!stop.load()) {
            auto index = next.fetch_add(1);
            if (index >= total) {
                return;
            }
            const auto& c = job.plan.chunks[index];
            auto outcome = process(c, job);
            sent.fetch_add(1);
            if (outcome.is_fatal()) {
                record(to_failure(c, outcome));
            }
        }
    };

    upload_log_context ctx;
    ctx.upload_id = job.session.endpoint;
    ctx.file_name = job.session.file_name;
    ctx.total_chunks = job.plan.total_chunks();
    PU_LOG_DEBUG_CTX(log_category::coordinator,
                     "Starting " + std::to_string(workers) + " upload workers", ctx);

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        try {
            futures.push_back(pool->submit_to_stage(worker, stage_name));
        } catch (const std::exception& e) {
            record(chunk_failure{0, 0, error_code::internal_error,
                                 std::string("failed to start upload worker: ") + e.what(),
                                 {}});
            break;
        }
    }

    for (auto& f : futures) {
        try {
            f.get();
        } catch (const std::exception& e) {
            record(chunk_failure{0, 0, error_code::internal_error,
                                 std::string("upload worker failed: ") + e.what(), {}});
        }
    }

    if (!failures.empty()) {
        auto err = make_transmit_error(std::move(failures));
        PU_LOG_ERROR_CTX(log_category::coordinator, err.describe(), ctx);
        return upload_unexpected{std::move(err)};
    }

    coordinator_report report;
    report.policy = execution_policy::bounded_parallel;
    report.chunks_sent = sent.load();
    report.completed_at = job.plan.total_chunks();
    return report;
}

}  // namespace kcenon::package_upload
