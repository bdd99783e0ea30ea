/**
 * @file upload_retry.cpp
 * @brief Whole-upload retry runner
 */

#include <kcenon/package_upload/upload/upload_retry.h>

#include <kcenon/package_upload/core/logging.h>

#include <algorithm>
#include <random>
#include <thread>

namespace kcenon::package_upload {

auto calculate_retry_delay(const upload_retry_policy& policy, std::size_t attempt)
    -> std::chrono::milliseconds {
    auto delay = static_cast<double>(policy.initial_delay.count());

    for (std::size_t i = 1; i < attempt; ++i) {
        delay *= policy.backoff_multiplier;
    }

    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

    if (policy.use_jitter) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay *= dis(gen);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

auto is_retryable(const upload_retry_policy& policy, const upload_error& err) -> bool {
    switch (err.kind) {
        case failure_kind::network_error:
            // A finalize that never arrived may still have been applied
            return policy.retry_on_network_error && err.phase != upload_phase::finalize;
        case failure_kind::chunk_failure:
            if (!policy.retry_on_server_error || err.chunk_failures.empty()) {
                return false;
            }
            return std::all_of(err.chunk_failures.begin(), err.chunk_failures.end(),
                               [](const chunk_failure& f) { return f.status_code >= 500; });
        default:
            return false;
    }
}

upload_retry_runner::upload_retry_runner(upload_engine& engine,
                                         upload_retry_policy policy,
                                         sleep_function sleeper)
    : engine_(engine), policy_(policy), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

auto upload_retry_runner::run(const std::filesystem::path& file_path,
                              const upload_target& target,
                              const upload_config& config,
                              std::shared_ptr<progress_aggregator> progress)
    -> result<upload_summary, upload_error> {
    const auto max_attempts = std::max<std::size_t>(policy_.max_attempts, 1);
    attempts_ = 0;

    while (true) {
        ++attempts_;
        auto outcome = engine_.upload(file_path, target, config, progress);
        if (outcome) {
            return outcome;
        }

        const auto& err = outcome.error();
        if (attempts_ >= max_attempts || !is_retryable(policy_, err)) {
            return outcome;
        }

        auto delay = calculate_retry_delay(policy_, attempts_);

        upload_log_context ctx;
        ctx.file_name = target.file_name;
        ctx.platform = target.platform;
        ctx.duration_ms = static_cast<uint64_t>(delay.count());
        ctx.error_message = err.describe();
        PU_LOG_WARN_CTX(log_category::retry,
                        "Upload attempt " + std::to_string(attempts_) + " of " +
                            std::to_string(max_attempts) + " failed; retrying with a new session",
                        ctx);

        sleeper_(delay);
    }
}

}  // namespace kcenon::package_upload
