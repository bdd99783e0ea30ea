/**
 * @file upload_retry.h
 * @brief Optional whole-upload retry layered outside the engine
 */

#ifndef KCENON_PACKAGE_UPLOAD_UPLOAD_UPLOAD_RETRY_H
#define KCENON_PACKAGE_UPLOAD_UPLOAD_UPLOAD_RETRY_H

#include <kcenon/package_upload/upload/upload_engine.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>

namespace kcenon::package_upload {

/**
 * @brief Retry policy for whole upload attempts
 *
 * The default makes a single attempt.
 */
struct upload_retry_policy {
    /// Total attempts including the first
    std::size_t max_attempts = 1;

    std::chrono::milliseconds initial_delay{1000};

    std::chrono::milliseconds max_delay{30000};

    double backoff_multiplier = 2.0;

    /// Scale each delay by a random factor in [0.5, 1.5)
    bool use_jitter = true;

    /// Retry when chunks or the session request were never delivered
    bool retry_on_network_error = true;

    /// Retry when every failed chunk was answered with a 5xx status
    bool retry_on_server_error = false;

    [[nodiscard]] static auto no_retry() -> upload_retry_policy { return {}; }

    [[nodiscard]] static auto network_resilient(std::size_t attempts = 3) -> upload_retry_policy {
        upload_retry_policy policy;
        policy.max_attempts = attempts;
        return policy;
    }
};

/**
 * @brief Delay before the given retry (1-based), with exponential backoff
 */
[[nodiscard]] auto calculate_retry_delay(const upload_retry_policy& policy,
                                         std::size_t attempt) -> std::chrono::milliseconds;

/**
 * @brief Whether a failed attempt may be repeated under the policy
 *
 * Configuration, authentication, protocol and finalize failures are
 * never retried.
 */
[[nodiscard]] auto is_retryable(const upload_retry_policy& policy, const upload_error& err)
    -> bool;

/**
 * @brief Re-runs failed uploads with a brand-new session each time
 */
class upload_retry_runner {
public:
    using sleep_function = std::function<void(std::chrono::milliseconds)>;

    upload_retry_runner(upload_engine& engine,
                        upload_retry_policy policy,
                        sleep_function sleeper = {});

    [[nodiscard]] auto run(const std::filesystem::path& file_path,
                           const upload_target& target,
                           const upload_config& config,
                           std::shared_ptr<progress_aggregator> progress = nullptr)
        -> result<upload_summary, upload_error>;

    /**
     * @brief Attempts made by the last run()
     */
    [[nodiscard]] auto attempts() const -> std::size_t { return attempts_; }

private:
    upload_engine& engine_;
    upload_retry_policy policy_;
    sleep_function sleeper_;
    std::size_t attempts_ = 0;
};

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_UPLOAD_UPLOAD_RETRY_H
