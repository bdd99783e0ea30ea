/**
 * @file upload_engine.h
 * @brief Orchestrates one resumable upload from file to finalized artifact
 */

#ifndef KCENON_PACKAGE_UPLOAD_UPLOAD_UPLOAD_ENGINE_H
#define KCENON_PACKAGE_UPLOAD_UPLOAD_UPLOAD_ENGINE_H

#include <kcenon/package_upload/adapters/thread_pool_adapter.h>
#include <kcenon/package_upload/core/progress_aggregator.h>
#include <kcenon/package_upload/http/http_types.h>
#include <kcenon/package_upload/upload/api_endpoint.h>
#include <kcenon/package_upload/upload/auth_provider.h>
#include <kcenon/package_upload/upload/concurrency_coordinator.h>
#include <kcenon/package_upload/upload/finalizer.h>
#include <kcenon/package_upload/upload/session_negotiator.h>
#include <kcenon/package_upload/upload/upload_types.h>

#include <filesystem>
#include <memory>
#include <optional>

namespace kcenon::package_upload {

/**
 * @brief Uploads installer artifacts to the software repository
 *
 * One call to upload() is one attempt with one fresh session:
 * validate, negotiate, plan, transmit, and finalize where the protocol
 * requires it. Nothing is retried; see upload_retry_runner for an outer
 * retry policy.
 *
 * @code
 * auto engine = upload_engine::builder()
 *     .with_http_client(make_http_client())
 *     .with_auth_provider(std::make_shared<static_token_provider>(token))
 *     .with_api_endpoint(api_endpoint::for_region(region::europe))
 *     .build();
 *
 * auto result = engine.value().upload("Setup.pkg", target);
 * if (!result) {
 *     std::cerr << result.error().describe() << "\n";
 * }
 * @endcode
 */
class upload_engine {
public:
    class builder;

    /**
     * @brief Upload with the engine's default configuration
     */
    [[nodiscard]] auto upload(const std::filesystem::path& file_path,
                              const upload_target& target)
        -> result<upload_summary, upload_error>;

    /**
     * @brief Upload one file
     * @param file_path Artifact to read; opened read-only
     * @param target Destination; total_size 0 means "use the file size",
     *               file_name empty means "use the path's file name"
     * @param config Chunking, protocol and concurrency settings
     * @param progress Optional read model to attach this attempt's table to
     */
    [[nodiscard]] auto upload(const std::filesystem::path& file_path,
                              const upload_target& target,
                              const upload_config& config,
                              std::shared_ptr<progress_aggregator> progress = nullptr)
        -> result<upload_summary, upload_error>;

    [[nodiscard]] auto default_config() const -> const upload_config& {
        return default_config_;
    }

    [[nodiscard]] auto endpoint() const -> const api_endpoint& {
        return negotiator_.endpoint();
    }

private:
    upload_engine(std::shared_ptr<http_client_interface> client,
                  std::shared_ptr<auth_provider> auth,
                  api_endpoint endpoint,
                  std::shared_ptr<adapters::worker_pool_interface> pool,
                  upload_config config);

    session_negotiator negotiator_;
    std::shared_ptr<chunk_transmitter> transmitter_;
    concurrency_coordinator coordinator_;
    finalizer finalizer_;
    upload_config default_config_;
};

/**
 * @brief Builder for upload_engine
 */
class upload_engine::builder {
public:
    builder() = default;

    /// Required
    auto with_http_client(std::shared_ptr<http_client_interface> client) -> builder&;

    /// Required
    auto with_auth_provider(std::shared_ptr<auth_provider> auth) -> builder&;

    /// Defaults to the Europe region
    auto with_api_endpoint(api_endpoint endpoint) -> builder&;

    /// Defaults to a pool sized to the throttle limit, created per upload
    auto with_thread_pool(std::shared_ptr<adapters::worker_pool_interface> pool)
        -> builder&;

    auto with_default_config(upload_config config) -> builder&;

    /**
     * @brief Build the engine
     * @return invalid_configuration if a required collaborator is missing or
     *         the default configuration is invalid
     */
    [[nodiscard]] auto build() -> result<upload_engine>;

private:
    std::shared_ptr<http_client_interface> client_;
    std::shared_ptr<auth_provider> auth_;
    std::optional<api_endpoint> endpoint_;
    std::shared_ptr<adapters::worker_pool_interface> pool_;
    upload_config config_;
};

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_UPLOAD_UPLOAD_ENGINE_H
