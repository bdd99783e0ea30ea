/**
 * @file upload_engine.cpp
 * @brief Upload orchestration
 */

#include <kcenon/package_upload/upload/upload_engine.h>

#include <kcenon/package_upload/core/chunk_planner.h>
#include <kcenon/package_upload/core/chunk_reader.h>
#include <kcenon/package_upload/core/logging.h>
#include <kcenon/package_upload/core/progress_table.h>

#include <chrono>

namespace kcenon::package_upload {

namespace {

auto fail(upload_phase phase, const error& err, int status = 0) -> upload_unexpected {
    return upload_unexpected{upload_error::from(phase, err, status)};
}

}  // namespace

upload_engine::upload_engine(std::shared_ptr<http_client_interface> client,
                             std::shared_ptr<auth_provider> auth,
                             api_endpoint endpoint,
                             std::shared_ptr<adapters::worker_pool_interface> pool,
                             upload_config config)
    : negotiator_(client, auth, std::move(endpoint)),
      transmitter_(std::make_shared<chunk_transmitter>(client, auth)),
      coordinator_(transmitter_, std::move(pool)),
      finalizer_(client, auth),
      default_config_(std::move(config)) {}

auto upload_engine::upload(const std::filesystem::path& file_path,
                           const upload_target& target)
    -> result<upload_summary, upload_error> {
    return upload(file_path, target, default_config_);
}

auto upload_engine::upload(const std::filesystem::path& file_path,
                           const upload_target& target,
                           const upload_config& config,
                           std::shared_ptr<progress_aggregator> progress)
    -> result<upload_summary, upload_error> {
    const auto started = std::chrono::steady_clock::now();

    // 1. Validate configuration and source file before touching the network
    if (auto valid = config.validate(); !valid) {
        PU_LOG_ERROR(log_category::engine, "Invalid upload configuration: " + valid.error().message);
        return fail(upload_phase::validate, valid.error());
    }

    chunk_reader reader(file_path);
    auto size = reader.file_size();
    if (!size) {
        PU_LOG_ERROR(log_category::engine, size.error().message);
        return fail(upload_phase::validate, size.error());
    }
    if (size.value() == 0) {
        return fail(upload_phase::validate,
                    error{error_code::empty_file, "file is empty: " + file_path.string()});
    }

    upload_target effective = target;
    if (effective.total_size == 0) {
        effective.total_size = size.value();
    } else if (effective.total_size != size.value()) {
        return fail(upload_phase::validate,
                    error{error_code::size_mismatch,
                          "target size " + std::to_string(effective.total_size) +
                              " does not match file size " + std::to_string(size.value())});
    }
    if (effective.file_name.empty()) {
        effective.file_name = file_path.filename().string();
    }

    upload_log_context ctx;
    ctx.file_name = effective.file_name;
    ctx.platform = effective.platform;
    ctx.total_size = effective.total_size;
    PU_LOG_INFO_CTX(log_category::engine,
                    std::string("Starting upload (") + to_string(config.protocol) + ")", ctx);

    // 2. Negotiate a fresh session
    auto session = negotiator_.open(effective, config);
    if (!session) {
        const auto& neg = session.error();
        return fail(upload_phase::negotiate, neg.err, neg.status_code);
    }

    // 3. Plan
    auto plan = chunk_planner::plan(effective.total_size, config.chunking());
    if (!plan) {
        return fail(upload_phase::plan, plan.error());
    }

    // 4. Transmit
    auto table = std::make_shared<progress_table>(plan.value());
    if (progress) {
        // Left attached after return; later snapshots show the final state
        progress->attach(table);
    }

    coordinator_job job{plan.value(), session.value(), reader, *table};
    auto policy = config.effective_policy();
    auto report = coordinator_.run(job, policy, config.throttle_limit);
    if (!report) {
        return upload_unexpected{report.error()};
    }

    // 5. Finalize, only once every chunk is committed
    bool finalized = false;
    if (finalizer::required(session.value())) {
        if (!table->all_committed()) {
            return fail(upload_phase::finalize,
                        error{error_code::internal_error,
                              "finalize skipped: not every chunk is committed"});
        }
        auto committed = finalizer_.commit(session.value());
        if (!committed) {
            const auto& fin = committed.error();
            auto err = upload_error::from(upload_phase::finalize, fin.err, fin.status_code);
            return upload_unexpected{std::move(err)};
        }
        finalized = true;
    }

    // 6. Summarize
    upload_summary summary;
    summary.protocol = session.value().protocol;
    summary.policy = report.value().policy;
    summary.file_name = effective.file_name;
    summary.platform = effective.platform;
    summary.total_size = effective.total_size;
    summary.total_chunks = plan.value().total_chunks();
    summary.committed_chunks = table->committed_count();
    summary.completed_early = report.value().completed_early;
    summary.finalized = finalized;
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    auto seconds = static_cast<double>(summary.elapsed.count()) / 1000.0;
    if (seconds > 0.0) {
        summary.average_rate_mbps =
            static_cast<double>(table->committed_bytes()) * 8.0 / 1e6 / seconds;
    }

    ctx.total_chunks = summary.total_chunks;
    ctx.committed_bytes = table->committed_bytes();
    ctx.duration_ms = static_cast<uint64_t>(summary.elapsed.count());
    ctx.rate_mbps = summary.average_rate_mbps;
    PU_LOG_INFO_CTX(log_category::engine, "Upload complete", ctx);

    return summary;
}

// ============================================================================
// Builder
// ============================================================================

auto upload_engine::builder::with_http_client(std::shared_ptr<http_client_interface> client)
    -> builder& {
    client_ = std::move(client);
    return *this;
}

auto upload_engine::builder::with_auth_provider(std::shared_ptr<auth_provider> auth)
    -> builder& {
    auth_ = std::move(auth);
    return *this;
}

auto upload_engine::builder::with_api_endpoint(api_endpoint endpoint) -> builder& {
    endpoint_ = std::move(endpoint);
    return *this;
}

auto upload_engine::builder::with_thread_pool(
    std::shared_ptr<adapters::worker_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto upload_engine::builder::with_default_config(upload_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto upload_engine::builder::build() -> result<upload_engine> {
    if (!client_) {
        return unexpected(error{error_code::invalid_configuration, "HTTP client is required"});
    }
    if (!auth_) {
        return unexpected(error{error_code::invalid_configuration, "auth provider is required"});
    }
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    get_logger().initialize();

    auto endpoint = endpoint_ ? *endpoint_ : api_endpoint::for_region(api_endpoint::default_region);
    return upload_engine{client_, auth_, std::move(endpoint), pool_, config_};
}

}  // namespace kcenon::package_upload
