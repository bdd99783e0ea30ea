/**
 * @file upload_installer.cpp
 * @brief Upload an installer to a software repository version
 *
 * This example demonstrates:
 * - Resolving the API base from a region or an explicit URL
 * - Uploading one file for several platforms, each with its own session
 * - Rendering chunk progress from progress_aggregator snapshots
 * - Optional whole-upload retry for network failures
 */

#include <kcenon/package_upload/package_upload.h>
#include <kcenon/package_upload/core/logging.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::package_upload;

namespace {

auto env_or(const char* name, const std::string& fallback = {}) -> std::string {
    const char* value = std::getenv(name);
    return value && *value ? std::string(value) : fallback;
}

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto status_glyph(chunk_status status) -> char {
    switch (status) {
        case chunk_status::in_flight: return '>';
        case chunk_status::committed: return '#';
        case chunk_status::failed: return 'x';
        case chunk_status::pending:
        default: return '.';
    }
}

void render(const progress_snapshot& snap) {
    std::ostringstream line;
    line << "\r[";
    for (const auto& c : snap.chunks) {
        line << status_glyph(c.status);
    }
    line << "] " << std::fixed << std::setprecision(1) << snap.percent << "% "
         << snap.committed_chunks << "/" << snap.total_chunks << " chunks, "
         << format_bytes(snap.committed_bytes) << " of " << format_bytes(snap.total_bytes)
         << ", " << std::setprecision(2) << snap.rate_mbps << " Mbps   ";
    std::cout << line.str() << std::flush;
}

/**
 * @brief Redraws the progress line until stopped
 */
class progress_renderer {
public:
    explicit progress_renderer(std::shared_ptr<progress_aggregator> progress)
        : progress_(std::move(progress)), thread_([this] { loop(); }) {}

    ~progress_renderer() { stop(); }

    progress_renderer(const progress_renderer&) = delete;
    progress_renderer& operator=(const progress_renderer&) = delete;

    void stop() {
        if (running_.exchange(false) && thread_.joinable()) {
            thread_.join();
            if (progress_->is_attached()) {
                render(progress_->snapshot());
            }
            std::cout << std::endl;
        }
    }

private:
    void loop() {
        while (running_.load()) {
            if (progress_->is_attached()) {
                render(progress_->snapshot());
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }
    }

    std::shared_ptr<progress_aggregator> progress_;
    std::atomic<bool> running_{true};
    std::thread thread_;
};

auto parse_protocol(const std::string& name) -> protocol_variant {
    if (name == "byte-range") return protocol_variant::byte_range_resumable;
    if (name == "chunk-id") return protocol_variant::chunk_id_finalize;
    throw std::invalid_argument("Invalid protocol: " + name);
}

auto parse_level(const std::string& name) -> log_level {
    if (name == "trace") return log_level::trace;
    if (name == "debug") return log_level::debug;
    if (name == "info") return log_level::info;
    if (name == "warn") return log_level::warn;
    if (name == "error") return log_level::error;
    throw std::invalid_argument("Invalid log level: " + name);
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload Installer - package_upload" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program
              << " [options] --org <id> --package <id> --version <id> <file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --platform <name>       Target platform, repeatable (default: Mac_AppleSilicon)" << std::endl;
    std::cout << "  --file-name <name>      Name reported to the server (default: file's name)" << std::endl;
    std::cout << "  --region <name>         NorthAmerica, Europe or Australia (env ACTION1_REGION)" << std::endl;
    std::cout << "  --base-url <url>        Explicit API base URL (env ACTION1_BASE_URL)" << std::endl;
    std::cout << "  --token <token>         Bearer token (env ACTION1_TOKEN)" << std::endl;
    std::cout << "  --chunk-mb <n>          Chunk size in MiB, minimum 5 (env CHUNK_MB, default 24)" << std::endl;
    std::cout << "  --protocol <name>       byte-range or chunk-id (default: byte-range)" << std::endl;
    std::cout << "  --throttle <n>          Parallel chunk limit for chunk-id (env UPLOAD_THROTTLE, default 4)" << std::endl;
    std::cout << "  --meta <key=value>      Metadata sent with the first chunk-id chunk, repeatable" << std::endl;
    std::cout << "  --retries <n>           Whole-upload attempts on network failure (default: 1)" << std::endl;
    std::cout << "  --timeout-s <n>         Per-request HTTP timeout in seconds (default: 300)" << std::endl;
    std::cout << "  --log-level <level>     trace, debug, info, warn, error (default: warn)" << std::endl;
    std::cout << "  --json-log              Emit structured JSON logs" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " --org O --package P --version V Setup.pkg" << std::endl;
    std::cout << "  " << program << " --platform Mac_Intel --platform Mac_AppleSilicon \\" << std::endl;
    std::cout << "      --org O --package P --version V Setup.pkg" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string base_url = env_or("ACTION1_BASE_URL");
    std::string region_name = env_or("ACTION1_REGION");
    std::string token = env_or("ACTION1_TOKEN");
    std::string chunk_mb = env_or("CHUNK_MB", "24");
    std::string throttle = env_or("UPLOAD_THROTTLE", "4");
    std::string protocol_name = "byte-range";
    std::string level_name = "warn";
    std::string retries = "1";
    std::string timeout_s = "300";
    bool json_log = false;

    upload_target target;
    std::vector<std::string> platforms;
    std::vector<std::pair<std::string, std::string>> metadata;
    std::string file_path;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next = [&](std::string& out) -> bool {
            if (++i >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return false;
            }
            out = argv[i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--org") {
            if (!next(target.organization_id)) return 1;
        } else if (arg == "--package") {
            if (!next(target.package_id)) return 1;
        } else if (arg == "--version") {
            if (!next(target.version_id)) return 1;
        } else if (arg == "--file-name") {
            if (!next(target.file_name)) return 1;
        } else if (arg == "--platform") {
            std::string platform;
            if (!next(platform)) return 1;
            platforms.push_back(platform);
        } else if (arg == "--region") {
            if (!next(region_name)) return 1;
        } else if (arg == "--base-url") {
            if (!next(base_url)) return 1;
        } else if (arg == "--token") {
            if (!next(token)) return 1;
        } else if (arg == "--chunk-mb") {
            if (!next(chunk_mb)) return 1;
        } else if (arg == "--protocol") {
            if (!next(protocol_name)) return 1;
        } else if (arg == "--throttle") {
            if (!next(throttle)) return 1;
        } else if (arg == "--retries") {
            if (!next(retries)) return 1;
        } else if (arg == "--timeout-s") {
            if (!next(timeout_s)) return 1;
        } else if (arg == "--log-level") {
            if (!next(level_name)) return 1;
        } else if (arg == "--json-log") {
            json_log = true;
        } else if (arg == "--meta") {
            std::string kv;
            if (!next(kv)) return 1;
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Error: --meta expects key=value" << std::endl;
                return 1;
            }
            metadata.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            file_path = arg;
        }
    }

    if (file_path.empty() || target.organization_id.empty() || target.package_id.empty() ||
        target.version_id.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    if (platforms.empty()) {
        platforms.emplace_back("Mac_AppleSilicon");
    }

    upload_config config;
    upload_retry_policy retry;
    std::chrono::milliseconds request_timeout{300000};
    try {
        auto chunking = chunk_config::from_megabytes(std::stoull(chunk_mb));
        if (!chunking) {
            std::cerr << "Error: " << chunking.error().message << std::endl;
            return 1;
        }
        config.chunk_size = chunking.value().chunk_size;
        request_timeout = std::chrono::seconds(std::stoull(timeout_s));
        config.protocol = parse_protocol(protocol_name);
        config.throttle_limit = static_cast<std::size_t>(std::stoul(throttle));
        retry.max_attempts = static_cast<std::size_t>(std::stoul(retries));
        get_logger().set_level(parse_level(level_name));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    for (const auto& [key, value] : metadata) {
        config.metadata[key] = value;
    }
    get_logger().enable_json_output(json_log);

    auto endpoint = api_endpoint::resolve(base_url, region_name);
    if (!endpoint) {
        std::cerr << "Error: " << endpoint.error().message << std::endl;
        return 1;
    }

    auto client = make_http_client(request_timeout);
    if (!client->is_available()) {
        std::cerr << "Error: this build has no HTTP transport (network_system not found)"
                  << std::endl;
        return 1;
    }

    auto built = upload_engine::builder()
                     .with_http_client(client)
                     .with_auth_provider(std::make_shared<static_token_provider>(token))
                     .with_api_endpoint(endpoint.value())
                     .with_default_config(config)
                     .build();
    if (!built) {
        std::cerr << "Error: " << built.error().message << std::endl;
        return 1;
    }
    auto engine = std::move(built).value();

    std::cout << "API: " << engine.endpoint().base_url() << std::endl;
    std::cout << "File: " << file_path << std::endl;

    upload_retry_runner runner(engine, retry);
    int exit_code = 0;

    for (const auto& platform : platforms) {
        auto platform_target = target;
        platform_target.platform = platform;

        std::cout << "Uploading for " << platform << " (" << to_string(config.protocol) << ")"
                  << std::endl;

        auto progress = std::make_shared<progress_aggregator>();
        progress_renderer renderer(progress);
        auto outcome = runner.run(file_path, platform_target, config, progress);
        renderer.stop();

        if (!outcome) {
            std::cerr << "Upload failed for " << platform << ": " << outcome.error().describe()
                      << std::endl;
            for (const auto& f : outcome.error().chunk_failures) {
                if (!f.body.empty()) {
                    std::cerr << "  chunk " << f.chunk_number << ": " << f.body << std::endl;
                }
            }
            exit_code = 1;
            continue;
        }

        const auto& s = outcome.value();
        std::cout << "Uploaded " << s.file_name << " for " << platform << ": "
                  << format_bytes(s.total_size) << " in " << s.total_chunks << " chunk(s), "
                  << std::fixed << std::setprecision(2)
                  << static_cast<double>(s.elapsed.count()) / 1000.0 << " s, "
                  << s.average_rate_mbps << " Mbps";
        if (s.finalized) {
            std::cout << ", finalized";
        }
        if (s.completed_early) {
            std::cout << " (server completed early)";
        }
        std::cout << std::endl;
    }

    get_logger().flush();
    return exit_code;
}
