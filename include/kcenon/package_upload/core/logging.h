// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.h
 * @brief Structured logging for the upload engine
 *
 * Messages go to the kcenon logger_system when the build enables it and to
 * stderr otherwise. Bearer tokens and the query part of upload locations
 * are masked before they reach any sink.
 */

#pragma once

#include "kcenon/package_upload/config/feature_flags.h"
#include "kcenon/package_upload/core/encoding.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#if PACKAGE_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::package_upload {

/**
 * @brief Log categories for the upload engine
 */
struct log_category {
    static constexpr std::string_view session = "package_upload.session";
    static constexpr std::string_view chunk = "package_upload.chunk";
    static constexpr std::string_view coordinator = "package_upload.coordinator";
    static constexpr std::string_view finalize = "package_upload.finalize";
    static constexpr std::string_view engine = "package_upload.engine";
    static constexpr std::string_view retry = "package_upload.retry";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for sensitive information masking
 */
struct masking_config {
    bool mask_tokens = true;
    bool mask_upload_locations = true;
    std::string mask_text = "***";
    std::size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "***", 4};
    }

    static masking_config none() {
        return {false, false, "***", 4};
    }
};

/**
 * @brief Masks credentials and session locations in log text
 *
 * A bearer token keeps its first visible_chars characters. An upload
 * location keeps its scheme, host and path; the query string, which
 * carries the session id on resumable upload URLs, is replaced.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string result = input;
        if (config_.mask_tokens) {
            result = mask_bearer_tokens(result);
        }
        if (config_.mask_upload_locations) {
            result = mask_url_queries(result);
        }
        return result;
    }

    [[nodiscard]] auto mask_token(const std::string& token) const -> std::string {
        if (!config_.mask_tokens || token.size() <= config_.visible_chars) {
            return token;
        }
        return token.substr(0, config_.visible_chars) + config_.mask_text;
    }

    [[nodiscard]] auto mask_location(const std::string& location) const -> std::string {
        if (!config_.mask_upload_locations) {
            return location;
        }
        auto q = location.find('?');
        if (q == std::string::npos) {
            return location;
        }
        return location.substr(0, q + 1) + config_.mask_text;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    template <typename Replace>
    [[nodiscard]] static auto replace_matches(const std::string& input,
                                              const std::regex& pattern,
                                              Replace replace) -> std::string {
        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), pattern);
        std::sregex_iterator end;

        std::size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += replace(*it);
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);
        return result;
    }

    [[nodiscard]] auto mask_bearer_tokens(const std::string& input) const -> std::string {
        static const std::regex token_pattern(R"((Bearer\s+)([A-Za-z0-9\-._~+/]+=*))",
                                              std::regex::icase);
        return replace_matches(input, token_pattern, [this](const std::smatch& m) {
            return m[1].str() + mask_token(m[2].str());
        });
    }

    [[nodiscard]] auto mask_url_queries(const std::string& input) const -> std::string {
        static const std::regex url_pattern(R"(https?://[^\s"']+)");
        return replace_matches(input, url_pattern, [this](const std::smatch& m) {
            return mask_location(m.str());
        });
    }

    masking_config config_;
};

/**
 * @brief Structured log context for upload operations
 */
struct upload_log_context {
    std::string upload_id;
    std::string file_name;
    std::optional<std::string> platform;
    std::optional<uint64_t> total_size;
    std::optional<uint64_t> committed_bytes;
    std::optional<uint32_t> chunk_number;
    std::optional<uint32_t> total_chunks;
    std::optional<int> status_code;
    std::optional<double> progress_percent;
    std::optional<double> rate_mbps;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> upload_location;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << encoding::json_escape(value) << "\"";
            first = false;
        };
        auto add_int = [&](const char* name, int64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto add_double = [&](const char* name, double value) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2);
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!upload_id.empty()) add_field("upload_id", upload_id);
        if (!file_name.empty()) add_field("file_name", file_name);
        if (platform) add_field("platform", *platform);
        if (total_size) add_int("total_size", static_cast<int64_t>(*total_size));
        if (committed_bytes) add_int("committed_bytes", static_cast<int64_t>(*committed_bytes));
        if (chunk_number) add_int("chunk_number", *chunk_number);
        if (total_chunks) add_int("total_chunks", *total_chunks);
        if (status_code) add_int("status_code", *status_code);
        if (progress_percent) add_double("progress_percent", *progress_percent);
        if (rate_mbps) add_double("rate_mbps", *rate_mbps);
        if (duration_ms) add_int("duration_ms", static_cast<int64_t>(*duration_ms));
        if (upload_location) {
            add_field("upload_location",
                      masker ? masker->mask_location(*upload_location) : *upload_location);
        }
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<upload_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << encoding::json_escape(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << encoding::json_escape(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }

    [[nodiscard]] static auto iso8601_now() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger used by every upload component
 */
class upload_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const upload_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    upload_logger() = default;
    ~upload_logger() = default;

    upload_logger(const upload_logger&) = delete;
    upload_logger& operator=(const upload_logger&) = delete;

    /**
     * @brief Initialize the backend
     *
     * Safe to call multiple times; the engine builder calls it.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if PACKAGE_UPLOAD_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if PACKAGE_UPLOAD_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if PACKAGE_UPLOAD_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Suppress the stderr fallback sink
     *
     * Callbacks still fire. Used by tests and by the CLI, which renders its
     * own progress on the terminal.
     */
    void set_console_output(bool enabled) { console_output_.store(enabled); }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        // Callbacks see masked text, same as every other sink
        std::string masked_message = current_masker.mask(std::string(message));
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked_message, context);
            }
        }

        std::string line_text;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = structured_log_entry::iso8601_now();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            if (function) entry.function_name = function;

            line_text = entry.to_json_with_masking(&current_masker);

            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, line_text);
            }
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << masked_message;
            if (context) {
                oss << " " << context->to_json_with_masking(&current_masker);
            }
            line_text = oss.str();
        }

        write(level, line_text, file, line, function);
    }

    void flush() {
#if PACKAGE_UPLOAD_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write(log_level level,
               const std::string& text,
               [[maybe_unused]] const char* file,
               [[maybe_unused]] int line,
               [[maybe_unused]] const char* function) {
#if PACKAGE_UPLOAD_USE_LOGGER_SYSTEM
        {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            if (logger_) {
                if (file && line > 0 && function) {
                    logger_->log(to_logger_level(level), text, file, line, function);
                } else {
                    logger_->log(to_logger_level(level), text);
                }
                return;
            }
        }
#endif
        if (!console_output_.load()) return;

        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << get_timestamp() << " [" << log_level_to_string(level) << "] "
                  << text << "\n";
    }

#if PACKAGE_UPLOAD_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
    std::mutex backend_mutex_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline upload_logger& get_logger() {
    static upload_logger instance;
    return instance;
}

#define PU_LOG(level, category, message) \
    kcenon::package_upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define PU_LOG_CTX(level, category, message, context) \
    kcenon::package_upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define PU_LOG_TRACE(category, message) \
    PU_LOG(kcenon::package_upload::log_level::trace, category, message)

#define PU_LOG_DEBUG(category, message) \
    PU_LOG(kcenon::package_upload::log_level::debug, category, message)

#define PU_LOG_INFO(category, message) \
    PU_LOG(kcenon::package_upload::log_level::info, category, message)

#define PU_LOG_WARN(category, message) \
    PU_LOG(kcenon::package_upload::log_level::warn, category, message)

#define PU_LOG_ERROR(category, message) \
    PU_LOG(kcenon::package_upload::log_level::error, category, message)

#define PU_LOG_FATAL(category, message) \
    PU_LOG(kcenon::package_upload::log_level::fatal, category, message)

#define PU_LOG_TRACE_CTX(category, message, ctx) \
    PU_LOG_CTX(kcenon::package_upload::log_level::trace, category, message, ctx)

#define PU_LOG_DEBUG_CTX(category, message, ctx) \
    PU_LOG_CTX(kcenon::package_upload::log_level::debug, category, message, ctx)

#define PU_LOG_INFO_CTX(category, message, ctx) \
    PU_LOG_CTX(kcenon::package_upload::log_level::info, category, message, ctx)

#define PU_LOG_WARN_CTX(category, message, ctx) \
    PU_LOG_CTX(kcenon::package_upload::log_level::warn, category, message, ctx)

#define PU_LOG_ERROR_CTX(category, message, ctx) \
    PU_LOG_CTX(kcenon::package_upload::log_level::error, category, message, ctx)

#define PU_LOG_FATAL_CTX(category, message, ctx) \
    PU_LOG_CTX(kcenon::package_upload::log_level::fatal, category, message, ctx)

}  // namespace kcenon::package_upload
