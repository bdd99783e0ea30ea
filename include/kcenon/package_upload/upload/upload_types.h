/**
 * @file upload_types.h
 * @brief Value types shared by the upload components
 */

#ifndef KCENON_PACKAGE_UPLOAD_UPLOAD_UPLOAD_TYPES_H
#define KCENON_PACKAGE_UPLOAD_UPLOAD_UPLOAD_TYPES_H

#include <kcenon/package_upload/core/chunk_config.h>
#include <kcenon/package_upload/core/types.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::package_upload {

/**
 * @brief Immutable descriptor of where an artifact goes
 *
 * Produced by the caller's target resolution; the upload engine only reads it.
 */
struct upload_target {
    std::string organization_id;
    std::string package_id;
    std::string version_id;
    std::string platform;
    std::string file_name;
    uint64_t total_size = 0;
};

/**
 * @brief Wire protocol variant of one upload session
 */
enum class protocol_variant {
    byte_range_resumable,  ///< Content-Range PUTs, 308 to continue, 2xx when done
    chunk_id_finalize,     ///< Numbered JSON chunks plus an explicit finalize call
};

[[nodiscard]] constexpr auto to_string(protocol_variant p) -> const char* {
    switch (p) {
        case protocol_variant::byte_range_resumable: return "byte_range_resumable";
        case protocol_variant::chunk_id_finalize: return "chunk_id_finalize";
        default: return "unknown";
    }
}

/**
 * @brief How the coordinator schedules chunk transmissions
 */
enum class execution_policy {
    automatic,         ///< sequential for byte-range, bounded_parallel for chunk-id
    sequential,
    bounded_parallel,
};

[[nodiscard]] constexpr auto to_string(execution_policy p) -> const char* {
    switch (p) {
        case execution_policy::automatic: return "automatic";
        case execution_policy::sequential: return "sequential";
        case execution_policy::bounded_parallel: return "bounded_parallel";
        default: return "unknown";
    }
}

/**
 * @brief Field names the chunk-id body reserves for itself
 */
inline constexpr std::array<std::string_view, 5> reserved_chunk_fields = {
    "uploadId", "fileName", "chunkNumber", "totalChunks", "chunkData"};

/**
 * @brief Per-upload configuration
 */
struct upload_config {
    uint64_t chunk_size = chunk_config::default_chunk_size;
    protocol_variant protocol = protocol_variant::byte_range_resumable;
    execution_policy policy = execution_policy::automatic;

    /// Maximum chunks in flight under bounded_parallel
    std::size_t throttle_limit = 4;

    /// Extra string fields carried by the first chunk-id chunk only
    std::map<std::string, std::string> metadata;

    [[nodiscard]] auto chunking() const -> chunk_config { return chunk_config{chunk_size}; }

    /**
     * @brief Resolve automatic to the policy the protocol calls for
     */
    [[nodiscard]] auto effective_policy() const -> execution_policy {
        if (policy != execution_policy::automatic) {
            return policy;
        }
        return protocol == protocol_variant::byte_range_resumable
                   ? execution_policy::sequential
                   : execution_policy::bounded_parallel;
    }

    [[nodiscard]] auto validate() const -> result<void> {
        if (auto chunk_ok = chunking().validate(); !chunk_ok) {
            return chunk_ok;
        }
        if (throttle_limit == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "throttle limit must be at least 1"});
        }
        if (protocol == protocol_variant::byte_range_resumable &&
            policy == execution_policy::bounded_parallel) {
            return unexpected(error{
                error_code::invalid_configuration,
                "byte-range uploads depend on the server offset and must be sequential"});
        }
        for (const auto& [key, value] : metadata) {
            for (auto reserved : reserved_chunk_fields) {
                if (key == reserved) {
                    return unexpected(error{error_code::invalid_configuration,
                                            "metadata key is reserved: " + key});
                }
            }
        }
        return {};
    }
};

/**
 * @brief State of one upload attempt, produced by session negotiation
 *
 * Never reused across attempts.
 */
struct upload_session {
    protocol_variant protocol = protocol_variant::byte_range_resumable;

    /// Upload URL (byte-range) or client-generated upload id (chunk-id)
    std::string endpoint;

    uint64_t chunk_size = 0;
    uint64_t total_size = 0;
    uint32_t total_chunks = 0;
    std::string file_name;

    /// Chunk-id protocol request targets
    std::string chunk_url;
    std::string finalize_url;

    /// Sent with the first chunk-id chunk
    std::map<std::string, std::string> metadata;
};

/**
 * @brief Phase of the upload in which a failure happened
 */
enum class upload_phase {
    validate,
    negotiate,
    plan,
    transmit,
    finalize,
};

[[nodiscard]] constexpr auto to_string(upload_phase p) -> const char* {
    switch (p) {
        case upload_phase::validate: return "validate";
        case upload_phase::negotiate: return "negotiate";
        case upload_phase::plan: return "plan";
        case upload_phase::transmit: return "transmit";
        case upload_phase::finalize: return "finalize";
        default: return "unknown";
    }
}

/**
 * @brief One chunk's terminal failure
 */
struct chunk_failure {
    uint32_t chunk_number = 0;
    int status_code = 0;  ///< 0 when no response was received
    error_code code = error_code::chunk_rejected;
    std::string message;
    std::string body;
};

/**
 * @brief The single typed error returned by an upload
 */
struct upload_error {
    failure_kind kind = failure_kind::none;
    upload_phase phase = upload_phase::validate;
    error_code code = error_code::success;
    std::string message;
    int status_code = 0;
    std::vector<chunk_failure> chunk_failures;

    /**
     * @brief Build from a component error, classifying it
     */
    [[nodiscard]] static auto from(upload_phase phase, const error& err, int status = 0)
        -> upload_error {
        upload_error out;
        out.kind = classify(err.code);
        out.phase = phase;
        out.code = err.code;
        out.message = err.message;
        out.status_code = status;
        return out;
    }

    /**
     * @brief Human readable one-line summary
     */
    [[nodiscard]] auto describe() const -> std::string {
        std::string text = std::string(to_string(kind)) + " during " + to_string(phase) +
                           ": " + message;
        if (status_code != 0) {
            text += " (HTTP " + std::to_string(status_code) + ")";
        }
        if (!chunk_failures.empty()) {
            text += " [chunks:";
            for (const auto& f : chunk_failures) {
                text += " #" + std::to_string(f.chunk_number);
                if (f.status_code != 0) {
                    text += "=" + std::to_string(f.status_code);
                }
            }
            text += "]";
        }
        return text;
    }
};

using upload_unexpected = basic_unexpected<upload_error>;

/**
 * @brief Outcome of a successful upload
 */
struct upload_summary {
    protocol_variant protocol = protocol_variant::byte_range_resumable;
    execution_policy policy = execution_policy::sequential;
    std::string file_name;
    std::string platform;
    uint64_t total_size = 0;
    uint32_t total_chunks = 0;
    uint32_t committed_chunks = 0;

    /// The server reported completion before the last planned chunk
    bool completed_early = false;

    bool finalized = false;
    std::chrono::milliseconds elapsed{0};
    double average_rate_mbps = 0.0;
};

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_UPLOAD_UPLOAD_TYPES_H
