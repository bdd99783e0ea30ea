/**
 * @file package_upload.h
 * @brief Main header for the package_upload library
 * @version 0.1.0
 *
 * Include this header to access the resumable installer upload engine.
 *
 * @code
 * #include <kcenon/package_upload/package_upload.h>
 *
 * using namespace kcenon::package_upload;
 *
 * auto engine = upload_engine::builder()
 *     .with_http_client(make_http_client())
 *     .with_auth_provider(std::make_shared<static_token_provider>(token))
 *     .build();
 * @endcode
 */

#ifndef KCENON_PACKAGE_UPLOAD_PACKAGE_UPLOAD_H
#define KCENON_PACKAGE_UPLOAD_PACKAGE_UPLOAD_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/package_upload/core/types.h"
#include "kcenon/package_upload/core/chunk_config.h"
#include "kcenon/package_upload/core/chunk_planner.h"
#include "kcenon/package_upload/core/progress_aggregator.h"

// HTTP
#include "kcenon/package_upload/http/http_client.h"

// Upload
#include "kcenon/package_upload/upload/upload_types.h"
#include "kcenon/package_upload/upload/api_endpoint.h"
#include "kcenon/package_upload/upload/auth_provider.h"
#include "kcenon/package_upload/upload/upload_engine.h"
#include "kcenon/package_upload/upload/upload_retry.h"

// Adapters
#include "kcenon/package_upload/adapters/thread_pool_adapter.h"

namespace kcenon::package_upload {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::package_upload

#endif  // KCENON_PACKAGE_UPLOAD_PACKAGE_UPLOAD_H
