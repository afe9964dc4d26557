/**
 * @file chunked_upload.h
 * @brief Main header for the chunked_upload library
 * @version 0.1.0
 *
 * Include this header to access the upload engine, its transports and the
 * building blocks it is made of.
 *
 * @code
 * #include <chunked_upload/chunked_upload.h>
 *
 * using namespace chunked_upload;
 *
 * http_transport_config http;
 * http.endpoint_url = "http://localhost:8080/api/upload/chunk";
 *
 * auto registry = upload_registry::builder()
 *     .with_transport(std::make_shared<http_chunk_transport>(http))
 *     .build();
 * @endcode
 */

#ifndef CHUNKED_UPLOAD_CHUNKED_UPLOAD_H
#define CHUNKED_UPLOAD_CHUNKED_UPLOAD_H

#include <string>

// Core types
#include <chunked_upload/core/types.h>
#include <chunked_upload/core/upload_config.h>
#include <chunked_upload/core/logging.h>

// Building blocks
#include <chunked_upload/core/byte_source.h>
#include <chunked_upload/core/digest.h>
#include <chunked_upload/core/chunk_planner.h>
#include <chunked_upload/core/concurrency_limiter.h>
#include <chunked_upload/core/cancellation_token.h>
#include <chunked_upload/core/retry_controller.h>
#include <chunked_upload/core/upload_state_machine.h>
#include <chunked_upload/core/progress_aggregator.h>

// Transport
#include <chunked_upload/transport/chunk_transport.h>
#include <chunked_upload/transport/http_chunk_transport.h>

// Engine
#include <chunked_upload/engine/upload_types.h>
#include <chunked_upload/engine/upload_session.h>
#include <chunked_upload/engine/upload_registry.h>

// Adapters
#include <chunked_upload/adapters/thread_pool_adapter.h>

namespace chunked_upload {

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

}  // namespace chunked_upload

#endif  // CHUNKED_UPLOAD_CHUNKED_UPLOAD_H
