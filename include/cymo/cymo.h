/**
 * @file cymo.h
 * @brief Main header for the cymo library
 * @version 0.3.0
 *
 * Include this header to access the whole upload pipeline.
 *
 * @code
 * #include <cymo/cymo.h>
 *
 * using namespace cymo;
 *
 * auto config = upload_config::builder()
 *     .with_server("ftp.example.org")
 *     .with_local_path("./site")
 *     .with_remote_path("/www")
 *     .build();
 *
 * upload_coordinator coordinator(config.value());
 * auto report = coordinator.run();
 * @endcode
 */

#ifndef CYMO_CYMO_H
#define CYMO_CYMO_H

#include <cstdint>
#include <string>

// Core
#include "cymo/core/types.h"
#include "cymo/core/logging.h"
#include "cymo/core/file_enumerator.h"
#include "cymo/core/work_partitioner.h"

// Protocol
#include "cymo/protocol/ftp_session.h"

// Upload
#include "cymo/upload/upload_config.h"
#include "cymo/upload/upload_coordinator.h"
#include "cymo/upload/progress_aggregator.h"

// Adapters
#include "cymo/adapters/worker_pool_adapter.h"

namespace cymo {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 3;
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

}  // namespace cymo

#endif  // CYMO_CYMO_H
