/**
 * @file upload_coordinator.h
 * @brief Orchestration of a complete upload run
 */

#ifndef CYMO_UPLOAD_UPLOAD_COORDINATOR_H
#define CYMO_UPLOAD_UPLOAD_COORDINATOR_H

#include "remote_directory_registry.h"
#include "upload_config.h"
#include "upload_types.h"

#include <cymo/adapters/worker_pool_adapter.h>
#include <cymo/core/types.h>
#include <cymo/protocol/ftp_session_interface.h>

#include <chrono>
#include <memory>
#include <string>

namespace cymo {

/**
 * @brief Runs one upload from validated configuration to final report
 *
 * Sequence:
 * 1. check that the local root exists
 * 2. bootstrap session: connect, log in, create the remote base path, CWD
 *    into it, take the absolute base from PWD, QUIT. A relative base is
 *    resolved against the login directory.
 * 3. enumerate and partition the local tree
 * 4. one upload_worker per shard on the worker pool, joined before
 *    aggregation
 *
 * Any failure in steps 1-3 is returned as an error before a worker starts.
 * Failures of individual files only show up in the returned run_report.
 *
 * @code
 * auto config = upload_config::builder()
 *     .with_server("ftp.example.org")
 *     .with_local_path("./site")
 *     .with_remote_path("/www")
 *     .build();
 * upload_coordinator coordinator(config.value());
 * auto report = coordinator.run();
 * @endcode
 */
class upload_coordinator {
public:
    /**
     * @param config Validated configuration
     * @param factory Session factory; defaults to Boost.Asio sessions using
     *                the configured operation timeout
     * @param pool Worker pool; defaults to worker_pool_factory::create with
     *             one thread per shard
     */
    explicit upload_coordinator(upload_config config,
                                protocol::session_factory factory = {},
                                std::shared_ptr<adapters::worker_pool_interface> pool = nullptr);

    upload_coordinator(const upload_coordinator&) = delete;
    auto operator=(const upload_coordinator&) -> upload_coordinator& = delete;

    /**
     * @brief Execute the run; call once
     * @return The run report, or the setup error that prevented the run
     */
    [[nodiscard]] auto run() -> result<run_report>;

    [[nodiscard]] auto config() const -> const upload_config& { return config_; }

    [[nodiscard]] auto registry() const -> const remote_directory_registry& {
        return registry_;
    }

    /**
     * @brief Absolute remote directory the tree is uploaded into
     *
     * Empty until the bootstrap session has entered it.
     */
    [[nodiscard]] auto remote_base() const -> const std::string& { return remote_base_; }

    /**
     * @brief How often progress is logged while workers are running
     */
    void set_progress_interval(std::chrono::milliseconds interval) {
        progress_interval_ = interval;
    }

private:
    auto bootstrap() -> result<void>;

    upload_config config_;
    protocol::session_factory factory_;
    std::shared_ptr<adapters::worker_pool_interface> pool_;
    remote_directory_registry registry_;
    std::string remote_base_;
    std::chrono::milliseconds progress_interval_{std::chrono::seconds(5)};
};

}  // namespace cymo

#endif  // CYMO_UPLOAD_UPLOAD_COORDINATOR_H
