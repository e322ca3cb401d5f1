/**
 * @file upload_types.h
 * @brief Per-file outcomes and per-worker reports
 */

#ifndef CYMO_UPLOAD_UPLOAD_TYPES_H
#define CYMO_UPLOAD_UPLOAD_TYPES_H

#include <cymo/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cymo {

using clock_type = std::chrono::steady_clock;

/**
 * @brief Status of one file task
 */
enum class outcome_status {
    succeeded,
    failed
};

/**
 * @brief Result of one file task, owned by its worker until aggregation
 */
struct upload_outcome {
    std::string remote_path;
    outcome_status status = outcome_status::failed;
    uint64_t bytes = 0;
    std::chrono::milliseconds duration{0};
    std::size_t attempts = 0;
    std::optional<error> last_error;

    [[nodiscard]] static auto succeeded(std::string remote, uint64_t bytes,
                                        std::chrono::milliseconds elapsed,
                                        std::size_t attempts) -> upload_outcome {
        upload_outcome outcome;
        outcome.remote_path = std::move(remote);
        outcome.status = outcome_status::succeeded;
        outcome.bytes = bytes;
        outcome.duration = elapsed;
        outcome.attempts = attempts;
        return outcome;
    }

    [[nodiscard]] static auto failed(std::string remote, error err, std::size_t attempts)
        -> upload_outcome {
        upload_outcome outcome;
        outcome.remote_path = std::move(remote);
        outcome.status = outcome_status::failed;
        outcome.attempts = attempts;
        outcome.last_error = std::move(err);
        return outcome;
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status == outcome_status::succeeded;
    }
};

/**
 * @brief Everything one worker returns after draining its shard
 */
struct worker_report {
    std::size_t worker_index = 0;
    std::vector<upload_outcome> outcomes;
    clock_type::time_point started_at{};
    clock_type::time_point finished_at{};
    bool session_established = false;
};

/**
 * @brief Final report of a run; the exit status is derived from it alone
 */
struct run_report {
    std::size_t total_tasks = 0;
    std::size_t succeeded_count = 0;
    std::vector<std::string> failed_tasks;
    uint64_t total_bytes = 0;
    std::chrono::milliseconds total_duration{0};
    double average_speed = 0.0;  ///< bytes per second

    /**
     * @brief True when nothing failed and, if anything was attempted, something succeeded
     */
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return failed_tasks.empty() && (total_tasks == 0 || succeeded_count > 0);
    }
};

}  // namespace cymo

#endif  // CYMO_UPLOAD_UPLOAD_TYPES_H
