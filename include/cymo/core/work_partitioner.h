/**
 * @file work_partitioner.h
 * @brief Splitting of the task list into per-worker shards
 */

#ifndef CYMO_CORE_WORK_PARTITIONER_H
#define CYMO_CORE_WORK_PARTITIONER_H

#include "transfer_types.h"

#include <cstddef>
#include <vector>

namespace cymo {

/**
 * @brief Default number of tasks per worker used by auto_thread_count
 */
inline constexpr std::size_t default_files_per_worker = 4;

/**
 * @brief Splits tasks into contiguous, near-equal shards
 *
 * Shard sizes differ by at most one; the first task_count % shard_count
 * shards carry the extra task. Concatenating the shards in order gives back
 * the input.
 */
class work_partitioner {
public:
    /**
     * @brief Worker count when none is configured
     *
     * min(available_parallelism, max(1, task_count / files_per_worker)).
     * An available_parallelism or files_per_worker of 0 counts as 1.
     */
    [[nodiscard]] static auto auto_thread_count(std::size_t task_count,
                                                std::size_t available_parallelism,
                                                std::size_t files_per_worker =
                                                    default_files_per_worker)
        -> std::size_t;

    /**
     * @brief auto_thread_count using std::thread::hardware_concurrency()
     */
    [[nodiscard]] static auto auto_thread_count(std::size_t task_count) -> std::size_t;

    /**
     * @brief Number of shards partition() produces: min(thread_count, task_count)
     */
    [[nodiscard]] static auto shard_count(std::size_t task_count, std::size_t thread_count)
        -> std::size_t;

    /**
     * @brief Split @p tasks into shard_count(tasks.size(), thread_count) shards
     *
     * Zero tasks give zero shards. A thread_count of 0 counts as 1.
     */
    [[nodiscard]] static auto partition(std::vector<transfer_task> tasks,
                                        std::size_t thread_count) -> std::vector<shard>;
};

}  // namespace cymo

#endif  // CYMO_CORE_WORK_PARTITIONER_H
