/**
 * @file work_partitioner.cpp
 * @brief Implementation of work_partitioner
 */

#include <cymo/core/work_partitioner.h>

#include <cymo/core/logging.h>

#include <algorithm>
#include <iterator>
#include <thread>

namespace cymo {

auto work_partitioner::auto_thread_count(std::size_t task_count,
                                         std::size_t available_parallelism,
                                         std::size_t files_per_worker) -> std::size_t {
    available_parallelism = std::max<std::size_t>(1, available_parallelism);
    files_per_worker = std::max<std::size_t>(1, files_per_worker);

    return std::min(available_parallelism,
                    std::max<std::size_t>(1, task_count / files_per_worker));
}

auto work_partitioner::auto_thread_count(std::size_t task_count) -> std::size_t {
    return auto_thread_count(task_count, std::thread::hardware_concurrency());
}

auto work_partitioner::shard_count(std::size_t task_count, std::size_t thread_count)
    -> std::size_t {
    return std::min(std::max<std::size_t>(1, thread_count), task_count);
}

auto work_partitioner::partition(std::vector<transfer_task> tasks, std::size_t thread_count)
    -> std::vector<shard> {
    const auto count = shard_count(tasks.size(), thread_count);
    std::vector<shard> shards;
    if (count == 0) {
        return shards;
    }

    const auto base_size = tasks.size() / count;
    const auto remainder = tasks.size() % count;
    shards.reserve(count);

    auto it = std::make_move_iterator(tasks.begin());
    for (std::size_t i = 0; i < count; ++i) {
        const auto size = base_size + (i < remainder ? 1 : 0);
        auto next = it + static_cast<std::ptrdiff_t>(size);
        shards.emplace_back(it, next);
        it = next;
    }

    CYMO_LOG_DEBUG(log_category::partitioner,
                   "Partitioned " + std::to_string(tasks.size()) + " tasks into " +
                       std::to_string(count) + " shards");
    return shards;
}

}  // namespace cymo
