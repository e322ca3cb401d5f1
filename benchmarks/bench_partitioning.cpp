/**
 * @file bench_partitioning.cpp
 * @brief Benchmarks for task ordering and shard partitioning
 */

#include <benchmark/benchmark.h>

#include <cymo/core/file_enumerator.h>
#include <cymo/core/work_partitioner.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

namespace cymo::benchmark {

namespace {

/**
 * @brief Synthetic tree: one directory task per 16 files, 3 levels deep
 */
auto make_tasks(std::size_t file_count) -> std::vector<transfer_task> {
    std::vector<transfer_task> tasks;
    tasks.reserve(file_count + file_count / 16 + 1);
    for (std::size_t i = 0; i < file_count; ++i) {
        auto dir = "/dst/d" + std::to_string(i / 256) + "/s" + std::to_string((i / 16) % 16);
        if (i % 16 == 0) {
            tasks.push_back(transfer_task::directory(dir, dir));
        }
        auto remote = dir + "/f" + std::to_string(i) + ".dat";
        tasks.push_back(transfer_task::file(remote, remote, 1024));
    }
    return tasks;
}

}  // namespace

static void BM_SortTasks(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));
    auto ordered = make_tasks(file_count);
    std::mt19937 gen(42);

    for (auto _ : state) {
        state.PauseTiming();
        auto tasks = ordered;
        std::shuffle(tasks.begin(), tasks.end(), gen);
        state.ResumeTiming();

        file_enumerator::sort_tasks(tasks);
        ::benchmark::DoNotOptimize(tasks.data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(ordered.size()) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_SortTasks)->RangeMultiplier(10)->Range(100, 100000);

static void BM_Partition(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));
    const auto threads = static_cast<std::size_t>(state.range(1));
    auto tasks = make_tasks(file_count);

    for (auto _ : state) {
        auto shards = work_partitioner::partition(tasks, threads);
        ::benchmark::DoNotOptimize(shards.data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(tasks.size()) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Partition)
    ->Args({1000, 4})
    ->Args({1000, 16})
    ->Args({100000, 4})
    ->Args({100000, 64});

}  // namespace cymo::benchmark
