/**
 * @file progress_aggregator.h
 * @brief Folding of worker reports into the run report
 */

#ifndef CYMO_UPLOAD_PROGRESS_AGGREGATOR_H
#define CYMO_UPLOAD_PROGRESS_AGGREGATOR_H

#include "upload_types.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

namespace cymo {

/**
 * @brief Builds the run_report once every worker has joined
 *
 * The result only depends on the multiset of outcomes and the worker time
 * stamps, not on the order of @p reports.
 */
class progress_aggregator {
public:
    [[nodiscard]] static auto aggregate(const std::vector<worker_report>& reports)
        -> run_report;

    /**
     * @brief bytes / seconds; 0 when the duration is zero
     */
    [[nodiscard]] static auto compute_average_speed(uint64_t bytes,
                                                    std::chrono::milliseconds duration)
        -> double;
};

/**
 * @brief Running counters for progress logging while workers are busy
 *
 * Statistics only; the final report never reads these.
 */
class live_progress {
public:
    explicit live_progress(std::size_t total_files = 0) : total_files_(total_files) {}

    void record_success(uint64_t bytes) {
        files_done_.fetch_add(1, std::memory_order_relaxed);
        bytes_sent_.fetch_add(bytes, std::memory_order_relaxed);
    }

    void record_failure() {
        files_failed_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] auto total_files() const noexcept -> std::size_t { return total_files_; }
    [[nodiscard]] auto files_done() const noexcept -> std::size_t {
        return files_done_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] auto files_failed() const noexcept -> std::size_t {
        return files_failed_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] auto bytes_sent() const noexcept -> uint64_t {
        return bytes_sent_.load(std::memory_order_relaxed);
    }

private:
    std::size_t total_files_;
    std::atomic<std::size_t> files_done_{0};
    std::atomic<std::size_t> files_failed_{0};
    std::atomic<uint64_t> bytes_sent_{0};
};

}  // namespace cymo

#endif  // CYMO_UPLOAD_PROGRESS_AGGREGATOR_H
