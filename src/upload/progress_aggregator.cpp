/**
 * @file progress_aggregator.cpp
 * @brief Implementation of progress_aggregator
 */

#include <cymo/upload/progress_aggregator.h>

#include <algorithm>

namespace cymo {

auto progress_aggregator::aggregate(const std::vector<worker_report>& reports) -> run_report {
    run_report report;

    std::optional<clock_type::time_point> first_start;
    std::optional<clock_type::time_point> last_finish;

    for (const auto& worker : reports) {
        if (!first_start || worker.started_at < *first_start) {
            first_start = worker.started_at;
        }
        if (!last_finish || worker.finished_at > *last_finish) {
            last_finish = worker.finished_at;
        }

        for (const auto& outcome : worker.outcomes) {
            ++report.total_tasks;
            if (outcome.is_success()) {
                ++report.succeeded_count;
                report.total_bytes += outcome.bytes;
            } else {
                report.failed_tasks.push_back(outcome.remote_path);
            }
        }
    }

    std::sort(report.failed_tasks.begin(), report.failed_tasks.end());

    if (first_start && last_finish && *last_finish > *first_start) {
        report.total_duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(*last_finish - *first_start);
    }
    report.average_speed = compute_average_speed(report.total_bytes, report.total_duration);

    return report;
}

auto progress_aggregator::compute_average_speed(uint64_t bytes,
                                                std::chrono::milliseconds duration) -> double {
    if (duration.count() <= 0) {
        return 0.0;
    }
    const double seconds = std::chrono::duration<double>(duration).count();
    return static_cast<double>(bytes) / seconds;
}

}  // namespace cymo
