/**
 * @file upload_worker.cpp
 * @brief Implementation of upload_worker
 */

#include <cymo/upload/upload_worker.h>

#include <cymo/core/logging.h>
#include <cymo/core/remote_path.h>
#include <cymo/core/retry.h>

#include <fstream>
#include <utility>

namespace cymo {

upload_worker::upload_worker(std::size_t worker_index,
                             shard tasks,
                             upload_worker_config config,
                             protocol::session_factory factory,
                             remote_directory_registry& registry,
                             live_progress* progress)
    : worker_index_(worker_index),
      tasks_(std::move(tasks)),
      config_(std::move(config)),
      factory_(std::move(factory)),
      registry_(&registry),
      progress_(progress) {}

auto upload_worker::run() -> worker_report {
    worker_report report;
    report.worker_index = worker_index_;
    report.started_at = clock_type::now();

    auto classifier = content_classifier::create();
    if (classifier) {
        classifier_ = std::move(classifier.value());
    } else {
        CYMO_LOG_WARN(log_category::worker,
                      "Worker " + std::to_string(worker_index_) +
                          ": content classification unavailable, uploading in binary mode: " +
                          classifier.error().message);
    }

    auto opened = open_session();
    if (!opened) {
        upload_log_context ctx;
        ctx.worker_index = worker_index_;
        ctx.error_message = opened.error().message;
        ctx.server_address = config_.server.to_string();
        CYMO_LOG_ERROR_CTX(log_category::worker,
                           "Session setup failed, failing " +
                               std::to_string(count_file_tasks(tasks_)) + " files",
                           ctx);

        for (const auto& task : tasks_) {
            if (task.is_directory) {
                continue;
            }
            auto outcome = upload_outcome::failed(task.remote_path, opened.error(), 0);
            record(outcome);
            report.outcomes.push_back(std::move(outcome));
        }
        report.finished_at = clock_type::now();
        return report;
    }
    report.session_established = true;

    CYMO_LOG_DEBUG(log_category::worker,
                   "Worker " + std::to_string(worker_index_) + " started with " +
                       std::to_string(tasks_.size()) + " tasks");

    for (const auto& task : tasks_) {
        if (task.is_directory) {
            process_directory(task);
            continue;
        }
        auto outcome = process_file(task);
        record(outcome);
        report.outcomes.push_back(std::move(outcome));
    }

    close_session();
    report.finished_at = clock_type::now();

    CYMO_LOG_DEBUG(log_category::worker,
                   "Worker " + std::to_string(worker_index_) + " finished");
    return report;
}

auto upload_worker::open_session() -> result<void> {
    if (!session_) {
        session_ = factory_();
        if (!session_) {
            return unexpected{error{error_code::internal_error,
                                    "session factory returned no session"}};
        }
    }

    auto connected = session_->connect(config_.server);
    if (!connected) {
        return connected;
    }
    return session_->authenticate(config_.login);
}

void upload_worker::close_session() {
    if (!session_ || !session_->is_connected()) {
        return;
    }
    auto closed = session_->quit();
    if (!closed) {
        CYMO_LOG_DEBUG(log_category::worker,
                       "Worker " + std::to_string(worker_index_) +
                           ": QUIT failed: " + closed.error().message);
    }
}

void upload_worker::process_directory(const transfer_task& task) {
    if (failed_ancestor(task.remote_path)) {
        return;
    }

    if (!session_->is_connected()) {
        auto reopened = open_session();
        if (!reopened) {
            CYMO_LOG_WARN(log_category::worker,
                          "Worker " + std::to_string(worker_index_) +
                              ": reconnect failed: " + reopened.error().message);
            return;
        }
    }

    std::string failed_directory;
    auto ensured = registry_->ensure_with_ancestors(task.remote_path, *session_,
                                                    &failed_directory);
    if (!ensured) {
        if (error_kind_of(ensured.error().code) == error_kind::directory) {
            failed_directories_.emplace_back(std::move(failed_directory), ensured.error());
        }
        upload_log_context ctx;
        ctx.worker_index = worker_index_;
        ctx.remote_path = task.remote_path;
        ctx.error_message = ensured.error().message;
        CYMO_LOG_ERROR_CTX(log_category::worker, "Directory unavailable", ctx);
    }
}

auto upload_worker::process_file(const transfer_task& task) -> upload_outcome {
    if (const auto* err = failed_ancestor(task.remote_path)) {
        return upload_outcome::failed(task.remote_path, *err, 0);
    }

    if (!session_->is_connected()) {
        auto reopened = open_session();
        if (!reopened) {
            return upload_outcome::failed(task.remote_path, reopened.error(), 0);
        }
    }

    const auto parent = remote_parent(task.remote_path);
    std::string failed_directory;
    auto ensured = registry_->ensure_with_ancestors(parent, *session_, &failed_directory);
    if (!ensured) {
        if (error_kind_of(ensured.error().code) == error_kind::directory) {
            failed_directories_.emplace_back(std::move(failed_directory), ensured.error());
        }
        return upload_outcome::failed(task.remote_path, ensured.error(), 0);
    }

    const auto started = clock_type::now();

    auto attempt_upload = [&](std::size_t) -> result<uint64_t> {
        auto mode = choose_mode(task);
        if (!mode) {
            return unexpected{mode.error()};
        }
        return upload_once(task, mode.value());
    };

    auto on_failure = [&](const error& err, std::size_t attempt) {
        upload_log_context ctx;
        ctx.worker_index = worker_index_;
        ctx.remote_path = task.remote_path;
        ctx.attempt = attempt;
        ctx.error_message = err.message;
        CYMO_LOG_WARN_CTX(log_category::worker, "Upload attempt failed, retrying", ctx);

        if (!session_->is_connected()) {
            auto reopened = open_session();
            if (!reopened) {
                CYMO_LOG_WARN(log_category::worker,
                              "Worker " + std::to_string(worker_index_) +
                                  ": reconnect failed: " + reopened.error().message);
            }
        }
    };

    auto outcome = retry_with_limit(attempt_upload, config_.retry_limit, on_failure);
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(clock_type::now() - started);

    upload_log_context ctx;
    ctx.worker_index = worker_index_;
    ctx.remote_path = task.remote_path;
    ctx.file_size = task.size_bytes;
    ctx.attempt = outcome.attempts;
    ctx.duration_ms = static_cast<uint64_t>(elapsed.count());

    if (!outcome.value) {
        ctx.error_message = outcome.value.error().message;
        CYMO_LOG_ERROR_CTX(log_category::worker, "Upload failed", ctx);
        return upload_outcome::failed(task.remote_path, outcome.value.error(), outcome.attempts);
    }

    ctx.bytes_transferred = outcome.value.value();
    ctx.rate_bytes_per_sec =
        progress_aggregator::compute_average_speed(outcome.value.value(), elapsed);
    CYMO_LOG_INFO_CTX(log_category::worker, "Uploaded", ctx);

    return upload_outcome::succeeded(task.remote_path, outcome.value.value(), elapsed,
                                     outcome.attempts);
}

auto upload_worker::choose_mode(const transfer_task& task) -> result<transfer_mode> {
    if (!classifier_) {
        return transfer_mode::binary;
    }
    return classifier_->classify_file(task.local_path, config_.sniff_bytes);
}

auto upload_worker::upload_once(const transfer_task& task, transfer_mode mode)
    -> result<uint64_t> {
    std::ifstream file(task.local_path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
                                "cannot open " + task.local_path.string()}};
    }

    CYMO_LOG_DEBUG(log_category::worker,
                   "Worker " + std::to_string(worker_index_) + ": STOR " + task.remote_path +
                       " (" + to_string(mode) + ")");
    return session_->store(task.remote_path, file, mode);
}

auto upload_worker::failed_ancestor(const std::string& remote_path) const -> const error* {
    for (const auto& [directory, err] : failed_directories_) {
        if (is_same_or_ancestor(directory, remote_path)) {
            return &err;
        }
    }
    return nullptr;
}

void upload_worker::record(const upload_outcome& outcome) {
    if (!progress_) {
        return;
    }
    if (outcome.is_success()) {
        progress_->record_success(outcome.bytes);
    } else {
        progress_->record_failure();
    }
}

}  // namespace cymo
