/**
 * @file upload_coordinator.cpp
 * @brief Implementation of upload_coordinator
 */

#include <cymo/upload/upload_coordinator.h>

#include <cymo/core/file_enumerator.h>
#include <cymo/core/logging.h>
#include <cymo/core/remote_path.h>
#include <cymo/core/work_partitioner.h>
#include <cymo/protocol/ftp_session.h>
#include <cymo/upload/progress_aggregator.h>
#include <cymo/upload/upload_worker.h>

#include <exception>
#include <filesystem>
#include <future>
#include <thread>
#include <vector>

namespace cymo {

upload_coordinator::upload_coordinator(upload_config config,
                                       protocol::session_factory factory,
                                       std::shared_ptr<adapters::worker_pool_interface> pool)
    : config_(std::move(config)), factory_(std::move(factory)), pool_(std::move(pool)) {
    if (!factory_) {
        protocol::ftp_session_config session_config;
        session_config.operation_timeout = config_.operation_timeout;
        factory_ = protocol::ftp_session::make_factory(session_config);
    }
    get_logger().initialize();
}

auto upload_coordinator::bootstrap() -> result<void> {
    auto session = factory_();
    if (!session) {
        return unexpected{error{error_code::internal_error,
                                "session factory returned no session"}};
    }

    upload_log_context ctx;
    ctx.server_address = config_.server.to_string();

    auto connected = session->connect(config_.server);
    if (!connected) {
        ctx.error_message = connected.error().message;
        CYMO_LOG_ERROR_CTX(log_category::coordinator, "Cannot reach server", ctx);
        return connected;
    }

    auto authenticated = session->authenticate(config_.login);
    if (!authenticated) {
        ctx.error_message = authenticated.error().message;
        CYMO_LOG_ERROR_CTX(log_category::coordinator, "Login rejected", ctx);
        return authenticated;
    }

    auto welcome = session->welcome_message();
    if (!welcome.empty()) {
        CYMO_LOG_INFO(log_category::coordinator, "Server says: " + welcome);
    }

    // A relative base lives under the login directory, which exists already
    auto target = config_.remote_path;
    if (!is_absolute_remote_path(target)) {
        auto login_directory = session->current_directory();
        if (!login_directory) {
            CYMO_LOG_ERROR(log_category::coordinator,
                           "Cannot resolve relative remote base " + target + ": " +
                               login_directory.error().message);
            return unexpected{login_directory.error()};
        }
        registry_.mark_existing(login_directory.value());
        target = join_remote_path(login_directory.value(), target);
    }

    auto ensured = registry_.ensure_with_ancestors(target, *session);
    if (!ensured) {
        CYMO_LOG_ERROR(log_category::coordinator,
                       "Cannot create remote base " + target + ": " + ensured.error().message);
        return ensured;
    }

    auto changed = session->change_directory(config_.remote_path);
    if (!changed) {
        CYMO_LOG_ERROR(log_category::coordinator,
                       "Cannot enter remote base " + config_.remote_path + ": " +
                           changed.error().message);
        return changed;
    }

    auto cwd = session->current_directory();
    if (cwd) {
        remote_base_ = normalize_remote_path(cwd.value());
        registry_.mark_existing(remote_base_);
        CYMO_LOG_INFO(log_category::coordinator, "Remote working directory: " + remote_base_);
    } else {
        remote_base_ = target;
        CYMO_LOG_DEBUG(log_category::coordinator,
                       "PWD failed, using " + target + ": " + cwd.error().message);
    }

    auto closed = session->quit();
    if (!closed) {
        CYMO_LOG_DEBUG(log_category::coordinator,
                       "Bootstrap QUIT failed: " + closed.error().message);
    }
    return {};
}

auto upload_coordinator::run() -> result<run_report> {
    std::error_code ec;
    if (!std::filesystem::exists(config_.local_path, ec)) {
        CYMO_LOG_ERROR(log_category::coordinator,
                       "Local path does not exist: " + config_.local_path.string());
        return unexpected{error{error_code::file_not_found,
                                "local path does not exist: " + config_.local_path.string()}};
    }

    auto bootstrapped = bootstrap();
    if (!bootstrapped) {
        return unexpected{bootstrapped.error()};
    }

    auto enumerated = file_enumerator::enumerate(config_.local_path, remote_base_);
    if (!enumerated) {
        CYMO_LOG_ERROR(log_category::coordinator,
                       "Enumeration failed: " + enumerated.error().message);
        return unexpected{enumerated.error()};
    }
    auto tasks = std::move(enumerated.value());

    for (const auto& duplicate : file_enumerator::find_duplicate_remote_paths(tasks)) {
        CYMO_LOG_WARN(log_category::coordinator,
                      "Remote path targeted more than once, last upload wins: " + duplicate);
    }

    if (tasks.empty()) {
        CYMO_LOG_INFO(log_category::coordinator, "Nothing to upload");
        return run_report{};
    }

    const auto file_count = count_file_tasks(tasks);
    const auto thread_count = config_.thread_count.value_or(
        work_partitioner::auto_thread_count(file_count, std::thread::hardware_concurrency(),
                                            config_.files_per_worker));
    auto shards = work_partitioner::partition(std::move(tasks), thread_count);

    CYMO_LOG_INFO(log_category::coordinator,
                  "Uploading " + std::to_string(file_count) + " files with " +
                      std::to_string(shards.size()) + " workers");

    auto pool = pool_ ? pool_ : adapters::worker_pool_factory::create(shards.size());

    upload_worker_config worker_config;
    worker_config.server = config_.server;
    worker_config.login = config_.login;
    worker_config.retry_limit = config_.retry_limit;
    worker_config.sniff_bytes = config_.sniff_bytes;

    live_progress progress(file_count);
    std::vector<std::future<worker_report>> reports;
    std::vector<std::future<void>> completions;
    reports.reserve(shards.size());
    completions.reserve(shards.size());

    for (std::size_t i = 0; i < shards.size(); ++i) {
        auto worker = std::make_shared<upload_worker>(i, std::move(shards[i]), worker_config,
                                                      factory_, registry_, &progress);
        auto unit = std::make_shared<std::packaged_task<worker_report()>>(
            [worker]() { return worker->run(); });
        reports.push_back(unit->get_future());
        completions.push_back(pool->submit([unit]() { (*unit)(); }));
    }

    for (auto& completion : completions) {
        while (completion.wait_for(progress_interval_) != std::future_status::ready) {
            CYMO_LOG_INFO(log_category::coordinator,
                          "Progress: " + std::to_string(progress.files_done()) + "/" +
                              std::to_string(progress.total_files()) + " files, " +
                              std::to_string(progress.files_failed()) + " failed, " +
                              std::to_string(progress.bytes_sent()) + " bytes");
        }
    }

    std::vector<worker_report> collected;
    collected.reserve(reports.size());
    for (auto& report : reports) {
        try {
            collected.push_back(report.get());
        } catch (const std::exception& e) {
            CYMO_LOG_ERROR(log_category::coordinator,
                           std::string("Worker terminated abnormally: ") + e.what());
            return unexpected{error{error_code::internal_error,
                                    std::string("worker terminated abnormally: ") + e.what()}};
        }
    }

    auto report = progress_aggregator::aggregate(collected);

    CYMO_LOG_INFO(log_category::coordinator,
                  "Finished: " + std::to_string(report.succeeded_count) + "/" +
                      std::to_string(report.total_tasks) + " files uploaded, " +
                      std::to_string(report.failed_tasks.size()) + " failed");
    return report;
}

}  // namespace cymo
