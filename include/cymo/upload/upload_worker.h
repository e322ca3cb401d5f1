/**
 * @file upload_worker.h
 * @brief One upload worker: one session, one shard
 */

#ifndef CYMO_UPLOAD_UPLOAD_WORKER_H
#define CYMO_UPLOAD_UPLOAD_WORKER_H

#include "progress_aggregator.h"
#include "remote_directory_registry.h"
#include "upload_types.h"

#include <cymo/core/content_classifier.h>
#include <cymo/core/transfer_types.h>
#include <cymo/core/types.h>
#include <cymo/protocol/ftp_session_interface.h>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cymo {

/**
 * @brief Settings shared by all workers of a run
 */
struct upload_worker_config {
    endpoint server;
    credentials login;
    std::size_t retry_limit = 3;
    std::size_t sniff_bytes = default_sniff_bytes;
};

/**
 * @brief Uploads one shard over a private session
 *
 * run() connects, then walks the shard in order:
 * - directory task: ensure it and its ancestors; a failure is remembered so
 *   that every later file below it fails without a network call
 * - file task: ensure the parent chain, classify the first sniff_bytes, STOR
 *   with retry_limit + 1 attempts at most, reconnecting between attempts when
 *   the session dropped
 *
 * A failing file never stops the shard. When the initial connection or login
 * fails every file task of the shard is reported failed with that error.
 */
class upload_worker {
public:
    upload_worker(std::size_t worker_index,
                  shard tasks,
                  upload_worker_config config,
                  protocol::session_factory factory,
                  remote_directory_registry& registry,
                  live_progress* progress = nullptr);

    upload_worker(const upload_worker&) = delete;
    auto operator=(const upload_worker&) -> upload_worker& = delete;
    upload_worker(upload_worker&&) noexcept = default;

    /**
     * @brief Drain the shard; call once
     */
    [[nodiscard]] auto run() -> worker_report;

    [[nodiscard]] auto worker_index() const noexcept -> std::size_t { return worker_index_; }

private:
    auto open_session() -> result<void>;
    void close_session();
    void process_directory(const transfer_task& task);
    auto process_file(const transfer_task& task) -> upload_outcome;
    auto upload_once(const transfer_task& task, transfer_mode mode) -> result<uint64_t>;
    auto choose_mode(const transfer_task& task) -> result<transfer_mode>;
    auto failed_ancestor(const std::string& remote_path) const -> const error*;
    void record(const upload_outcome& outcome);

    std::size_t worker_index_;
    shard tasks_;
    upload_worker_config config_;
    protocol::session_factory factory_;
    remote_directory_registry* registry_;
    live_progress* progress_;

    std::unique_ptr<protocol::ftp_session_interface> session_;
    std::unique_ptr<content_classifier> classifier_;
    std::vector<std::pair<std::string, error>> failed_directories_;
};

}  // namespace cymo

#endif  // CYMO_UPLOAD_UPLOAD_WORKER_H
