/**
 * @file upload_config.h
 * @brief Validated configuration of one upload run
 */

#ifndef CYMO_UPLOAD_UPLOAD_CONFIG_H
#define CYMO_UPLOAD_UPLOAD_CONFIG_H

#include <cymo/core/content_classifier.h>
#include <cymo/core/types.h>
#include <cymo/core/work_partitioner.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace cymo {

/**
 * @brief Everything the coordinator needs for a run
 *
 * Only obtainable through builder::build(), which validates it.
 *
 * @code
 * auto config = upload_config::builder()
 *     .with_server("ftp.example.org", 21)
 *     .with_local_path("./site")
 *     .with_remote_path("/www")
 *     .with_thread_count(4)
 *     .build();
 * @endcode
 */
struct upload_config {
    std::string remote_path = "/";
    std::filesystem::path local_path;
    endpoint server;
    credentials login;
    std::size_t retry_limit = 3;
    std::optional<std::size_t> thread_count;
    std::size_t files_per_worker = default_files_per_worker;
    std::chrono::milliseconds operation_timeout{std::chrono::seconds(30)};
    std::size_t sniff_bytes = default_sniff_bytes;

    class builder;
};

/**
 * @brief Validating builder for upload_config
 */
class upload_config::builder {
public:
    builder();

    auto with_remote_path(std::string path) -> builder&;
    auto with_local_path(std::filesystem::path path) -> builder&;
    auto with_server(std::string host, uint16_t port = 21) -> builder&;
    auto with_port(uint16_t port) -> builder&;

    /**
     * @brief Set login credentials; leave both unset for anonymous login
     */
    auto with_credentials(std::string username, std::string password) -> builder&;
    auto with_username(std::string username) -> builder&;
    auto with_password(std::string password) -> builder&;

    /**
     * @brief Additional attempts per file after the first (0 = no retry)
     */
    auto with_retry_limit(std::size_t limit) -> builder&;

    /**
     * @brief Fixed worker count; without it the count is derived from the task count
     */
    auto with_thread_count(std::size_t count) -> builder&;

    /**
     * @brief Tasks per worker used when deriving the worker count
     */
    auto with_files_per_worker(std::size_t count) -> builder&;

    auto with_operation_timeout(std::chrono::milliseconds timeout) -> builder&;
    auto with_sniff_bytes(std::size_t bytes) -> builder&;

    /**
     * @brief Validate and produce the configuration
     * @return invalid_configuration describing the first problem found
     */
    [[nodiscard]] auto build() -> result<upload_config>;

private:
    upload_config config_;
    std::optional<std::string> username_;
    std::optional<std::string> password_;
};

}  // namespace cymo

#endif  // CYMO_UPLOAD_UPLOAD_CONFIG_H
