/**
 * @file cli_options.h
 * @brief Command line parsing and report formatting for the cymo tool
 */

#ifndef CYMO_CLI_CLI_OPTIONS_H
#define CYMO_CLI_CLI_OPTIONS_H

#include <cymo/core/logging.h>
#include <cymo/core/types.h>
#include <cymo/upload/upload_config.h>
#include <cymo/upload/upload_types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cymo::cli {

/**
 * @brief Process exit statuses
 */
namespace exit_status {
inline constexpr int success = 0;
inline constexpr int upload_failed = 1;
inline constexpr int setup_failed = 2;
inline constexpr int usage_error = 64;
}  // namespace exit_status

/**
 * @brief Parsed command line
 */
struct cli_options {
    std::string remote_path;
    std::string local_path;
    std::string server;
    std::optional<std::string> username;
    std::optional<std::string> password;
    uint16_t port = 21;
    std::optional<std::size_t> retry;
    std::optional<std::size_t> thread_count;
    std::optional<std::size_t> files_per_thread;
    std::optional<std::size_t> timeout_seconds;

    log_level level = log_level::info;
    bool log_json = false;
    bool mask_logs = false;

    bool show_help = false;
    bool show_version = false;
};

/**
 * @brief Parse arguments (without the program name)
 *
 * Required options are only checked when neither -h nor -V was given.
 *
 * @return Options, or invalid_configuration describing the usage error
 */
[[nodiscard]] auto parse_arguments(const std::vector<std::string>& args) -> result<cli_options>;

/**
 * @brief Turn parsed options into a validated upload configuration
 */
[[nodiscard]] auto to_upload_config(const cli_options& options) -> result<upload_config>;

/**
 * @brief Apply level, output format and masking to the global logger
 */
void configure_logger(const cli_options& options);

void print_usage(std::ostream& out, const std::string& program);

[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;
[[nodiscard]] auto format_rate(double bytes_per_second) -> std::string;
[[nodiscard]] auto format_duration(std::chrono::milliseconds duration) -> std::string;

/**
 * @brief Human readable summary, one failed remote path per line at the end
 */
[[nodiscard]] auto format_report(const run_report& report) -> std::string;

/**
 * @brief success or upload_failed, from the report alone
 */
[[nodiscard]] auto exit_code_for(const run_report& report) -> int;

}  // namespace cymo::cli

#endif  // CYMO_CLI_CLI_OPTIONS_H
