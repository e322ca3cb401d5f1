/**
 * @file cli_options.cpp
 * @brief Implementation of the cymo command line layer
 */

#include <cymo/cli/cli_options.h>

#include <charconv>
#include <iomanip>
#include <limits>
#include <sstream>

namespace cymo::cli {

namespace {

auto usage_error(std::string message) -> unexpected {
    return unexpected{error{error_code::invalid_configuration, std::move(message)}};
}

auto parse_count(const std::string& option, const std::string& text, std::size_t min_value,
                 std::size_t max_value) -> result<std::size_t> {
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return usage_error(option + " expects a number, got '" + text + "'");
    }
    if (value < min_value || value > max_value) {
        return usage_error(option + " must be between " + std::to_string(min_value) + " and " +
                           std::to_string(max_value));
    }
    return value;
}

}  // namespace

auto parse_arguments(const std::vector<std::string>& args) -> result<cli_options> {
    cli_options options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        std::optional<std::string> inline_value;

        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        auto next_value = [&]() -> result<std::string> {
            if (inline_value) {
                return *inline_value;
            }
            if (i + 1 >= args.size()) {
                return usage_error(arg + " requires an argument");
            }
            return args[++i];
        };

        auto take_count = [&](std::size_t min_value, std::size_t max_value)
            -> result<std::size_t> {
            auto value = next_value();
            if (!value) {
                return unexpected{value.error()};
            }
            return parse_count(arg, value.value(), min_value, max_value);
        };

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "-V" || arg == "--version") {
            options.show_version = true;
        } else if (arg == "--log-json") {
            options.log_json = true;
        } else if (arg == "--mask-logs") {
            options.mask_logs = true;
        } else if (arg == "-r" || arg == "--remote-path" || arg == "-l" || arg == "--local-path" ||
                   arg == "-s" || arg == "--server" || arg == "-u" || arg == "--username" ||
                   arg == "-p" || arg == "--password" || arg == "--log-level") {
            auto value = next_value();
            if (!value) {
                return unexpected{value.error()};
            }
            if (arg == "-r" || arg == "--remote-path") {
                options.remote_path = value.value();
            } else if (arg == "-l" || arg == "--local-path") {
                options.local_path = value.value();
            } else if (arg == "-s" || arg == "--server") {
                options.server = value.value();
            } else if (arg == "-u" || arg == "--username") {
                options.username = value.value();
            } else if (arg == "-p" || arg == "--password") {
                options.password = value.value();
            } else {
                auto level = parse_log_level(value.value());
                if (!level) {
                    return usage_error("unknown log level '" + value.value() + "'");
                }
                options.level = *level;
            }
        } else if (arg == "--port") {
            auto value = take_count(1, std::numeric_limits<uint16_t>::max());
            if (!value) {
                return unexpected{value.error()};
            }
            options.port = static_cast<uint16_t>(value.value());
        } else if (arg == "--retry") {
            auto value = take_count(0, 1000);
            if (!value) {
                return unexpected{value.error()};
            }
            options.retry = value.value();
        } else if (arg == "-t" || arg == "--thread") {
            auto value = take_count(1, 1024);
            if (!value) {
                return unexpected{value.error()};
            }
            options.thread_count = value.value();
        } else if (arg == "--files-per-thread") {
            auto value = take_count(1, std::numeric_limits<std::size_t>::max());
            if (!value) {
                return unexpected{value.error()};
            }
            options.files_per_thread = value.value();
        } else if (arg == "--timeout") {
            auto value = take_count(1, 24 * 60 * 60);
            if (!value) {
                return unexpected{value.error()};
            }
            options.timeout_seconds = value.value();
        } else {
            return usage_error("unknown option '" + arg + "'");
        }
    }

    if (options.show_help || options.show_version) {
        return options;
    }

    if (options.remote_path.empty()) {
        return usage_error("missing required option -r/--remote-path");
    }
    if (options.local_path.empty()) {
        return usage_error("missing required option -l/--local-path");
    }
    if (options.server.empty()) {
        return usage_error("missing required option -s/--server");
    }
    return options;
}

auto to_upload_config(const cli_options& options) -> result<upload_config> {
    upload_config::builder builder;
    builder.with_remote_path(options.remote_path)
        .with_local_path(options.local_path)
        .with_server(options.server, options.port);

    if (options.username) {
        builder.with_username(*options.username);
    }
    if (options.password) {
        builder.with_password(*options.password);
    }
    if (options.retry) {
        builder.with_retry_limit(*options.retry);
    }
    if (options.thread_count) {
        builder.with_thread_count(*options.thread_count);
    }
    if (options.files_per_thread) {
        builder.with_files_per_worker(*options.files_per_thread);
    }
    if (options.timeout_seconds) {
        builder.with_operation_timeout(
            std::chrono::seconds(static_cast<long long>(*options.timeout_seconds)));
    }
    return builder.build();
}

void configure_logger(const cli_options& options) {
    auto& logger = get_logger();
    logger.initialize();
    logger.set_level(options.level);
    logger.set_output_format(options.log_json ? log_output_format::json
                                              : log_output_format::text);
    logger.set_masking_config(options.mask_logs ? masking_config::all_masked()
                                                : masking_config{});
}

void print_usage(std::ostream& out, const std::string& program) {
    out << "cymo - multi-threaded FTP upload tool\n"
        << "\n"
        << "Usage: " << program << " -r <remote> -l <local> -s <server> [options]\n"
        << "\n"
        << "Options:\n"
        << "  -r, --remote-path <path>  Remote directory to upload into\n"
        << "  -l, --local-path <path>   Local file or directory to upload\n"
        << "  -s, --server <host>       FTP server address or hostname\n"
        << "  -u, --username <name>     Login name (anonymous when omitted)\n"
        << "  -p, --password <secret>   Login password\n"
        << "      --port <port>         Server port (default: 21)\n"
        << "      --retry <n>           Extra attempts per file (default: 3)\n"
        << "  -t, --thread <n>          Number of upload sessions (default: auto)\n"
        << "      --files-per-thread <n> Files per session when auto-sizing (default: 4)\n"
        << "      --timeout <seconds>   Per-operation network timeout (default: 30)\n"
        << "      --log-level <level>   trace, debug, info, warn, error, fatal (default: info)\n"
        << "      --log-json            Write log records as JSON\n"
        << "      --mask-logs           Mask addresses and paths in log output\n"
        << "  -h, --help                Show this help message\n"
        << "  -V, --version             Show version\n"
        << "\n"
        << "Examples:\n"
        << "  " << program << " -r /ftp/upload -l /local/files -s ftp.example.com\n"
        << "  " << program << " -r /ftp/upload -l /local/files -s ftp.example.com -u me -p secret\n";
}

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto format_rate(double bytes_per_second) -> std::string {
    return format_bytes(static_cast<uint64_t>(bytes_per_second)) + "/s";
}

auto format_duration(std::chrono::milliseconds duration) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << std::chrono::duration<double>(duration).count() << " s";
    return oss.str();
}

auto format_report(const run_report& report) -> std::string {
    std::ostringstream oss;
    oss << "Total files:  " << report.total_tasks << "\n"
        << "Succeeded:    " << report.succeeded_count << "\n"
        << "Failed:       " << report.failed_tasks.size() << "\n"
        << "Transferred:  " << format_bytes(report.total_bytes) << " (" << report.total_bytes
        << " bytes)\n"
        << "Elapsed:      " << format_duration(report.total_duration) << "\n"
        << "Speed:        " << format_rate(report.average_speed) << "\n";

    if (!report.failed_tasks.empty()) {
        oss << "Failed files:\n";
        for (const auto& path : report.failed_tasks) {
            oss << "  " << path << "\n";
        }
    }
    return oss.str();
}

auto exit_code_for(const run_report& report) -> int {
    return report.is_success() ? exit_status::success : exit_status::upload_failed;
}

}  // namespace cymo::cli
