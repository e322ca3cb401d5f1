/**
 * @file main.cpp
 * @brief cymo command line entry point
 */

#include <cymo/cli/cli_options.h>
#include <cymo/cymo.h>

#include <iostream>
#include <string>
#include <vector>

using namespace cymo;

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "cymo";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto options = cli::parse_arguments(args);
    if (!options) {
        std::cerr << "Error: " << options.error().message << "\n\n";
        cli::print_usage(std::cerr, program);
        return cli::exit_status::usage_error;
    }

    if (options.value().show_help) {
        cli::print_usage(std::cout, program);
        return cli::exit_status::success;
    }
    if (options.value().show_version) {
        std::cout << "cymo " << version::to_string() << std::endl;
        return cli::exit_status::success;
    }

    cli::configure_logger(options.value());

    auto config = cli::to_upload_config(options.value());
    if (!config) {
        std::cerr << "Error: " << config.error().message << "\n";
        return cli::exit_status::usage_error;
    }

    upload_coordinator coordinator(std::move(config.value()));
    auto report = coordinator.run();

    if (!report) {
        CYMO_LOG_FATAL(log_category::cli,
                       "Upload aborted: " + std::string(to_string(report.error().code)) + ": " +
                           report.error().message);
        get_logger().flush();
        std::cerr << "Error: " << report.error().message << std::endl;
        return cli::exit_status::setup_failed;
    }

    get_logger().flush();
    std::cout << cli::format_report(report.value()) << std::flush;
    return cli::exit_code_for(report.value());
}
