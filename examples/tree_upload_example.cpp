/**
 * @file tree_upload_example.cpp
 * @brief Upload a generated directory tree with several FTP sessions
 *
 * This example demonstrates:
 * - Building an upload_config with the fluent builder
 * - Choosing the worker count explicitly or leaving it to the partitioner
 * - Observing per-file results through the logger callback
 * - Reading the final run report
 */

#include <cymo/cli/cli_options.h>
#include <cymo/cymo.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace cymo;

namespace {

/**
 * @brief Create a small tree with text and binary files
 */
void create_demo_tree(const std::filesystem::path& root, std::size_t files_per_dir) {
    std::cout << "Creating demo tree in " << root << "..." << std::endl;

    for (const char* dir : {"", "docs", "docs/archive", "assets"}) {
        auto directory = root / dir;
        std::filesystem::create_directories(directory);

        for (std::size_t i = 0; i < files_per_dir; ++i) {
            auto stem = "file_" + std::to_string(i + 1);
            std::ofstream text(directory / (stem + ".txt"));
            text << "line one of " << stem << "\nline two\n";

            std::ofstream binary(directory / (stem + ".bin"), std::ios::binary);
            std::vector<char> bytes(1024 * (i + 1));
            for (std::size_t b = 0; b < bytes.size(); ++b) {
                bytes[b] = static_cast<char>(b % 256);
            }
            binary.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        }
    }
    std::cout << std::endl;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Tree Upload Example - cymo" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " <server> <port> <remote-dir> [threads]" << std::endl;
    std::cout << std::endl;
    std::cout << "Logs in anonymously and uploads a generated tree to <remote-dir>." << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 64;
    }

    const std::string server = argv[1];
    const auto port = static_cast<uint16_t>(std::stoi(argv[2]));
    const std::string remote = argv[3];

    auto local_root = std::filesystem::temp_directory_path() / "cymo_tree_upload_example";
    create_demo_tree(local_root, 3);

    get_logger().initialize();
    get_logger().set_level(log_level::info);
    get_logger().set_callback([](log_level level, std::string_view category,
                                 std::string_view message, const upload_log_context* ctx) {
        if (category != log_category::worker || level < log_level::info || !ctx ||
            ctx->remote_path.empty()) {
            return;
        }
        std::cout << "  [worker " << ctx->worker_index.value_or(0) << "] " << message << ": "
                  << ctx->remote_path << std::endl;
    });

    upload_config::builder builder;
    builder.with_server(server, port).with_local_path(local_root).with_remote_path(remote);
    if (argc > 4) {
        builder.with_thread_count(static_cast<std::size_t>(std::stoi(argv[4])));
    }

    auto config = builder.build();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 64;
    }

    upload_coordinator coordinator(config.value());
    auto report = coordinator.run();
    if (!report) {
        std::cerr << "Upload could not start: " << report.error().message << std::endl;
        return 2;
    }

    std::cout << std::endl << cli::format_report(report.value());

    std::error_code ec;
    std::filesystem::remove_all(local_root, ec);

    return cli::exit_code_for(report.value());
}
