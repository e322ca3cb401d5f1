/**
 * @file upload_config.cpp
 * @brief Implementation of upload_config::builder
 */

#include <cymo/upload/upload_config.h>

#include <cymo/core/remote_path.h>

namespace cymo {

upload_config::builder::builder() = default;

auto upload_config::builder::with_remote_path(std::string path) -> builder& {
    config_.remote_path = std::move(path);
    return *this;
}

auto upload_config::builder::with_local_path(std::filesystem::path path) -> builder& {
    config_.local_path = std::move(path);
    return *this;
}

auto upload_config::builder::with_server(std::string host, uint16_t port) -> builder& {
    config_.server = endpoint{std::move(host), port};
    return *this;
}

auto upload_config::builder::with_port(uint16_t port) -> builder& {
    config_.server.port = port;
    return *this;
}

auto upload_config::builder::with_credentials(std::string username, std::string password)
    -> builder& {
    username_ = std::move(username);
    password_ = std::move(password);
    return *this;
}

auto upload_config::builder::with_username(std::string username) -> builder& {
    username_ = std::move(username);
    return *this;
}

auto upload_config::builder::with_password(std::string password) -> builder& {
    password_ = std::move(password);
    return *this;
}

auto upload_config::builder::with_retry_limit(std::size_t limit) -> builder& {
    config_.retry_limit = limit;
    return *this;
}

auto upload_config::builder::with_thread_count(std::size_t count) -> builder& {
    config_.thread_count = count;
    return *this;
}

auto upload_config::builder::with_files_per_worker(std::size_t count) -> builder& {
    config_.files_per_worker = count;
    return *this;
}

auto upload_config::builder::with_operation_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.operation_timeout = timeout;
    return *this;
}

auto upload_config::builder::with_sniff_bytes(std::size_t bytes) -> builder& {
    config_.sniff_bytes = bytes;
    return *this;
}

auto upload_config::builder::build() -> result<upload_config> {
    auto invalid = [](std::string message) {
        return unexpected{error{error_code::invalid_configuration, std::move(message)}};
    };

    if (config_.server.host.empty()) {
        return invalid("server address is required");
    }
    if (config_.server.port == 0) {
        return invalid("port must be between 1 and 65535");
    }
    if (config_.local_path.empty()) {
        return invalid("local path is required");
    }
    if (config_.remote_path.empty()) {
        return invalid("remote path is required");
    }
    if (username_.has_value() != password_.has_value()) {
        return invalid(username_ ? "password is required when a username is given"
                                 : "username is required when a password is given");
    }
    if (username_ && username_->empty()) {
        return invalid("username must not be empty");
    }
    if (config_.thread_count && *config_.thread_count == 0) {
        return invalid("thread count must be at least 1");
    }
    if (config_.files_per_worker == 0) {
        return invalid("files per worker must be at least 1");
    }
    if (config_.operation_timeout.count() <= 0) {
        return invalid("operation timeout must be positive");
    }
    if (config_.sniff_bytes == 0) {
        return invalid("sniff size must be at least 1 byte");
    }

    upload_config config = config_;
    config.remote_path = clean_remote_path(config_.remote_path);
    if (username_) {
        config.login = credentials{*username_, *password_};
    }
    return config;
}

}  // namespace cymo
