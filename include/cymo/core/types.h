/**
 * @file types.h
 * @brief Core type definitions for cymo
 */

#ifndef CYMO_CORE_TYPES_H
#define CYMO_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace cymo {

/**
 * @brief Error codes for upload operations
 */
enum class error_code {
    success = 0,

    // Local file errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    file_read_error = -102,
    invalid_file_path = -103,

    // Configuration errors (-140 to -159)
    invalid_configuration = -140,

    // Network errors (-160 to -179)
    connection_failed = -160,
    connection_timeout = -161,
    connection_refused = -162,
    connection_lost = -163,
    not_connected = -164,

    // Protocol errors (-180 to -199)
    protocol_error = -180,
    authentication_failed = -181,
    directory_already_exists = -182,
    directory_create_failed = -183,
    directory_not_found = -184,
    transfer_rejected = -185,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_refused:
            return "connection refused";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::not_connected:
            return "not connected";
        case error_code::protocol_error:
            return "protocol error";
        case error_code::authentication_failed:
            return "authentication failed";
        case error_code::directory_already_exists:
            return "directory already exists";
        case error_code::directory_create_failed:
            return "directory creation failed";
        case error_code::directory_not_found:
            return "directory not found";
        case error_code::transfer_rejected:
            return "transfer rejected";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief How far an error propagates during a run
 *
 * - fatal_setup: aborts the run before any worker starts
 * - directory: fails every task below the directory within one worker
 * - transfer: retried per file, then recorded as a failed task
 */
enum class error_kind {
    none,
    fatal_setup,
    directory,
    transfer
};

[[nodiscard]] constexpr auto error_kind_of(error_code code) -> error_kind {
    switch (code) {
        case error_code::success:
        case error_code::directory_already_exists:
            return error_kind::none;
        case error_code::file_not_found:
        case error_code::file_access_denied:
        case error_code::invalid_configuration:
        case error_code::connection_failed:
        case error_code::connection_refused:
        case error_code::authentication_failed:
        case error_code::internal_error:
            return error_kind::fatal_setup;
        case error_code::directory_create_failed:
        case error_code::directory_not_found:
            return error_kind::directory;
        default:
            return error_kind::transfer;
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an error, in the manner of
 * std::expected (C++23).
 */
template <typename T>
class result {
public:
    using value_type = T;

    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    using value_type = void;

    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Network endpoint of the FTP server
 */
struct endpoint {
    std::string host;
    uint16_t port = 21;

    endpoint() = default;
    endpoint(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

    [[nodiscard]] auto to_string() const -> std::string {
        return host + ":" + std::to_string(port);
    }
};

/**
 * @brief Login credentials; both fields empty means anonymous login
 */
struct credentials {
    std::string username;
    std::string password;

    [[nodiscard]] auto is_anonymous() const noexcept -> bool {
        return username.empty();
    }
};

}  // namespace cymo

#endif  // CYMO_CORE_TYPES_H
