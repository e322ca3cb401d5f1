// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file ftp_session_interface.h
 * @brief Abstract FTP session used by the upload workers
 *
 * Every worker owns exactly one session for its lifetime; sessions are never
 * shared between threads. Tests substitute scripted implementations through
 * session_factory.
 */

#pragma once

#include <cymo/core/transfer_types.h>
#include <cymo/core/types.h>

#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <string>

namespace cymo::protocol {

/**
 * @brief Stateful FTP control channel
 *
 * All operations block the calling thread and are bounded by the session's
 * operation timeout. A timed-out or broken connection leaves the session
 * disconnected (is_connected() == false) and reports connection_timeout or
 * connection_lost.
 */
class ftp_session_interface {
public:
    virtual ~ftp_session_interface() = default;

    /**
     * @brief Open the control connection and read the greeting
     * @return connection_refused, connection_timeout or connection_failed on error
     */
    [[nodiscard]] virtual auto connect(const endpoint& server) -> result<void> = 0;

    /**
     * @brief Log in; empty credentials log in anonymously
     * @return authentication_failed when the server rejects the login
     */
    [[nodiscard]] virtual auto authenticate(const credentials& creds) -> result<void> = 0;

    /**
     * @brief MKD
     * @return directory_already_exists when the directory is already present,
     *         directory_create_failed on any other refusal
     */
    [[nodiscard]] virtual auto make_directory(const std::string& path) -> result<void> = 0;

    /**
     * @brief CWD
     * @return directory_not_found when the server refuses
     */
    [[nodiscard]] virtual auto change_directory(const std::string& path) -> result<void> = 0;

    /**
     * @brief PWD
     */
    [[nodiscard]] virtual auto current_directory() -> result<std::string> = 0;

    /**
     * @brief STOR the content of @p source to @p remote_path
     * @return Number of bytes read from @p source, or transfer_rejected,
     *         file_read_error, connection_* on failure
     */
    [[nodiscard]] virtual auto store(const std::string& remote_path, std::istream& source,
                                     transfer_mode mode) -> result<uint64_t> = 0;

    /**
     * @brief QUIT and close the connection
     */
    [[nodiscard]] virtual auto quit() -> result<void> = 0;

    [[nodiscard]] virtual auto is_connected() const -> bool = 0;

    /**
     * @brief Text of the server greeting (empty before connect)
     */
    [[nodiscard]] virtual auto welcome_message() const -> std::string = 0;
};

/**
 * @brief Creates a fresh, unconnected session
 */
using session_factory = std::function<std::unique_ptr<ftp_session_interface>()>;

}  // namespace cymo::protocol
