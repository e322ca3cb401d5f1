// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file ftp_session.h
 * @brief Boost.Asio implementation of ftp_session_interface
 */

#pragma once

#include "ftp_session_interface.h"

#include <chrono>
#include <cstddef>
#include <memory>

namespace cymo::protocol {

/**
 * @brief Session configuration
 */
struct ftp_session_config {
    /// Bound on every single network operation (resolve, connect, read, write)
    std::chrono::milliseconds operation_timeout{std::chrono::seconds(30)};

    /// Size of the chunks read from the source stream during STOR
    std::size_t transfer_buffer_size = 64 * 1024;

    /// Try EPSV before PASV
    bool use_epsv = true;
};

/**
 * @brief Blocking FTP client session over Boost.Asio
 *
 * Each session owns a private io_context and runs it on the calling thread
 * for the duration of one operation, bounded by operation_timeout. On timeout
 * the sockets are closed and the session becomes disconnected.
 *
 * Passive mode only. The data connection always targets the address of the
 * control connection's peer; the host announced in a PASV reply is ignored.
 *
 * @code
 * auto session = ftp_session::create();
 * if (session->connect({"ftp.example.org", 21}) &&
 *     session->authenticate({})) {
 *     std::ifstream file("index.html", std::ios::binary);
 *     auto sent = session->store("/www/index.html", file, transfer_mode::text);
 * }
 * @endcode
 */
class ftp_session : public ftp_session_interface {
public:
    [[nodiscard]] static auto create(const ftp_session_config& config = {})
        -> std::unique_ptr<ftp_session>;

    /**
     * @brief Factory producing sessions that share @p config
     */
    [[nodiscard]] static auto make_factory(const ftp_session_config& config = {})
        -> session_factory;

    ~ftp_session() override;

    ftp_session(const ftp_session&) = delete;
    auto operator=(const ftp_session&) -> ftp_session& = delete;

    [[nodiscard]] auto connect(const endpoint& server) -> result<void> override;
    [[nodiscard]] auto authenticate(const credentials& creds) -> result<void> override;
    [[nodiscard]] auto make_directory(const std::string& path) -> result<void> override;
    [[nodiscard]] auto change_directory(const std::string& path) -> result<void> override;
    [[nodiscard]] auto current_directory() -> result<std::string> override;
    [[nodiscard]] auto store(const std::string& remote_path, std::istream& source,
                             transfer_mode mode) -> result<uint64_t> override;
    [[nodiscard]] auto quit() -> result<void> override;
    [[nodiscard]] auto is_connected() const -> bool override;
    [[nodiscard]] auto welcome_message() const -> std::string override;

    [[nodiscard]] auto config() const -> const ftp_session_config&;

private:
    explicit ftp_session(const ftp_session_config& config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace cymo::protocol
