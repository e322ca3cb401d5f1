/**
 * @file ftp_session.cpp
 * @brief Boost.Asio FTP session implementation
 */

#include "cymo/protocol/ftp_session.h"
#include "cymo/protocol/ftp_reply.h"
#include "cymo/core/logging.h"

#include <boost/asio.hpp>

#include <optional>
#include <vector>

namespace cymo::protocol {

namespace asio = boost::asio;
using asio::ip::tcp;

namespace {

/**
 * @brief Map a socket error to the cymo error taxonomy
 */
auto network_error(const boost::system::error_code& ec, std::string_view during,
                   error_code fallback) -> error {
    std::string message = std::string(during) + ": " + ec.message();

    if (ec == asio::error::timed_out) {
        return error{error_code::connection_timeout, std::string(during) + ": timed out"};
    }
    if (ec == asio::error::connection_refused) {
        return error{error_code::connection_refused, std::move(message)};
    }
    if (ec == asio::error::host_not_found || ec == asio::error::host_not_found_try_again ||
        ec == asio::error::host_unreachable || ec == asio::error::network_unreachable) {
        return error{error_code::connection_failed, std::move(message)};
    }
    if (ec == asio::error::eof || ec == asio::error::connection_reset ||
        ec == asio::error::broken_pipe || ec == asio::error::connection_aborted ||
        ec == asio::error::operation_aborted) {
        return error{error_code::connection_lost, std::move(message)};
    }
    return error{fallback, std::move(message)};
}

/**
 * @brief Rewrite bare LF as CRLF for TYPE A transfers
 */
void append_as_netascii(std::string_view chunk, char& previous, std::string& out) {
    for (char c : chunk) {
        if (c == '\n' && previous != '\r') {
            out += '\r';
        }
        out += c;
        previous = c;
    }
}

auto describe(const ftp_reply& reply) -> std::string {
    return std::to_string(reply.code) + " " + reply.text();
}

}  // namespace

struct ftp_session::impl {
    ftp_session_config config;

    asio::io_context io;
    tcp::socket control{io};
    tcp::socket data{io};
    asio::streambuf control_buffer;
    ftp_reply_parser parser;

    std::string welcome;
    std::string server_label;
    std::optional<transfer_mode> current_type;
    bool epsv_supported = true;

    explicit impl(const ftp_session_config& cfg) : config(cfg) {}

    void close_sockets() {
        boost::system::error_code ignored;
        if (data.is_open()) {
            data.close(ignored);
        }
        if (control.is_open()) {
            control.close(ignored);
        }
    }

    void reset_state() {
        close_sockets();
        control_buffer.consume(control_buffer.size());
        parser.reset();
        current_type.reset();
        epsv_supported = config.use_epsv;
    }

    /**
     * @brief Run the io_context until the started operation completes
     *
     * @p start initiates one asynchronous operation whose handler stores its
     * error code in the reference it receives. On timeout every socket is
     * closed and timed_out is returned.
     */
    template <typename Start>
    auto run_operation(Start&& start) -> boost::system::error_code {
        boost::system::error_code outcome = asio::error::would_block;
        start(outcome);

        io.restart();
        io.run_for(config.operation_timeout);

        if (!io.stopped()) {
            close_sockets();
            io.run();
            return asio::error::timed_out;
        }
        return outcome;
    }

    auto fail(error err) -> unexpected {
        if (err.code == error_code::connection_timeout || err.code == error_code::connection_lost) {
            close_sockets();
        }
        CYMO_LOG_DEBUG(log_category::protocol, server_label + " " + err.message);
        return unexpected{std::move(err)};
    }

    auto send_line(const std::string& line) -> result<void> {
        if (!control.is_open()) {
            return unexpected{error{error_code::not_connected, "control connection is closed"}};
        }

        CYMO_LOG_TRACE(log_category::protocol, server_label + " > " + line);

        std::string wire = line + "\r\n";
        auto ec = run_operation([&](boost::system::error_code& out) {
            asio::async_write(control, asio::buffer(wire),
                              [&out](const boost::system::error_code& e, std::size_t) {
                                  out = e;
                              });
        });
        if (ec) {
            return fail(network_error(ec, "sending command", error_code::connection_lost));
        }
        return {};
    }

    auto read_reply() -> result<ftp_reply> {
        if (!control.is_open()) {
            return unexpected{error{error_code::not_connected, "control connection is closed"}};
        }

        for (;;) {
            auto ec = run_operation([&](boost::system::error_code& out) {
                asio::async_read_until(control, control_buffer, "\r\n",
                                       [&out](const boost::system::error_code& e, std::size_t) {
                                           out = e;
                                       });
            });
            if (ec) {
                return fail(network_error(ec, "reading reply", error_code::connection_lost));
            }

            std::istream stream(&control_buffer);
            std::string line;
            std::getline(stream, line);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            auto fed = parser.feed(line);
            if (!fed) {
                return fail(fed.error());
            }
            if (fed.value()) {
                auto reply = std::move(*fed.value());
                CYMO_LOG_TRACE(log_category::protocol, server_label + " < " + describe(reply));
                if (reply.code == reply_code::service_not_available) {
                    return fail(error{error_code::connection_lost, describe(reply)});
                }
                return reply;
            }
        }
    }

    auto command(const std::string& line) -> result<ftp_reply> {
        auto sent = send_line(line);
        if (!sent) {
            return unexpected{sent.error()};
        }
        return read_reply();
    }

    auto set_type(transfer_mode mode) -> result<void> {
        if (current_type && *current_type == mode) {
            return {};
        }

        auto reply = command(mode == transfer_mode::binary ? "TYPE I" : "TYPE A");
        if (!reply) {
            return unexpected{reply.error()};
        }
        if (!reply.value().is_completion()) {
            return unexpected{error{error_code::protocol_error,
                                    "TYPE refused: " + describe(reply.value())}};
        }
        current_type = mode;
        return {};
    }

    auto request_passive_port() -> result<uint16_t> {
        if (epsv_supported) {
            auto reply = command("EPSV");
            if (!reply) {
                return unexpected{reply.error()};
            }
            if (reply.value().code == reply_code::entering_extended_passive) {
                auto address = parse_epsv_reply(reply.value().text());
                if (!address) {
                    return unexpected{address.error()};
                }
                return address.value().port;
            }
            CYMO_LOG_DEBUG(log_category::protocol,
                           server_label + " EPSV unsupported, falling back to PASV");
            epsv_supported = false;
        }

        auto reply = command("PASV");
        if (!reply) {
            return unexpected{reply.error()};
        }
        if (reply.value().code != reply_code::entering_passive) {
            return unexpected{error{error_code::protocol_error,
                                    "PASV refused: " + describe(reply.value())}};
        }
        auto address = parse_pasv_reply(reply.value().text());
        if (!address) {
            return unexpected{address.error()};
        }
        return address.value().port;
    }

    auto open_data_connection() -> result<void> {
        auto port = request_passive_port();
        if (!port) {
            return unexpected{port.error()};
        }

        boost::system::error_code ec;
        auto peer = control.remote_endpoint(ec);
        if (ec) {
            return fail(network_error(ec, "control peer address", error_code::connection_lost));
        }

        tcp::endpoint target(peer.address(), port.value());
        ec = run_operation([&](boost::system::error_code& out) {
            data.async_connect(target, [&out](const boost::system::error_code& e) { out = e; });
        });
        if (ec) {
            boost::system::error_code ignored;
            data.close(ignored);
            if (ec == asio::error::timed_out) {
                return fail(network_error(ec, "opening data connection",
                                          error_code::connection_lost));
            }
            return unexpected{network_error(ec, "opening data connection",
                                            error_code::connection_lost)};
        }
        return {};
    }

    auto write_data(std::string_view bytes) -> result<void> {
        auto ec = run_operation([&](boost::system::error_code& out) {
            asio::async_write(data, asio::buffer(bytes.data(), bytes.size()),
                              [&out](const boost::system::error_code& e, std::size_t) {
                                  out = e;
                              });
        });
        if (ec) {
            return fail(network_error(ec, "writing data", error_code::connection_lost));
        }
        return {};
    }

    auto send_stream(std::istream& source, transfer_mode mode) -> result<uint64_t> {
        std::vector<char> buffer(config.transfer_buffer_size);
        std::string converted;
        char previous = '\0';
        uint64_t bytes_read = 0;

        while (source) {
            source.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto count = static_cast<std::size_t>(source.gcount());
            if (source.bad()) {
                return unexpected{error{error_code::file_read_error,
                                        "reading local file failed"}};
            }
            if (count == 0) {
                break;
            }
            bytes_read += count;

            std::string_view chunk(buffer.data(), count);
            if (mode == transfer_mode::text) {
                converted.clear();
                append_as_netascii(chunk, previous, converted);
                chunk = converted;
            }

            auto written = write_data(chunk);
            if (!written) {
                return unexpected{written.error()};
            }
        }
        return bytes_read;
    }
};

ftp_session::ftp_session(const ftp_session_config& config)
    : impl_(std::make_unique<impl>(config)) {
    impl_->epsv_supported = config.use_epsv;
}

ftp_session::~ftp_session() {
    if (impl_) {
        impl_->close_sockets();
    }
}

auto ftp_session::create(const ftp_session_config& config) -> std::unique_ptr<ftp_session> {
    return std::unique_ptr<ftp_session>(new ftp_session(config));
}

auto ftp_session::make_factory(const ftp_session_config& config) -> session_factory {
    return [config]() -> std::unique_ptr<ftp_session_interface> {
        return ftp_session::create(config);
    };
}

auto ftp_session::config() const -> const ftp_session_config& {
    return impl_->config;
}

auto ftp_session::connect(const endpoint& server) -> result<void> {
    impl_->reset_state();
    impl_->server_label = "[" + server.to_string() + "]";

    // Name resolution is not cancellable and runs outside the operation timeout
    boost::system::error_code ec;
    tcp::resolver resolver(impl_->io);
    auto endpoints = resolver.resolve(server.host, std::to_string(server.port), ec);
    if (ec) {
        return impl_->fail(network_error(ec, "resolving " + server.host,
                                         error_code::connection_failed));
    }

    ec = impl_->run_operation([&](boost::system::error_code& out) {
        asio::async_connect(impl_->control, endpoints,
                            [&out](const boost::system::error_code& e, const tcp::endpoint&) {
                                out = e;
                            });
    });
    if (ec) {
        impl_->close_sockets();
        return impl_->fail(network_error(ec, "connecting to " + server.to_string(),
                                         error_code::connection_failed));
    }

    // 120 announces a delayed 220
    for (;;) {
        auto greeting = impl_->read_reply();
        if (!greeting) {
            return unexpected{greeting.error()};
        }
        if (greeting.value().is_preliminary()) {
            continue;
        }
        if (greeting.value().code != reply_code::service_ready) {
            impl_->close_sockets();
            return unexpected{error{error_code::connection_failed,
                                    "server refused session: " + describe(greeting.value())}};
        }
        impl_->welcome = greeting.value().text();
        break;
    }

    CYMO_LOG_DEBUG(log_category::protocol, impl_->server_label + " connected");
    return {};
}

auto ftp_session::authenticate(const credentials& creds) -> result<void> {
    const std::string user = creds.is_anonymous() ? "anonymous" : creds.username;
    const std::string pass = creds.is_anonymous() ? "anonymous@" : creds.password;

    auto reply = impl_->command("USER " + user);
    if (!reply) {
        return unexpected{reply.error()};
    }

    if (reply.value().code == reply_code::password_required) {
        reply = impl_->command("PASS " + pass);
        if (!reply) {
            return unexpected{reply.error()};
        }
    }

    if (!reply.value().is_completion()) {
        return unexpected{error{error_code::authentication_failed,
                                "login as " + user + " rejected: " + describe(reply.value())}};
    }

    CYMO_LOG_DEBUG(log_category::protocol, impl_->server_label + " logged in as " + user);
    return {};
}

auto ftp_session::make_directory(const std::string& path) -> result<void> {
    auto reply = impl_->command("MKD " + path);
    if (!reply) {
        return unexpected{reply.error()};
    }
    if (reply.value().is_completion()) {
        return {};
    }

    // Servers word "exists" differently; check with CWD instead of parsing text
    auto refusal = describe(reply.value());
    auto previous = current_directory();
    auto entered = change_directory(path);
    if (entered) {
        if (previous) {
            auto restored = change_directory(previous.value());
            if (!restored) {
                CYMO_LOG_WARN(log_category::protocol,
                              impl_->server_label + " could not return to " +
                                  previous.value() + ": " + restored.error().message);
            }
        }
        return unexpected{error{error_code::directory_already_exists, path}};
    }
    if (entered.error().code != error_code::directory_not_found) {
        return unexpected{entered.error()};
    }

    return unexpected{error{error_code::directory_create_failed,
                            "MKD " + path + " refused: " + refusal}};
}

auto ftp_session::change_directory(const std::string& path) -> result<void> {
    auto reply = impl_->command("CWD " + path);
    if (!reply) {
        return unexpected{reply.error()};
    }
    if (!reply.value().is_completion()) {
        return unexpected{error{error_code::directory_not_found,
                                "CWD " + path + " refused: " + describe(reply.value())}};
    }
    return {};
}

auto ftp_session::current_directory() -> result<std::string> {
    auto reply = impl_->command("PWD");
    if (!reply) {
        return unexpected{reply.error()};
    }
    if (reply.value().code != reply_code::path_created) {
        return unexpected{error{error_code::protocol_error,
                                "PWD refused: " + describe(reply.value())}};
    }
    return parse_quoted_path(reply.value().text());
}

auto ftp_session::store(const std::string& remote_path, std::istream& source,
                        transfer_mode mode) -> result<uint64_t> {
    auto typed = impl_->set_type(mode);
    if (!typed) {
        return unexpected{typed.error()};
    }

    auto opened = impl_->open_data_connection();
    if (!opened) {
        return unexpected{opened.error()};
    }

    auto reply = impl_->command("STOR " + remote_path);
    if (!reply) {
        return unexpected{reply.error()};
    }
    if (reply.value().code != reply_code::file_status_ok &&
        reply.value().code != reply_code::data_connection_open) {
        boost::system::error_code ignored;
        impl_->data.close(ignored);
        return unexpected{error{error_code::transfer_rejected,
                                "STOR " + remote_path + " refused: " +
                                    describe(reply.value())}};
    }

    auto sent = impl_->send_stream(source, mode);

    boost::system::error_code ignored;
    impl_->data.shutdown(tcp::socket::shutdown_send, ignored);
    impl_->data.close(ignored);

    auto completion = impl_->read_reply();
    if (!sent) {
        return unexpected{sent.error()};
    }
    if (!completion) {
        return unexpected{completion.error()};
    }
    if (completion.value().code != reply_code::transfer_complete &&
        completion.value().code != reply_code::file_action_ok) {
        return unexpected{error{error_code::transfer_rejected,
                                "STOR " + remote_path + " failed: " +
                                    describe(completion.value())}};
    }
    return sent.value();
}

auto ftp_session::quit() -> result<void> {
    if (!impl_->control.is_open()) {
        return {};
    }

    auto reply = impl_->command("QUIT");
    impl_->close_sockets();
    if (!reply) {
        return unexpected{reply.error()};
    }
    if (reply.value().code != reply_code::closing_control) {
        return unexpected{error{error_code::protocol_error,
                                "QUIT answered with " + describe(reply.value())}};
    }
    return {};
}

auto ftp_session::is_connected() const -> bool {
    return impl_->control.is_open();
}

auto ftp_session::welcome_message() const -> std::string {
    return impl_->welcome;
}

}  // namespace cymo::protocol
