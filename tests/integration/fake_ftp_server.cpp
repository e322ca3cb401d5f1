/**
 * @file fake_ftp_server.cpp
 * @brief Blocking Boost.Asio implementation of the test FTP server
 */

#include "fake_ftp_server.h"

#include <cymo/core/remote_path.h>

#include <utility>

#include <boost/asio.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <istream>

namespace cymo::test {

namespace asio = boost::asio;
using asio::ip::tcp;

namespace {

constexpr auto data_accept_timeout = std::chrono::seconds(5);

struct session_state {
    std::string user;
    bool logged_in = false;
    std::string cwd = "/";
    transfer_mode type = transfer_mode::text;  // RFC 959 default is ASCII
    std::unique_ptr<tcp::acceptor> passive;
};

void send_reply(tcp::socket& socket, const std::string& text) {
    std::string wire = text + "\r\n";
    boost::system::error_code ignored;
    asio::write(socket, asio::buffer(wire), ignored);
}

auto resolve(const std::string& cwd, const std::string& argument) -> std::string {
    if (!argument.empty() && argument.front() == '/') {
        return normalize_remote_path(argument);
    }
    return join_remote_path(cwd, argument);
}

auto quote(const std::string& path) -> std::string {
    std::string quoted = "\"";
    for (char c : path) {
        quoted += c;
        if (c == '"') {
            quoted += '"';
        }
    }
    return quoted + "\"";
}

}  // namespace

struct fake_ftp_server::impl {
    asio::io_context io;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread accept_thread;
    std::atomic<bool> stopping{false};
    uint16_t port = 0;

    mutable std::mutex mutex;
    std::optional<std::pair<std::string, std::string>> required_login;
    bool epsv_enabled = false;
    bool multiline_welcome = false;
    bool mute = false;
    std::set<std::string> directories{"/"};
    std::set<std::string> denied;
    std::map<std::string, std::size_t> store_failures;
    std::map<std::string, std::string> files;
    std::map<std::string, transfer_mode> types;
    std::map<std::string, std::size_t> mkd_counts;
    std::map<std::string, std::size_t> store_counts;
    std::size_t connections = 0;
    std::size_t quits = 0;
    std::vector<std::string> command_log;

    std::mutex clients_mutex;
    std::vector<std::shared_ptr<tcp::socket>> clients;
    std::vector<std::thread> client_threads;

    void accept_loop() {
        for (;;) {
            auto socket = std::make_shared<tcp::socket>(io);
            boost::system::error_code ec;
            acceptor->accept(*socket, ec);
            if (stopping || ec) {
                return;
            }

            std::lock_guard lock(clients_mutex);
            clients.push_back(socket);
            client_threads.emplace_back([this, socket]() { serve(*socket); });
        }
    }

    void serve(tcp::socket& socket) {
        bool silent = false;
        {
            std::lock_guard lock(mutex);
            ++connections;
            silent = mute;
        }

        if (silent) {
            std::array<char, 256> sink{};
            boost::system::error_code ec;
            while (!ec) {
                socket.read_some(asio::buffer(sink), ec);
            }
            return;
        }

        bool multiline = false;
        {
            std::lock_guard lock(mutex);
            multiline = multiline_welcome;
        }
        if (multiline) {
            send_reply(socket, "220-Welcome to the cymo test server");
            send_reply(socket, "   Uploads are kept in memory");
            send_reply(socket, "220 Ready");
        } else {
            send_reply(socket, "220 cymo test server ready");
        }

        session_state state;
        asio::streambuf buffer;
        for (;;) {
            boost::system::error_code ec;
            asio::read_until(socket, buffer, "\r\n", ec);
            if (ec) {
                break;
            }

            std::istream stream(&buffer);
            std::string line;
            std::getline(stream, line);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            {
                std::lock_guard lock(mutex);
                command_log.push_back(line);
            }

            auto space = line.find(' ');
            std::string verb = line.substr(0, space);
            std::string argument = space == std::string::npos ? "" : line.substr(space + 1);
            std::transform(verb.begin(), verb.end(), verb.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

            if (!handle(socket, state, verb, argument)) {
                break;
            }
        }

        boost::system::error_code ignored;
        socket.close(ignored);
    }

    auto handle(tcp::socket& socket, session_state& state, const std::string& verb,
                const std::string& argument) -> bool {
        if (verb == "QUIT") {
            {
                std::lock_guard lock(mutex);
                ++quits;
            }
            send_reply(socket, "221 Goodbye");
            return false;
        }
        if (verb == "NOOP") {
            send_reply(socket, "200 NOOP ok");
            return true;
        }
        if (verb == "USER") {
            state.user = argument;
            state.logged_in = false;
            send_reply(socket, "331 Password required for " + argument);
            return true;
        }
        if (verb == "PASS") {
            bool accepted = false;
            {
                std::lock_guard lock(mutex);
                accepted = !required_login || (required_login->first == state.user &&
                                               required_login->second == argument);
            }
            state.logged_in = accepted;
            send_reply(socket, accepted ? "230 Logged in" : "530 Login incorrect");
            return true;
        }

        if (!state.logged_in) {
            send_reply(socket, "530 Please login with USER and PASS");
            return true;
        }

        if (verb == "PWD") {
            send_reply(socket, "257 " + quote(state.cwd) + " is the current directory");
        } else if (verb == "CWD") {
            auto path = resolve(state.cwd, argument);
            bool exists = false;
            {
                std::lock_guard lock(mutex);
                exists = directories.count(path) > 0;
            }
            if (exists) {
                state.cwd = path;
                send_reply(socket, "250 Directory changed to " + path);
            } else {
                send_reply(socket, "550 " + path + ": No such file or directory");
            }
        } else if (verb == "MKD") {
            send_reply(socket, make_directory(resolve(state.cwd, argument)));
        } else if (verb == "TYPE") {
            if (argument == "I" || argument == "L 8") {
                state.type = transfer_mode::binary;
                send_reply(socket, "200 Type set to I");
            } else if (argument == "A" || argument == "A N") {
                state.type = transfer_mode::text;
                send_reply(socket, "200 Type set to A");
            } else {
                send_reply(socket, "504 Type not supported");
            }
        } else if (verb == "EPSV") {
            bool enabled = false;
            {
                std::lock_guard lock(mutex);
                enabled = epsv_enabled;
            }
            if (!enabled) {
                send_reply(socket, "502 EPSV not implemented");
            } else {
                auto data_port = open_passive(state);
                send_reply(socket, "229 Entering Extended Passive Mode (|||" +
                                       std::to_string(data_port) + "|)");
            }
        } else if (verb == "PASV") {
            auto data_port = open_passive(state);
            send_reply(socket, "227 Entering Passive Mode (127,0,0,1," +
                                   std::to_string(data_port / 256) + "," +
                                   std::to_string(data_port % 256) + ")");
        } else if (verb == "STOR") {
            store(socket, state, resolve(state.cwd, argument));
        } else {
            send_reply(socket, "502 Command not implemented");
        }
        return true;
    }

    auto make_directory(const std::string& path) -> std::string {
        std::lock_guard lock(mutex);
        ++mkd_counts[path];
        if (directories.count(path) > 0) {
            return "550 " + path + ": File exists";
        }
        if (denied.count(path) > 0 || directories.count(remote_parent(path)) == 0) {
            return "550 " + path + ": Permission denied";
        }
        directories.insert(path);
        return "257 " + quote(path) + " created";
    }

    auto open_passive(session_state& state) -> uint16_t {
        state.passive = std::make_unique<tcp::acceptor>(
            io, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
        return state.passive->local_endpoint().port();
    }

    auto accept_data(tcp::acceptor& passive, tcp::socket& data) -> bool {
        boost::system::error_code ec;
        passive.non_blocking(true, ec);
        const auto deadline = std::chrono::steady_clock::now() + data_accept_timeout;
        while (!stopping && std::chrono::steady_clock::now() < deadline) {
            passive.accept(data, ec);
            if (!ec) {
                data.non_blocking(false, ec);
                return true;
            }
            if (ec != asio::error::would_block && ec != asio::error::try_again) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return false;
    }

    void store(tcp::socket& socket, session_state& state, const std::string& path) {
        if (!state.passive) {
            send_reply(socket, "425 Use PASV or EPSV first");
            return;
        }
        auto passive = std::move(state.passive);

        bool scripted_failure = false;
        bool parent_missing = false;
        {
            std::lock_guard lock(mutex);
            ++store_counts[path];
            auto failure = store_failures.find(path);
            if (failure != store_failures.end() && failure->second > 0) {
                --failure->second;
                scripted_failure = true;
            } else if (directories.count(remote_parent(path)) == 0) {
                parent_missing = true;
            }
        }
        if (scripted_failure) {
            send_reply(socket, "451 Requested action aborted: local error in processing");
            return;
        }
        if (parent_missing) {
            send_reply(socket, "553 " + path + ": No such directory");
            return;
        }

        send_reply(socket, "150 Opening data connection for " + path);

        tcp::socket data(io);
        if (!accept_data(*passive, data)) {
            send_reply(socket, "425 Can't open data connection");
            return;
        }

        std::string content;
        std::array<char, 8192> chunk{};
        boost::system::error_code ec;
        for (;;) {
            auto count = data.read_some(asio::buffer(chunk), ec);
            content.append(chunk.data(), count);
            if (ec) {
                break;
            }
        }
        if (ec != asio::error::eof) {
            send_reply(socket, "426 Connection closed; transfer aborted");
            return;
        }

        {
            std::lock_guard lock(mutex);
            files[path] = std::move(content);
            types[path] = state.type;
        }
        send_reply(socket, "226 Transfer complete");
    }
};

fake_ftp_server::fake_ftp_server() : impl_(std::make_unique<impl>()) {}

fake_ftp_server::~fake_ftp_server() {
    stop();
}

auto fake_ftp_server::start() -> uint16_t {
    impl_->acceptor = std::make_unique<tcp::acceptor>(
        impl_->io, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    port_ = impl_->acceptor->local_endpoint().port();
    impl_->port = port_;
    impl_->accept_thread = std::thread([this]() { impl_->accept_loop(); });
    return port_;
}

void fake_ftp_server::stop() {
    if (!impl_->acceptor) {
        return;
    }
    bool expected = false;
    if (!impl_->stopping.compare_exchange_strong(expected, true)) {
        return;
    }

    // Wake the blocking accept()
    {
        tcp::socket waker(impl_->io);
        boost::system::error_code ignored;
        waker.connect(tcp::endpoint(asio::ip::address_v4::loopback(), impl_->port), ignored);
    }
    if (impl_->accept_thread.joinable()) {
        impl_->accept_thread.join();
    }

    boost::system::error_code ignored;
    impl_->acceptor->close(ignored);

    std::vector<std::thread> threads;
    {
        std::lock_guard lock(impl_->clients_mutex);
        for (auto& client : impl_->clients) {
            client->shutdown(tcp::socket::shutdown_both, ignored);
        }
        threads = std::move(impl_->client_threads);
    }
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void fake_ftp_server::require_login(std::string username, std::string password) {
    std::lock_guard lock(impl_->mutex);
    impl_->required_login = std::make_pair(std::move(username), std::move(password));
}

void fake_ftp_server::set_epsv_enabled(bool enabled) {
    std::lock_guard lock(impl_->mutex);
    impl_->epsv_enabled = enabled;
}

void fake_ftp_server::set_multiline_welcome(bool enabled) {
    std::lock_guard lock(impl_->mutex);
    impl_->multiline_welcome = enabled;
}

void fake_ftp_server::set_mute(bool mute) {
    std::lock_guard lock(impl_->mutex);
    impl_->mute = mute;
}

void fake_ftp_server::add_directory(const std::string& path) {
    std::lock_guard lock(impl_->mutex);
    impl_->directories.insert(normalize_remote_path(path));
}

void fake_ftp_server::deny_directory(const std::string& path) {
    std::lock_guard lock(impl_->mutex);
    impl_->denied.insert(normalize_remote_path(path));
}

void fake_ftp_server::fail_store(const std::string& path, std::size_t times) {
    std::lock_guard lock(impl_->mutex);
    impl_->store_failures[path] = times;
}

auto fake_ftp_server::has_directory(const std::string& path) const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->directories.count(normalize_remote_path(path)) > 0;
}

auto fake_ftp_server::has_file(const std::string& path) const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->files.count(path) > 0;
}

auto fake_ftp_server::file_content(const std::string& path) const -> std::string {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->files.find(path);
    return it == impl_->files.end() ? std::string{} : it->second;
}

auto fake_ftp_server::file_type(const std::string& path) const
    -> std::optional<transfer_mode> {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->types.find(path);
    if (it == impl_->types.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto fake_ftp_server::mkd_count(const std::string& path) const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->mkd_counts.find(normalize_remote_path(path));
    return it == impl_->mkd_counts.end() ? 0 : it->second;
}

auto fake_ftp_server::store_count(const std::string& path) const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->store_counts.find(path);
    return it == impl_->store_counts.end() ? 0 : it->second;
}

auto fake_ftp_server::connection_count() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->connections;
}

auto fake_ftp_server::quit_count() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->quits;
}

auto fake_ftp_server::commands() const -> std::vector<std::string> {
    std::lock_guard lock(impl_->mutex);
    return impl_->command_log;
}

}  // namespace cymo::test
