/**
 * @file mock_ftp_session.h
 * @brief In-memory FTP server state and scripted sessions for unit tests
 */

#ifndef CYMO_TESTS_MOCK_FTP_SESSION_H
#define CYMO_TESTS_MOCK_FTP_SESSION_H

#include <cymo/core/remote_path.h>
#include <cymo/protocol/ftp_session_interface.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace cymo::test {

/**
 * @brief Remote file system shared by every mock session of a test
 */
class fake_remote_fs {
public:
    struct store_failure {
        std::size_t remaining = 0;  ///< SIZE_MAX fails forever
        error_code code = error_code::transfer_rejected;
        bool drop_connection = false;
    };

    fake_remote_fs() { directories_.insert("/"); }

    // -- scripting ------------------------------------------------------------

    void refuse_connections(bool refuse) {
        std::lock_guard lock(mutex_);
        refuse_connect_ = refuse;
    }

    void require_login(std::string username, std::string password) {
        std::lock_guard lock(mutex_);
        required_login_ = credentials{std::move(username), std::move(password)};
    }

    void deny_directory(const std::string& path) {
        std::lock_guard lock(mutex_);
        denied_directories_.insert(normalize_remote_path(path));
    }

    void add_directory(const std::string& path) {
        std::lock_guard lock(mutex_);
        directories_.insert(normalize_remote_path(path));
    }

    void fail_store(const std::string& path, std::size_t times,
                    error_code code = error_code::transfer_rejected,
                    bool drop_connection = false) {
        std::lock_guard lock(mutex_);
        store_failures_[path] = store_failure{times, code, drop_connection};
    }

    /// Login directory of every session; it and its ancestors exist
    void set_home(const std::string& path) {
        std::lock_guard lock(mutex_);
        home_ = normalize_remote_path(path);
        directories_.insert(home_);
        for (const auto& ancestor : remote_ancestors(home_)) {
            directories_.insert(ancestor);
        }
    }

    [[nodiscard]] auto home() const -> std::string {
        std::lock_guard lock(mutex_);
        return home_;
    }

    void set_mkd_delay(std::chrono::milliseconds delay) {
        std::lock_guard lock(mutex_);
        mkd_delay_ = delay;
    }

    // -- observation ----------------------------------------------------------

    [[nodiscard]] auto has_directory(const std::string& path) const -> bool {
        std::lock_guard lock(mutex_);
        return directories_.count(normalize_remote_path(path)) > 0;
    }

    [[nodiscard]] auto has_file(const std::string& path) const -> bool {
        std::lock_guard lock(mutex_);
        return files_.count(path) > 0;
    }

    [[nodiscard]] auto file_content(const std::string& path) const -> std::string {
        std::lock_guard lock(mutex_);
        auto it = files_.find(path);
        return it == files_.end() ? std::string{} : it->second;
    }

    [[nodiscard]] auto file_mode(const std::string& path) const -> transfer_mode {
        std::lock_guard lock(mutex_);
        auto it = modes_.find(path);
        return it == modes_.end() ? transfer_mode::binary : it->second;
    }

    [[nodiscard]] auto mkd_count(const std::string& path) const -> std::size_t {
        std::lock_guard lock(mutex_);
        auto it = mkd_counts_.find(normalize_remote_path(path));
        return it == mkd_counts_.end() ? 0 : it->second;
    }

    [[nodiscard]] auto total_mkd_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        std::size_t total = 0;
        for (const auto& [path, count] : mkd_counts_) {
            total += count;
        }
        return total;
    }

    [[nodiscard]] auto store_attempts(const std::string& path) const -> std::size_t {
        std::lock_guard lock(mutex_);
        auto it = store_attempts_.find(path);
        return it == store_attempts_.end() ? 0 : it->second;
    }

    [[nodiscard]] auto connect_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return connect_count_;
    }

    [[nodiscard]] auto quit_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return quit_count_;
    }

    // -- server behaviour -----------------------------------------------------

    auto on_connect() -> result<void> {
        std::lock_guard lock(mutex_);
        ++connect_count_;
        if (refuse_connect_) {
            return unexpected{error{error_code::connection_refused, "connection refused"}};
        }
        return {};
    }

    auto on_login(const credentials& creds) -> result<void> {
        std::lock_guard lock(mutex_);
        if (!required_login_) {
            return {};
        }
        if (creds.username != required_login_->username ||
            creds.password != required_login_->password) {
            return unexpected{error{error_code::authentication_failed, "530 Login incorrect"}};
        }
        return {};
    }

    auto on_mkd(const std::string& path) -> result<void> {
        std::chrono::milliseconds delay;
        {
            std::lock_guard lock(mutex_);
            ++mkd_counts_[path];
            delay = mkd_delay_;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        std::lock_guard lock(mutex_);
        if (directories_.count(path) > 0) {
            return unexpected{error{error_code::directory_already_exists, path}};
        }
        if (denied_directories_.count(path) > 0 ||
            directories_.count(remote_parent(path)) == 0) {
            return unexpected{error{error_code::directory_create_failed,
                                    "550 " + path + ": permission denied"}};
        }
        directories_.insert(path);
        return {};
    }

    auto on_cwd(const std::string& path) const -> result<void> {
        std::lock_guard lock(mutex_);
        if (directories_.count(normalize_remote_path(path)) == 0) {
            return unexpected{error{error_code::directory_not_found, "550 " + path}};
        }
        return {};
    }

    auto on_stor(const std::string& path, std::string content, transfer_mode mode,
                 bool& drop_connection) -> result<uint64_t> {
        std::lock_guard lock(mutex_);
        ++store_attempts_[path];

        auto failure = store_failures_.find(path);
        if (failure != store_failures_.end() && failure->second.remaining > 0) {
            if (failure->second.remaining != SIZE_MAX) {
                --failure->second.remaining;
            }
            drop_connection = failure->second.drop_connection;
            return unexpected{error{failure->second.code, "scripted failure for " + path}};
        }

        if (directories_.count(remote_parent(path)) == 0) {
            return unexpected{error{error_code::transfer_rejected,
                                    "553 no such directory for " + path}};
        }

        auto size = static_cast<uint64_t>(content.size());
        files_[path] = std::move(content);
        modes_[path] = mode;
        return size;
    }

    void on_quit() {
        std::lock_guard lock(mutex_);
        ++quit_count_;
    }

private:
    mutable std::mutex mutex_;
    std::set<std::string> directories_;
    std::set<std::string> denied_directories_;
    std::map<std::string, std::string> files_;
    std::map<std::string, transfer_mode> modes_;
    std::map<std::string, std::size_t> mkd_counts_;
    std::map<std::string, std::size_t> store_attempts_;
    std::map<std::string, store_failure> store_failures_;
    std::optional<credentials> required_login_;
    std::string home_ = "/";
    std::chrono::milliseconds mkd_delay_{0};
    bool refuse_connect_ = false;
    std::size_t connect_count_ = 0;
    std::size_t quit_count_ = 0;
};

/**
 * @brief ftp_session_interface backed by a fake_remote_fs
 */
class mock_ftp_session : public protocol::ftp_session_interface {
public:
    explicit mock_ftp_session(std::shared_ptr<fake_remote_fs> fs) : fs_(std::move(fs)) {}

    auto connect(const endpoint&) -> result<void> override {
        auto accepted = fs_->on_connect();
        if (!accepted) {
            connected_ = false;
            return accepted;
        }
        connected_ = true;
        logged_in_ = false;
        cwd_ = "/";
        return {};
    }

    auto authenticate(const credentials& creds) -> result<void> override {
        if (!connected_) {
            return unexpected{error{error_code::not_connected, "not connected"}};
        }
        auto accepted = fs_->on_login(creds);
        if (!accepted) {
            return accepted;
        }
        logged_in_ = true;
        cwd_ = fs_->home();
        return {};
    }

    auto make_directory(const std::string& path) -> result<void> override {
        if (!ready()) {
            return unexpected{error{error_code::not_connected, "not connected"}};
        }
        return fs_->on_mkd(resolve(path));
    }

    auto change_directory(const std::string& path) -> result<void> override {
        if (!ready()) {
            return unexpected{error{error_code::not_connected, "not connected"}};
        }
        auto target = resolve(path);
        auto changed = fs_->on_cwd(target);
        if (changed) {
            cwd_ = std::move(target);
        }
        return changed;
    }

    auto current_directory() -> result<std::string> override {
        if (!ready()) {
            return unexpected{error{error_code::not_connected, "not connected"}};
        }
        return cwd_;
    }

    auto store(const std::string& remote_path, std::istream& source, transfer_mode mode)
        -> result<uint64_t> override {
        if (!ready()) {
            return unexpected{error{error_code::not_connected, "not connected"}};
        }
        std::string content((std::istreambuf_iterator<char>(source)),
                            std::istreambuf_iterator<char>());
        bool drop = false;
        auto stored = fs_->on_stor(resolve(remote_path), std::move(content), mode, drop);
        if (drop) {
            connected_ = false;
        }
        return stored;
    }

    auto quit() -> result<void> override {
        if (!connected_) {
            return {};
        }
        fs_->on_quit();
        connected_ = false;
        return {};
    }

    auto is_connected() const -> bool override { return connected_; }

    auto welcome_message() const -> std::string override {
        return connected_ ? "220 mock FTP server ready" : std::string{};
    }

private:
    [[nodiscard]] auto ready() const -> bool { return connected_ && logged_in_; }

    // Relative paths are taken from the working directory, as a server does
    [[nodiscard]] auto resolve(const std::string& path) const -> std::string {
        if (is_absolute_remote_path(path)) {
            return normalize_remote_path(path);
        }
        return normalize_remote_path(join_remote_path(cwd_, path));
    }

    std::shared_ptr<fake_remote_fs> fs_;
    bool connected_ = false;
    bool logged_in_ = false;
    std::string cwd_ = "/";
};

inline auto make_mock_factory(std::shared_ptr<fake_remote_fs> fs) -> protocol::session_factory {
    return [fs]() -> std::unique_ptr<protocol::ftp_session_interface> {
        return std::make_unique<mock_ftp_session>(fs);
    };
}

}  // namespace cymo::test

#endif  // CYMO_TESTS_MOCK_FTP_SESSION_H
