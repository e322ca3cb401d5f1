/**
 * @file remote_directory_registry.cpp
 * @brief Implementation of remote_directory_registry
 */

#include <cymo/upload/remote_directory_registry.h>

#include <cymo/core/logging.h>
#include <cymo/core/remote_path.h>

#include <utility>

namespace cymo {

namespace {

/**
 * @brief Runs a callable on scope exit unless dismissed
 */
template <typename F>
class scope_guard {
public:
    explicit scope_guard(F fun) : fun_(std::move(fun)) {}
    ~scope_guard() {
        if (!dismissed_) {
            fun_();
        }
    }

    scope_guard(const scope_guard&) = delete;
    auto operator=(const scope_guard&) -> scope_guard& = delete;

    void dismiss() noexcept { dismissed_ = true; }

private:
    F fun_;
    bool dismissed_ = false;
};

}  // namespace

auto remote_directory_registry::ensure(const std::string& path,
                                       protocol::ftp_session_interface& session)
    -> result<void> {
    const auto normalized = normalize_remote_path(path);
    if (is_remote_root(normalized)) {
        return {};
    }

    {
        std::lock_guard lock(mutex_);
        if (!entries_.emplace(normalized, entry_state::pending).second) {
            return {};
        }
    }

    // The mark must not outlive a creation that never completed
    scope_guard unmark([this, &normalized]() {
        std::lock_guard lock(mutex_);
        entries_.erase(normalized);
    });

    creation_requests_.fetch_add(1, std::memory_order_relaxed);
    auto made = session.make_directory(normalized);

    if (!made && made.error().code != error_code::directory_already_exists) {
        CYMO_LOG_WARN(log_category::synchronizer,
                      "Cannot create " + normalized + ": " + made.error().message);
        return unexpected{made.error()};
    }

    unmark.dismiss();
    {
        std::lock_guard lock(mutex_);
        entries_[normalized] = entry_state::created;
    }

    CYMO_LOG_DEBUG(log_category::synchronizer,
                   made ? "Created " + normalized : normalized + " already exists");
    return {};
}

auto remote_directory_registry::ensure_with_ancestors(const std::string& path,
                                                      protocol::ftp_session_interface& session,
                                                      std::string* failed_directory)
    -> result<void> {
    for (const auto& directory : remote_ancestors(path)) {
        auto ensured = ensure(directory, session);
        if (!ensured) {
            if (failed_directory) {
                *failed_directory = directory;
            }
            return ensured;
        }
    }
    return {};
}

void remote_directory_registry::mark_existing(const std::string& path) {
    std::lock_guard lock(mutex_);
    for (const auto& directory : remote_ancestors(path)) {
        entries_[directory] = entry_state::created;
    }
}

auto remote_directory_registry::contains(const std::string& path) const -> bool {
    const auto normalized = normalize_remote_path(path);
    if (is_remote_root(normalized)) {
        return true;
    }

    std::lock_guard lock(mutex_);
    auto it = entries_.find(normalized);
    return it != entries_.end() && it->second == entry_state::created;
}

auto remote_directory_registry::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    std::size_t count = 0;
    for (const auto& [path, state] : entries_) {
        if (state == entry_state::created) {
            ++count;
        }
    }
    return count;
}

auto remote_directory_registry::creation_requests() const -> std::size_t {
    return creation_requests_.load(std::memory_order_relaxed);
}

}  // namespace cymo
