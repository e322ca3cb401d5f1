/**
 * @file remote_directory_registry.h
 * @brief Shared registry of remote directories known to exist
 */

#ifndef CYMO_UPLOAD_REMOTE_DIRECTORY_REGISTRY_H
#define CYMO_UPLOAD_REMOTE_DIRECTORY_REGISTRY_H

#include <cymo/core/types.h>
#include <cymo/protocol/ftp_session_interface.h>

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cymo {

/**
 * @brief Idempotent remote directory creation shared by all workers
 *
 * The mutex guards only the in-memory check-and-mark; MKD is always issued
 * outside it, on the caller's own session. A path is marked before its MKD is
 * sent, so at most one creation request is issued per distinct path while it
 * succeeds. A caller that finds the path already marked, confirmed or still
 * in flight, returns success at once and never waits for another worker. A
 * failed creation removes the mark, so a later caller may try again.
 *
 * @code
 * remote_directory_registry registry;
 * auto ok = registry.ensure_with_ancestors("/www/img", session);
 * @endcode
 */
class remote_directory_registry {
public:
    remote_directory_registry() = default;

    remote_directory_registry(const remote_directory_registry&) = delete;
    auto operator=(const remote_directory_registry&) -> remote_directory_registry& = delete;

    /**
     * @brief Make sure one directory exists
     *
     * The path is normalized first; the root and the empty path are always
     * present. "Already exists" from the server counts as success.
     *
     * @return directory_create_failed (or the session error) when the server
     *         refuses for another reason
     */
    [[nodiscard]] auto ensure(const std::string& path,
                              protocol::ftp_session_interface& session) -> result<void>;

    /**
     * @brief ensure() every directory from the top down to @p path
     *
     * Stops at the first failure and returns it.
     *
     * @param failed_directory Receives the directory that could not be
     *        created, which may be an ancestor of @p path
     */
    [[nodiscard]] auto ensure_with_ancestors(const std::string& path,
                                             protocol::ftp_session_interface& session,
                                             std::string* failed_directory = nullptr)
        -> result<void>;

    /**
     * @brief Record @p path and its ancestors as existing without any request
     *
     * For directories the server has already shown to exist, such as the
     * working directory reported after a successful CWD.
     */
    void mark_existing(const std::string& path);

    /**
     * @brief Whether the directory has been confirmed to exist
     */
    [[nodiscard]] auto contains(const std::string& path) const -> bool;

    /**
     * @brief Number of confirmed directories
     */
    [[nodiscard]] auto size() const -> std::size_t;

    /**
     * @brief Number of MKD requests issued through this registry
     */
    [[nodiscard]] auto creation_requests() const -> std::size_t;

private:
    enum class entry_state {
        pending,
        created
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, entry_state> entries_;
    std::atomic<std::size_t> creation_requests_{0};
};

}  // namespace cymo

#endif  // CYMO_UPLOAD_REMOTE_DIRECTORY_REGISTRY_H
