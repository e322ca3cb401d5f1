/**
 * @file remote_path.h
 * @brief Lexical helpers for absolute remote (server side) paths
 *
 * Remote paths always use '/' separators regardless of the local platform.
 */

#ifndef CYMO_CORE_REMOTE_PATH_H
#define CYMO_CORE_REMOTE_PATH_H

#include <string>
#include <string_view>
#include <vector>

namespace cymo {

/**
 * @brief Normalize a remote path
 *
 * Collapses repeated separators, strips trailing separators and resolves
 * "." and ".." lexically. The result is always absolute; ".." above the root
 * stays at the root.
 *
 * @code
 * normalize_remote_path("dst//sub/./x/..//") == "/dst/sub"
 * normalize_remote_path("") == "/"
 * @endcode
 */
[[nodiscard]] auto normalize_remote_path(std::string_view path) -> std::string;

/**
 * @brief Whether @p path starts at the server root
 */
[[nodiscard]] inline auto is_absolute_remote_path(std::string_view path) -> bool {
    return !path.empty() && path.front() == '/';
}

/**
 * @brief Tidy a user supplied remote path without changing what it refers to
 *
 * Absolute paths are normalized. Relative paths keep their meaning relative
 * to the login directory: repeated and trailing separators and "." are
 * dropped, ".." is kept for the server to resolve. An empty relative path
 * becomes ".".
 *
 * @code
 * clean_remote_path("upload//site/") == "upload/site"
 * clean_remote_path("/www/./site") == "/www/site"
 * @endcode
 */
[[nodiscard]] auto clean_remote_path(std::string_view path) -> std::string;

/**
 * @brief Join a base path with a relative path and normalize the result
 */
[[nodiscard]] auto join_remote_path(std::string_view base, std::string_view relative)
    -> std::string;

/**
 * @brief Parent directory of a remote path ("/" for top-level entries and root)
 */
[[nodiscard]] auto remote_parent(std::string_view path) -> std::string;

/**
 * @brief Final component of a remote path (empty for the root)
 */
[[nodiscard]] auto remote_filename(std::string_view path) -> std::string;

/**
 * @brief Every directory from the top down to and including @p path
 *
 * The root itself is not listed: "/a/b" yields {"/a", "/a/b"}.
 */
[[nodiscard]] auto remote_ancestors(std::string_view path) -> std::vector<std::string>;

/**
 * @brief Whether @p ancestor is @p path or one of its parent directories
 */
[[nodiscard]] auto is_same_or_ancestor(std::string_view ancestor, std::string_view path)
    -> bool;

/**
 * @brief Whether the normalized path denotes the root directory
 */
[[nodiscard]] inline auto is_remote_root(std::string_view path) -> bool {
    return path.empty() || path == "/";
}

}  // namespace cymo

#endif  // CYMO_CORE_REMOTE_PATH_H
