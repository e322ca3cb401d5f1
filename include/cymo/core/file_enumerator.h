/**
 * @file file_enumerator.h
 * @brief Discovery of the local files and directories to upload
 */

#ifndef CYMO_CORE_FILE_ENUMERATOR_H
#define CYMO_CORE_FILE_ENUMERATOR_H

#include "transfer_types.h"
#include "types.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cymo {

/**
 * @brief Walks a local root and produces the ordered task list
 *
 * A regular file root yields exactly one task named after the file under the
 * remote base. A directory root yields a directory task for every directory
 * below the root (the root itself is implied by the remote base) and a file
 * task for every regular file.
 *
 * Symbolic links are followed. A link to a directory that was already walked,
 * such as a link back to an ancestor, is skipped with a warning, as are
 * dangling and self-referencing links. Permission errors anywhere in the walk
 * fail the whole enumeration.
 *
 * Tasks are ordered by (remote parent directory, remote path), so all tasks
 * sharing a remote parent are contiguous and a directory always precedes the
 * entries below it.
 *
 * @code
 * auto tasks = file_enumerator::enumerate("/home/me/site", "/www");
 * if (!tasks) {
 *     // tasks.error().code is file_not_found or file_access_denied
 * }
 * @endcode
 */
class file_enumerator {
public:
    /**
     * @brief Enumerate the local root
     * @param local_root File or directory to upload
     * @param remote_base Remote directory the tree is uploaded into
     * @return Ordered tasks, or file_not_found / file_access_denied
     */
    [[nodiscard]] static auto enumerate(const std::filesystem::path& local_root,
                                        std::string_view remote_base)
        -> result<std::vector<transfer_task>>;

    /**
     * @brief Sort tasks into directory-major order
     */
    static void sort_tasks(std::vector<transfer_task>& tasks);

    /**
     * @brief Remote file paths targeted by more than one file task
     * @return Sorted list of duplicated remote paths (each listed once)
     */
    [[nodiscard]] static auto find_duplicate_remote_paths(
        const std::vector<transfer_task>& tasks) -> std::vector<std::string>;
};

}  // namespace cymo

#endif  // CYMO_CORE_FILE_ENUMERATOR_H
