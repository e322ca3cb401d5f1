/**
 * @file file_enumerator.cpp
 * @brief Implementation of local tree enumeration
 */

#include <cymo/core/file_enumerator.h>

#include <cymo/core/logging.h>
#include <cymo/core/remote_path.h>

#include <algorithm>
#include <map>
#include <set>
#include <system_error>
#include <utility>

namespace cymo {

namespace {

auto walk_error(const std::error_code& ec, const std::filesystem::path& path) -> unexpected {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return unexpected{error{error_code::file_access_denied,
                                "permission denied: " + path.string()}};
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return unexpected{error{error_code::file_not_found,
                                "not found: " + path.string()}};
    }
    return unexpected{error{error_code::file_read_error,
                            "cannot read " + path.string() + ": " + ec.message()}};
}

auto to_remote_relative(const std::filesystem::path& relative) -> std::string {
    // generic_string() always uses '/'
    return relative.generic_string();
}

}  // namespace

auto file_enumerator::enumerate(const std::filesystem::path& local_root,
                                std::string_view remote_base)
    -> result<std::vector<transfer_task>> {
    namespace fs = std::filesystem;

    std::error_code ec;
    auto root_status = fs::status(local_root, ec);
    if (ec || !fs::exists(root_status)) {
        if (ec && ec != std::errc::no_such_file_or_directory &&
            ec != std::errc::not_a_directory) {
            return walk_error(ec, local_root);
        }
        return unexpected{error{error_code::file_not_found,
                                "local path does not exist: " + local_root.string()}};
    }

    auto root = fs::absolute(local_root, ec);
    if (ec) {
        return walk_error(ec, local_root);
    }
    root = root.lexically_normal();

    std::vector<transfer_task> tasks;

    if (fs::is_regular_file(root_status)) {
        auto size = fs::file_size(root, ec);
        if (ec) {
            return walk_error(ec, root);
        }
        auto name = root.filename().string();
        tasks.push_back(transfer_task::file(root, join_remote_path(remote_base, name), size));
        CYMO_LOG_DEBUG(log_category::enumerator,
                       "Single file root: " + root.string() + " (" + std::to_string(size) +
                           " bytes)");
        return tasks;
    }

    if (!fs::is_directory(root_status)) {
        return unexpected{error{error_code::invalid_file_path,
                                "local path is neither a file nor a directory: " +
                                    root.string()}};
    }

    // Canonical directories already walked; a symlink back into one is a loop
    std::set<fs::path> visited;
    auto canonical_root = fs::canonical(root, ec);
    if (ec) {
        return walk_error(ec, root);
    }
    visited.insert(std::move(canonical_root));

    fs::recursive_directory_iterator it(root, fs::directory_options::follow_directory_symlink,
                                        ec);
    if (ec) {
        return walk_error(ec, root);
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return walk_error(ec, root);
        }

        const auto& entry = *it;
        const auto& path = entry.path();

        std::error_code status_ec;
        auto status = entry.status(status_ec);
        if (status_ec) {
            if (status_ec == std::errc::no_such_file_or_directory) {
                CYMO_LOG_DEBUG(log_category::enumerator,
                               "Skipping dangling link: " + path.string());
                it.disable_recursion_pending();
                continue;
            }
            if (status_ec == std::errc::too_many_symbolic_link_levels) {
                CYMO_LOG_WARN(log_category::enumerator,
                              "Skipping self-referencing link: " + path.string());
                it.disable_recursion_pending();
                continue;
            }
            return walk_error(status_ec, path);
        }

        auto relative = path.lexically_relative(root);
        auto remote = join_remote_path(remote_base, to_remote_relative(relative));

        if (fs::is_directory(status)) {
            auto canonical = fs::canonical(path, status_ec);
            if (status_ec) {
                return walk_error(status_ec, path);
            }
            if (!visited.insert(std::move(canonical)).second) {
                CYMO_LOG_WARN(log_category::enumerator,
                              "Skipping already visited directory: " + path.string());
                it.disable_recursion_pending();
                continue;
            }
            tasks.push_back(transfer_task::directory(path, std::move(remote)));
        } else if (fs::is_regular_file(status)) {
            auto size = entry.file_size(status_ec);
            if (status_ec) {
                return walk_error(status_ec, path);
            }
            tasks.push_back(transfer_task::file(path, std::move(remote), size));
        } else {
            CYMO_LOG_DEBUG(log_category::enumerator,
                           "Skipping special file: " + path.string());
        }
    }
    if (ec) {
        return walk_error(ec, root);
    }

    sort_tasks(tasks);

    CYMO_LOG_DEBUG(log_category::enumerator,
                   "Enumerated " + std::to_string(tasks.size()) + " tasks (" +
                       std::to_string(count_file_tasks(tasks)) + " files) under " +
                       root.string());
    return tasks;
}

void file_enumerator::sort_tasks(std::vector<transfer_task>& tasks) {
    std::vector<std::pair<std::string, transfer_task>> keyed;
    keyed.reserve(tasks.size());
    for (auto& task : tasks) {
        auto parent = remote_parent(task.remote_path);
        keyed.emplace_back(std::move(parent), std::move(task));
    }

    std::stable_sort(keyed.begin(), keyed.end(), [](const auto& lhs, const auto& rhs) {
        if (lhs.first != rhs.first) {
            return lhs.first < rhs.first;
        }
        return lhs.second.remote_path < rhs.second.remote_path;
    });

    tasks.clear();
    for (auto& [parent, task] : keyed) {
        tasks.push_back(std::move(task));
    }
}

auto file_enumerator::find_duplicate_remote_paths(const std::vector<transfer_task>& tasks)
    -> std::vector<std::string> {
    std::map<std::string, size_t> counts;
    for (const auto& task : tasks) {
        if (!task.is_directory) {
            ++counts[task.remote_path];
        }
    }

    std::vector<std::string> duplicates;
    for (const auto& [path, count] : counts) {
        if (count > 1) {
            duplicates.push_back(path);
        }
    }
    return duplicates;
}

}  // namespace cymo
