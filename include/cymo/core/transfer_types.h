/**
 * @file transfer_types.h
 * @brief Transfer task and transfer mode definitions
 */

#ifndef CYMO_CORE_TRANSFER_TYPES_H
#define CYMO_CORE_TRANSFER_TYPES_H

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cymo {

/**
 * @brief FTP representation type used for a STOR
 */
enum class transfer_mode {
    binary,  ///< TYPE I
    text     ///< TYPE A, LF sent as CRLF
};

[[nodiscard]] constexpr auto to_string(transfer_mode mode) -> const char* {
    switch (mode) {
        case transfer_mode::binary:
            return "binary";
        case transfer_mode::text:
            return "text";
        default:
            return "unknown";
    }
}

/**
 * @brief One unit of work discovered by the file enumerator
 *
 * Directory tasks only pre-register their remote path and are never counted
 * as uploads.
 */
struct transfer_task {
    std::filesystem::path local_path;
    std::string remote_path;
    bool is_directory = false;
    uint64_t size_bytes = 0;

    [[nodiscard]] static auto file(std::filesystem::path local, std::string remote,
                                   uint64_t size) -> transfer_task {
        return transfer_task{std::move(local), std::move(remote), false, size};
    }

    [[nodiscard]] static auto directory(std::filesystem::path local, std::string remote)
        -> transfer_task {
        return transfer_task{std::move(local), std::move(remote), true, 0};
    }

    auto operator==(const transfer_task& other) const -> bool = default;
};

/**
 * @brief Ordered contiguous slice of tasks owned by exactly one worker
 */
using shard = std::vector<transfer_task>;

/**
 * @brief Number of file (non-directory) tasks in a list
 */
[[nodiscard]] inline auto count_file_tasks(const std::vector<transfer_task>& tasks) -> size_t {
    size_t count = 0;
    for (const auto& task : tasks) {
        if (!task.is_directory) {
            ++count;
        }
    }
    return count;
}

}  // namespace cymo

#endif  // CYMO_CORE_TRANSFER_TYPES_H
