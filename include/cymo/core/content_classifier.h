/**
 * @file content_classifier.h
 * @brief Binary/text classification of file content via libmagic
 */

#ifndef CYMO_CORE_CONTENT_CLASSIFIER_H
#define CYMO_CORE_CONTENT_CLASSIFIER_H

#include "transfer_types.h"
#include "types.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>

namespace cymo {

/**
 * @brief Default number of leading bytes inspected per file
 */
inline constexpr std::size_t default_sniff_bytes = 8 * 1024;

/**
 * @brief Chooses the transfer mode for a file from a bounded byte prefix
 *
 * Wraps one libmagic handle opened with MAGIC_MIME_ENCODING. An encoding of
 * "binary" selects binary mode, any character encoding selects text mode.
 *
 * @note A libmagic handle is not thread-safe; create one classifier per
 *       worker.
 */
class content_classifier {
public:
    /**
     * @brief Open and load the libmagic database
     * @return Classifier, or internal_error when libmagic cannot be loaded
     */
    [[nodiscard]] static auto create() -> result<std::unique_ptr<content_classifier>>;

    ~content_classifier();

    content_classifier(const content_classifier&) = delete;
    auto operator=(const content_classifier&) -> content_classifier& = delete;
    content_classifier(content_classifier&&) noexcept;
    auto operator=(content_classifier&&) noexcept -> content_classifier&;

    /**
     * @brief Classify a byte prefix
     *
     * An empty prefix is binary. When libmagic fails on the buffer the content
     * is treated as binary, which transfers it unchanged.
     */
    [[nodiscard]] auto classify(std::span<const std::byte> prefix) const -> transfer_mode;

    /**
     * @brief Read up to @p sniff_bytes from the start of a file and classify them
     * @return Transfer mode, or file_read_error when the file cannot be read
     */
    [[nodiscard]] auto classify_file(const std::filesystem::path& path,
                                     std::size_t sniff_bytes = default_sniff_bytes) const
        -> result<transfer_mode>;

private:
    content_classifier();

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace cymo

#endif  // CYMO_CORE_CONTENT_CLASSIFIER_H
