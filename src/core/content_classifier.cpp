/**
 * @file content_classifier.cpp
 * @brief libmagic backed implementation of content_classifier
 */

#include <cymo/core/content_classifier.h>

#include <cymo/core/logging.h>

#include <magic.h>

#include <fstream>
#include <string>
#include <vector>

namespace cymo {

struct content_classifier::impl {
    magic_t cookie = nullptr;

    ~impl() {
        if (cookie) {
            magic_close(cookie);
        }
    }
};

content_classifier::content_classifier() : impl_(std::make_unique<impl>()) {}

content_classifier::~content_classifier() = default;

content_classifier::content_classifier(content_classifier&&) noexcept = default;

auto content_classifier::operator=(content_classifier&&) noexcept
    -> content_classifier& = default;

auto content_classifier::create() -> result<std::unique_ptr<content_classifier>> {
    std::unique_ptr<content_classifier> classifier(new content_classifier());

    classifier->impl_->cookie = magic_open(MAGIC_MIME_ENCODING);
    if (!classifier->impl_->cookie) {
        return unexpected{error{error_code::internal_error, "magic_open failed"}};
    }

    if (magic_load(classifier->impl_->cookie, nullptr) != 0) {
        const char* err = magic_error(classifier->impl_->cookie);
        return unexpected{error{error_code::internal_error,
                                std::string("magic_load failed: ") +
                                    (err ? err : "unknown error")}};
    }

    return std::move(classifier);
}

auto content_classifier::classify(std::span<const std::byte> prefix) const -> transfer_mode {
    if (prefix.empty()) {
        return transfer_mode::binary;
    }

    const char* encoding = magic_buffer(impl_->cookie, prefix.data(), prefix.size());
    if (!encoding) {
        const char* err = magic_error(impl_->cookie);
        CYMO_LOG_DEBUG(log_category::worker,
                       std::string("magic_buffer failed, assuming binary: ") +
                           (err ? err : "unknown error"));
        return transfer_mode::binary;
    }

    return std::string_view(encoding) == "binary" ? transfer_mode::binary
                                                   : transfer_mode::text;
}

auto content_classifier::classify_file(const std::filesystem::path& path,
                                       std::size_t sniff_bytes) const
    -> result<transfer_mode> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
                                "cannot open file: " + path.string()}};
    }

    std::vector<std::byte> buffer(sniff_bytes);
    file.read(reinterpret_cast<char*>(buffer.data()),
              static_cast<std::streamsize>(buffer.size()));
    if (file.bad()) {
        return unexpected{error{error_code::file_read_error,
                                "cannot read file: " + path.string()}};
    }
    buffer.resize(static_cast<std::size_t>(file.gcount()));

    return classify(buffer);
}

}  // namespace cymo
