// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "cymo/config/feature_flags.h"

#if CYMO_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace cymo {

/**
 * @brief Log categories, one per orchestration component
 */
struct log_category {
    static constexpr std::string_view enumerator = "cymo.enumerator";
    static constexpr std::string_view partitioner = "cymo.partitioner";
    static constexpr std::string_view synchronizer = "cymo.synchronizer";
    static constexpr std::string_view worker = "cymo.worker";
    static constexpr std::string_view protocol = "cymo.protocol";
    static constexpr std::string_view coordinator = "cymo.coordinator";
    static constexpr std::string_view cli = "cymo.cli";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name as given on the command line (case-insensitive)
 */
inline std::optional<log_level> parse_log_level(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return log_level::trace;
    if (lowered == "debug") return log_level::debug;
    if (lowered == "info") return log_level::info;
    if (lowered == "warn" || lowered == "warning") return log_level::warn;
    if (lowered == "error") return log_level::error;
    if (lowered == "fatal") return log_level::fatal;
    return std::nullopt;
}

namespace detail {

inline auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Which kinds of sensitive information get masked in log output
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_ips = false;
    bool mask_credentials = true;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, false, "*", 4};
    }
};

/**
 * @brief Masks server addresses, paths and FTP passwords in log messages
 *
 * Credential masking is on by default: a "PASS <secret>" command echoed by
 * the protocol layer never reaches the log verbatim.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = {})
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string result = input;

        if (config_.mask_credentials) {
            result = mask_password_commands(result);
        }
        if (config_.mask_ips) {
            result = replace_matches(result, ip_pattern(),
                                     [this](const std::string& ip) { return mask_ip(ip); });
        }
        if (config_.mask_paths) {
            result = replace_matches(result, path_pattern(),
                                     [this](const std::string& path) { return mask_path(path); });
        }
        return result;
    }

    /**
     * @brief Keep the final path component, replace the directories
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of('/');
        if (last_sep == std::string::npos || last_sep == 0) {
            return path;
        }
        return std::string(last_sep, config_.mask_char[0]) + path.substr(last_sep);
    }

    /**
     * @brief Keep only the last octet of an IPv4 address
     */
    [[nodiscard]] auto mask_ip(const std::string& ip) const -> std::string {
        if (!config_.mask_ips || ip.empty()) {
            return ip;
        }

        auto last_dot = ip.find_last_of('.');
        if (last_dot == std::string::npos) {
            return std::string(ip.size(), config_.mask_char[0]);
        }
        return std::string(last_dot, config_.mask_char[0]) + ip.substr(last_dot);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    static auto ip_pattern() -> const std::regex& {
        static const std::regex pattern(R"((\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3}))");
        return pattern;
    }

    static auto path_pattern() -> const std::regex& {
        static const std::regex pattern(R"((?:\/[a-zA-Z0-9._-]+)+)");
        return pattern;
    }

    [[nodiscard]] auto mask_password_commands(const std::string& input) const -> std::string {
        static const std::regex pass_pattern(R"(\b(PASS\s+)\S+)");
        return std::regex_replace(input, pass_pattern,
                                  "$1" + std::string(config_.visible_chars, config_.mask_char[0]));
    }

    template <typename Replace>
    static auto replace_matches(const std::string& input, const std::regex& pattern,
                                Replace replace) -> std::string {
        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, static_cast<size_t>(it->position()) - last_pos);
            result += replace(it->str());
            last_pos = static_cast<size_t>(it->position() + it->length());
        }
        result += input.substr(last_pos);
        return result;
    }

    masking_config config_;
};

/**
 * @brief Structured context attached to upload log records
 */
struct upload_log_context {
    std::optional<std::size_t> worker_index;
    std::string remote_path;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<std::size_t> attempt;
    std::optional<uint64_t> duration_ms;
    std::optional<double> rate_bytes_per_sec;
    std::optional<std::string> error_message;
    std::optional<std::string> server_address;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (worker_index) add_uint("worker", *worker_index);
        if (!remote_path.empty()) {
            add_field("remote_path", masker ? masker->mask_path(remote_path) : remote_path);
        }
        if (file_size) add_uint("size", *file_size);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (attempt) add_uint("attempt", *attempt);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (rate_bytes_per_sec) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2)
                << "\"rate_bytes_per_sec\":" << *rate_bytes_per_sec;
            first = false;
        }
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }
        if (server_address) {
            add_field("server_address", masker ? masker->mask_ip(*server_address) : *server_address);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete log record as emitted in JSON mode
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<upload_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\""
            << detail::escape_json_string(masker ? masker->mask(message) : message) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for cymo
 *
 * Writes to stderr unless the logger_system backend is compiled in. Stdout is
 * left to the final report.
 */
class cymo_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const upload_log_context*)>;

    cymo_logger() = default;
    ~cymo_logger() = default;

    cymo_logger(const cymo_logger&) = delete;
    cymo_logger& operator=(const cymo_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if CYMO_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if CYMO_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if CYMO_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Observe every record that passes the level filter (tests use this)
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string line_text;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = get_timestamp(true);
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            line_text = entry.to_json_with_masking(&masker);
        } else {
            std::ostringstream oss;
            oss << get_timestamp(false) << " [" << log_level_to_string(level) << "] ["
                << category << "] " << masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&masker);
            }
            line_text = oss.str();
        }

        write(level, line_text);
    }

    void flush() {
#if CYMO_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#else
        std::lock_guard<std::mutex> lock(stderr_mutex());
        std::cerr.flush();
#endif
    }

private:
    void write([[maybe_unused]] log_level level, const std::string& text) {
#if CYMO_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), text);
            return;
        }
#endif
        std::lock_guard<std::mutex> lock(stderr_mutex());
        std::cerr << text << "\n";
    }

    static auto stderr_mutex() -> std::mutex& {
        static std::mutex mutex;
        return mutex;
    }

#if CYMO_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    // ISO-8601 UTC for JSON records, local time for text records
    static auto get_timestamp(bool utc) -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        if (utc) {
            gmtime_r(&time_t_val, &tm_buf);
        } else {
            localtime_r(&time_t_val, &tm_buf);
        }

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        if (utc) {
            oss << 'Z';
        }
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline cymo_logger& get_logger() {
    static cymo_logger instance;
    return instance;
}

#define CYMO_LOG(level, category, message) \
    ::cymo::get_logger().log(level, category, message, nullptr, __FILE__, __LINE__)

#define CYMO_LOG_CTX(level, category, message, context) \
    ::cymo::get_logger().log(level, category, message, &context, __FILE__, __LINE__)

#define CYMO_LOG_TRACE(category, message) \
    CYMO_LOG(::cymo::log_level::trace, category, message)

#define CYMO_LOG_DEBUG(category, message) \
    CYMO_LOG(::cymo::log_level::debug, category, message)

#define CYMO_LOG_INFO(category, message) \
    CYMO_LOG(::cymo::log_level::info, category, message)

#define CYMO_LOG_WARN(category, message) \
    CYMO_LOG(::cymo::log_level::warn, category, message)

#define CYMO_LOG_ERROR(category, message) \
    CYMO_LOG(::cymo::log_level::error, category, message)

#define CYMO_LOG_FATAL(category, message) \
    CYMO_LOG(::cymo::log_level::fatal, category, message)

#define CYMO_LOG_DEBUG_CTX(category, message, ctx) \
    CYMO_LOG_CTX(::cymo::log_level::debug, category, message, ctx)

#define CYMO_LOG_INFO_CTX(category, message, ctx) \
    CYMO_LOG_CTX(::cymo::log_level::info, category, message, ctx)

#define CYMO_LOG_WARN_CTX(category, message, ctx) \
    CYMO_LOG_CTX(::cymo::log_level::warn, category, message, ctx)

#define CYMO_LOG_ERROR_CTX(category, message, ctx) \
    CYMO_LOG_CTX(::cymo::log_level::error, category, message, ctx)

}  // namespace cymo
