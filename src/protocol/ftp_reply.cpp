/**
 * @file ftp_reply.cpp
 * @brief Implementation of FTP reply parsing
 */

#include <cymo/protocol/ftp_reply.h>

#include <cctype>
#include <charconv>
#include <regex>

namespace cymo::protocol {

namespace {

constexpr std::size_t reply_code_length = 3;
constexpr int passive_port_multiplier = 256;

auto parse_code(std::string_view line) -> std::optional<int> {
    if (line.size() < reply_code_length) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < reply_code_length; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(line[i]))) {
            return std::nullopt;
        }
    }
    if (line[0] < '1' || line[0] > '5') {
        return std::nullopt;
    }
    return (line[0] - '0') * 100 + (line[1] - '0') * 10 + (line[2] - '0');
}

auto line_text(std::string_view line) -> std::string {
    if (line.size() <= reply_code_length + 1) {
        return {};
    }
    return std::string(line.substr(reply_code_length + 1));
}

auto malformed(std::string_view what, std::string_view text) -> unexpected {
    return unexpected{error{error_code::protocol_error,
                            std::string(what) + ": " + std::string(text)}};
}

}  // namespace

auto ftp_reply::text() const -> std::string {
    std::string joined;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += lines[i];
    }
    return joined;
}

auto ftp_reply_parser::feed(std::string_view line) -> result<std::optional<ftp_reply>> {
    auto code = parse_code(line);
    const bool has_separator = line.size() > reply_code_length;
    const char separator = has_separator ? line[reply_code_length] : ' ';

    if (pending_) {
        // Inside a multi-line reply only "ddd " with the opening code ends it
        if (code && *code == pending_->code && separator == ' ') {
            pending_->lines.push_back(line_text(line));
            auto reply = std::move(*pending_);
            pending_.reset();
            return std::optional<ftp_reply>(std::move(reply));
        }
        if (code && *code == pending_->code && separator == '-') {
            pending_->lines.push_back(line_text(line));
        } else {
            pending_->lines.emplace_back(line);
        }
        return std::optional<ftp_reply>{};
    }

    if (!code || (separator != ' ' && separator != '-')) {
        return malformed("malformed reply line", line);
    }

    ftp_reply reply;
    reply.code = *code;
    reply.lines.push_back(line_text(line));

    if (separator == '-') {
        pending_ = std::move(reply);
        return std::optional<ftp_reply>{};
    }
    return std::optional<ftp_reply>(std::move(reply));
}

auto parse_pasv_reply(std::string_view text) -> result<passive_address> {
    static const std::regex pattern(R"((\d+),\s*(\d+),\s*(\d+),\s*(\d+),\s*(\d+),\s*(\d+))");

    std::string owned(text);
    std::smatch match;
    if (!std::regex_search(owned, match, pattern)) {
        return malformed("unparsable PASV reply", text);
    }

    int values[6];
    for (int i = 0; i < 6; ++i) {
        if (match[i + 1].length() > 3) {
            return malformed("PASV value out of range", text);
        }
        values[i] = std::stoi(match[i + 1].str());
        if (values[i] > 255) {
            return malformed("PASV value out of range", text);
        }
    }

    passive_address address;
    address.host = std::to_string(values[0]) + "." + std::to_string(values[1]) + "." +
                   std::to_string(values[2]) + "." + std::to_string(values[3]);
    address.port = static_cast<uint16_t>(values[4] * passive_port_multiplier + values[5]);
    return address;
}

auto parse_epsv_reply(std::string_view text) -> result<passive_address> {
    auto open = text.find('(');
    auto close = text.find(')', open == std::string_view::npos ? 0 : open);
    if (open == std::string_view::npos || close == std::string_view::npos ||
        close - open < 6) {
        return malformed("unparsable EPSV reply", text);
    }

    // (<d><d><d>port<d>) where <d> is any printable delimiter, usually '|'
    auto body = text.substr(open + 1, close - open - 1);
    const char delimiter = body[0];
    if (body[1] != delimiter || body[2] != delimiter || body.back() != delimiter) {
        return malformed("unparsable EPSV reply", text);
    }

    auto digits = body.substr(3, body.size() - 4);
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), port);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || port == 0 ||
        port > 65535) {
        return malformed("EPSV port out of range", text);
    }

    return passive_address{std::string{}, static_cast<uint16_t>(port)};
}

auto parse_quoted_path(std::string_view text) -> result<std::string> {
    auto open = text.find('"');
    if (open == std::string_view::npos) {
        return malformed("reply carries no quoted path", text);
    }

    std::string path;
    for (auto i = open + 1; i < text.size(); ++i) {
        if (text[i] == '"') {
            if (i + 1 < text.size() && text[i + 1] == '"') {
                path += '"';
                ++i;
                continue;
            }
            return path;
        }
        path += text[i];
    }
    return malformed("unterminated quoted path", text);
}

}  // namespace cymo::protocol
