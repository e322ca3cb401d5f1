/**
 * @file ftp_reply.h
 * @brief FTP control connection replies (RFC 959 section 4.2)
 */

#ifndef CYMO_PROTOCOL_FTP_REPLY_H
#define CYMO_PROTOCOL_FTP_REPLY_H

#include <cymo/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cymo::protocol {

/**
 * @brief Reply codes the client acts on
 */
namespace reply_code {
inline constexpr int data_connection_open = 125;
inline constexpr int file_status_ok = 150;
inline constexpr int command_ok = 200;
inline constexpr int service_ready = 220;
inline constexpr int closing_control = 221;
inline constexpr int transfer_complete = 226;
inline constexpr int entering_passive = 227;
inline constexpr int entering_extended_passive = 229;
inline constexpr int user_logged_in = 230;
inline constexpr int file_action_ok = 250;
inline constexpr int path_created = 257;
inline constexpr int password_required = 331;
inline constexpr int service_not_available = 421;
inline constexpr int not_logged_in = 530;
inline constexpr int file_unavailable = 550;
}  // namespace reply_code

/**
 * @brief One complete (possibly multi-line) reply
 */
struct ftp_reply {
    int code = 0;
    std::vector<std::string> lines;  ///< Text of every line without the code prefix

    /**
     * @brief All lines joined with '\n'
     */
    [[nodiscard]] auto text() const -> std::string;

    [[nodiscard]] auto is_preliminary() const noexcept -> bool { return code >= 100 && code < 200; }
    [[nodiscard]] auto is_completion() const noexcept -> bool { return code >= 200 && code < 300; }
    [[nodiscard]] auto is_intermediate() const noexcept -> bool { return code >= 300 && code < 400; }
    [[nodiscard]] auto is_transient_negative() const noexcept -> bool {
        return code >= 400 && code < 500;
    }
    [[nodiscard]] auto is_permanent_negative() const noexcept -> bool {
        return code >= 500 && code < 600;
    }
};

/**
 * @brief Incremental reply assembler
 *
 * Fed one CRLF-stripped line at a time. A reply is complete on a line of the
 * form "ddd text"; a first line "ddd-text" opens a multi-line reply that ends
 * with a line starting with the same code followed by a space.
 *
 * @code
 * ftp_reply_parser parser;
 * parser.feed("220-Welcome");            // nullopt
 * auto reply = parser.feed("220 Ready"); // code 220, two lines
 * @endcode
 */
class ftp_reply_parser {
public:
    /**
     * @brief Consume one line
     * @return The completed reply, nullopt while more lines are needed, or
     *         protocol_error on a line that is not a valid reply start
     */
    [[nodiscard]] auto feed(std::string_view line) -> result<std::optional<ftp_reply>>;

    /**
     * @brief Whether a multi-line reply is in progress
     */
    [[nodiscard]] auto in_progress() const noexcept -> bool { return pending_.has_value(); }

    void reset() { pending_.reset(); }

private:
    std::optional<ftp_reply> pending_;
};

/**
 * @brief Host and port announced for a passive data connection
 */
struct passive_address {
    std::string host;  ///< Empty for EPSV replies (same host as control connection)
    uint16_t port = 0;
};

/**
 * @brief Parse a 227 reply "Entering Passive Mode (h1,h2,h3,h4,p1,p2)"
 */
[[nodiscard]] auto parse_pasv_reply(std::string_view text) -> result<passive_address>;

/**
 * @brief Parse a 229 reply "Entering Extended Passive Mode (|||port|)"
 */
[[nodiscard]] auto parse_epsv_reply(std::string_view text) -> result<passive_address>;

/**
 * @brief Extract the quoted path of a 257 reply; "" inside quotes is a quote
 */
[[nodiscard]] auto parse_quoted_path(std::string_view text) -> result<std::string>;

}  // namespace cymo::protocol

#endif  // CYMO_PROTOCOL_FTP_REPLY_H
