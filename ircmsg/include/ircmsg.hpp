#pragma once

#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

struct irctag
{
    std::string_view key;

    /// @brief Unescaped value, or nullopt when the tag carried no '='
    std::optional<std::string> val;

    friend auto operator==(irctag const&, irctag const&) -> bool = default;
};

/**
 * @brief Tokenized IRC line
 *
 * Every view points into the line given to parse_irc_message,
 * which must outlive this value. Tag values are copied because
 * unescaping can change them.
 */
struct ircmsg
{
    std::vector<irctag> tags;
    std::string_view source;
    std::string_view command;
    std::vector<std::string_view> args;

    friend auto operator==(ircmsg const&, ircmsg const&) -> bool = default;
};

/**
 * @brief Components of a nick!user@host message source
 *
 * Any component may be empty. Server sources have only a nick.
 */
struct ircsource
{
    std::string_view nick;
    std::string_view user;
    std::string_view host;

    friend auto operator==(ircsource const&, ircsource const&) -> bool = default;
};

enum class irc_error_code {
    MISSING_TAG,
    MISSING_COMMAND,
};

auto operator<<(std::ostream& out, irc_error_code) -> std::ostream&;

struct irc_parse_error final : public std::exception {
    irc_error_code code;

    explicit irc_parse_error(irc_error_code const code) : code{code} {}

    auto what() const noexcept -> char const* override
    {
        switch (code) {
        case irc_error_code::MISSING_TAG:
            return "irc parse error: missing tag";
        case irc_error_code::MISSING_COMMAND:
            return "irc parse error: missing command";
        }
        return "irc parse error";
    }
};

/**
 * @brief Split one IRC line into tags, source, command, and arguments
 *
 * Leading spaces and runs of spaces between tokens are skipped. An
 * argument starting with ':' takes the rest of the line verbatim.
 *
 * @param line raw line without its terminator
 * @return views into line
 * @throw irc_parse_error on an empty tag key or a missing command
 */
auto parse_irc_message(std::string_view line) -> ircmsg;

/// @brief Parse the semicolon-separated tag section without its '@'
auto parse_irc_tags(std::string_view tags) -> std::vector<irctag>;

/**
 * @brief Split a message source into nick, user, and host
 *
 * The nick runs to the first '!', the user to the following '@',
 * and the host is the remainder. Missing separators leave the
 * later components empty.
 *
 * @param source message source without the leading ':'
 * @return views into the source string
 */
auto split_irc_source(std::string_view source) -> ircsource;
