#include "ircmsg.hpp"

#include <algorithm>

namespace {

/// @brief Left-to-right reader over one line of input
class cursor {
    std::string_view rest_;

    auto skip_spaces() -> void {
        auto const n = rest_.find_first_not_of(' ');
        rest_.remove_prefix(n == rest_.npos ? rest_.size() : n);
    }

public:
    explicit cursor(std::string_view const line) : rest_{line} {
        skip_spaces();
    }

    /// @brief Take the next space-delimited token and any spaces after it
    auto token() -> std::string_view {
        auto const end = std::min(rest_.find(' '), rest_.size());
        auto const result = rest_.substr(0, end);
        rest_.remove_prefix(end);
        skip_spaces();
        return result;
    }

    /// @brief Consume c when it is the next character
    auto take(char const c) -> bool {
        if (not rest_.empty() && rest_.front() == c) {
            rest_.remove_prefix(1);
            return true;
        }
        return false;
    }

    auto done() const -> bool { return rest_.empty(); }

    /// @brief Take everything that remains
    auto remainder() -> std::string_view {
        auto const result = rest_;
        rest_ = {};
        return result;
    }
};

auto unescape_tag_value(std::string_view const val) -> std::string
{
    std::string out;
    out.reserve(val.size());

    for (std::size_t i = 0; i < val.size(); ++i) {
        if (val[i] != '\\') {
            out += val[i];
        } else if (++i < val.size()) {
            switch (val[i]) {
                case ':': out += ';'; break;
                case 's': out += ' '; break;
                case 'r': out += '\r'; break;
                case 'n': out += '\n'; break;
                default : out += val[i]; break;
            }
        }
    }
    return out;
}

} // namespace

auto parse_irc_tags(std::string_view str) -> std::vector<irctag>
{
    std::vector<irctag> tags;

    for (;;) {
        auto const semi = str.find(';');
        auto const entry = str.substr(0, semi);

        auto const eq = entry.find('=');
        auto const key = entry.substr(0, eq);
        if (key.empty()) {
            throw irc_parse_error{irc_error_code::MISSING_TAG};
        }

        if (eq == entry.npos) {
            tags.push_back({key, std::nullopt});
        } else {
            tags.push_back({key, unescape_tag_value(entry.substr(eq + 1))});
        }

        if (semi == str.npos) break;
        str.remove_prefix(semi + 1);
    }

    return tags;
}

auto parse_irc_message(std::string_view const line) -> ircmsg
{
    cursor in {line};
    ircmsg out;

    if (in.take('@')) {
        out.tags = parse_irc_tags(in.token());
    }

    if (in.take(':')) {
        out.source = in.token();
    }

    out.command = in.token();
    if (out.command.empty()) {
        throw irc_parse_error{irc_error_code::MISSING_COMMAND};
    }

    while (not in.done()) {
        if (in.take(':')) {
            out.args.push_back(in.remainder());
            break;
        }
        out.args.push_back(in.token());
    }

    return out;
}

auto operator<<(std::ostream& out, irc_error_code const code) -> std::ostream&
{
    switch (code) {
        case irc_error_code::MISSING_COMMAND: return out << "MISSING COMMAND";
        case irc_error_code::MISSING_TAG: return out << "MISSING TAG";
    }
    return out;
}

auto split_irc_source(std::string_view const source) -> ircsource
{
    auto const bang = source.find('!');
    auto const at = source.find('@', bang == source.npos ? 0 : bang);

    ircsource out;
    out.nick = source.substr(0, std::min(bang, at));
    if (bang != source.npos) {
        out.user = source.substr(bang + 1, at == source.npos ? at : at - bang - 1);
    }
    if (at != source.npos) {
        out.host = source.substr(at + 1);
    }
    return out;
}
