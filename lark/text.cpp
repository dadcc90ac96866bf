#include "lark/text.hpp"

#include <algorithm>
#include <array>
#include <cstdint>

namespace lark {

namespace {

// Windows-1252 code points for 0x80-0x9F; 0 marks an unassigned byte
constexpr auto cp1252_high = std::array<std::uint16_t, 32>{
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178,
};

auto append_utf8(std::string& out, std::uint32_t const cp) -> void
{
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | cp >> 6));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | cp >> 12));
        out.push_back(static_cast<char>(0x80 | (cp >> 6 & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

auto is_continuation(char const c) -> bool
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

auto is_valid_utf8(std::string_view const bytes) -> bool
{
    auto cursor = bytes.begin();
    auto const end = bytes.end();

    while (cursor != end)
    {
        auto const lead = static_cast<unsigned char>(*cursor++);
        if (lead < 0x80) continue;

        int extra;
        std::uint32_t cp;
        if ((lead & 0xE0) == 0xC0) { extra = 1; cp = lead & 0x1F; }
        else if ((lead & 0xF0) == 0xE0) { extra = 2; cp = lead & 0x0F; }
        else if ((lead & 0xF8) == 0xF0) { extra = 3; cp = lead & 0x07; }
        else return false;

        if (end - cursor < extra) return false;
        for (int i = 0; i < extra; i++)
        {
            if (not is_continuation(*cursor)) return false;
            cp = cp << 6 | (static_cast<unsigned char>(*cursor++) & 0x3F);
        }

        // reject overlong forms, surrogates, and out of range values
        constexpr std::uint32_t minimum[] {0, 0x80, 0x800, 0x10000};
        if (cp < minimum[extra]) return false;
        if (0xD800 <= cp && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;
    }
    return true;
}

auto decode_line(std::string_view const bytes) -> std::string
{
    if (is_valid_utf8(bytes))
    {
        return std::string{bytes};
    }

    std::string out;
    out.reserve(bytes.size() * 2);

    bool cp1252 = true;
    for (auto const c : bytes)
    {
        auto const b = static_cast<unsigned char>(c);
        if (0x80 <= b && b < 0xA0)
        {
            auto const cp = cp1252_high[b - 0x80];
            if (cp == 0) { cp1252 = false; break; }
            append_utf8(out, cp);
        }
        else
        {
            append_utf8(out, b);
        }
    }
    if (cp1252) return out;

    out.clear();
    for (auto const c : bytes)
    {
        append_utf8(out, static_cast<unsigned char>(c));
    }
    return out;
}

auto utf8_prefix_length(std::string_view const text, std::size_t const limit) -> std::size_t
{
    if (text.size() <= limit) return text.size();

    auto n = limit;
    // text[n] starts the first excluded character unless it continues one
    while (n > 0 && is_continuation(text[n])) n--;
    return n;
}

auto frame_line(std::string_view const line) -> std::string
{
    std::string out;
    out.reserve(std::min(line.size(), max_line_content) + 2);
    for (auto const c : line)
    {
        if (c != '\r' && c != '\n') out.push_back(c);
    }
    out.resize(utf8_prefix_length(out, max_line_content));
    out += "\r\n";
    return out;
}

auto split_message(std::string_view text, std::size_t const budget, std::size_t const max_fragments) -> std::vector<std::string>
{
    std::vector<std::string> fragments;

    while (fragments.size() + 1 < max_fragments && text.size() > budget)
    {
        auto cut = text.rfind(' ', budget);
        std::size_t skip = 1;
        if (cut == text.npos || cut == 0)
        {
            cut = utf8_prefix_length(text, budget);
            skip = 0;
        }
        if (cut == 0) // budget smaller than one character
        {
            cut = 1;
            while (cut < text.size() && is_continuation(text[cut])) cut++;
        }
        fragments.emplace_back(text.substr(0, cut));
        text.remove_prefix(cut + skip);
    }
    fragments.emplace_back(text);

    return fragments;
}

} // namespace lark
