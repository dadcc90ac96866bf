#include "sasl.hpp"

#include <climits>
#include <cstdint>

namespace sasl {

namespace {

constexpr std::string_view alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

static_assert(alphabet.size() == 64);
static_assert(CHAR_BIT == 8);

auto octet(char const c) -> std::uint32_t
{
    return static_cast<std::uint8_t>(c);
}

} // namespace

auto encode(std::string_view input, char* output) -> void
{
    while (input.size() >= 3)
    {
        auto const group = octet(input[0]) << 16 | octet(input[1]) << 8 | octet(input[2]);
        *output++ = alphabet[group >> 18 & 0x3f];
        *output++ = alphabet[group >> 12 & 0x3f];
        *output++ = alphabet[group >> 6 & 0x3f];
        *output++ = alphabet[group & 0x3f];
        input.remove_prefix(3);
    }

    if (not input.empty())
    {
        auto group = octet(input[0]) << 16;
        if (input.size() > 1) group |= octet(input[1]) << 8;

        *output++ = alphabet[group >> 18 & 0x3f];
        *output++ = alphabet[group >> 12 & 0x3f];
        *output++ = input.size() > 1 ? alphabet[group >> 6 & 0x3f] : '=';
        *output++ = '=';
    }
}

auto encode(std::string_view const input) -> std::string
{
    std::string output(encoded_size(input.size()), '\0');
    encode(input, output.data());
    return output;
}

auto plain_message(
    std::string_view const authzid,
    std::string_view const authcid,
    std::string_view const password
) -> std::string
{
    std::string message;
    message.reserve(authzid.size() + authcid.size() + password.size() + 2);
    message += authzid;
    message += '\0';
    message += authcid;
    message += '\0';
    message += password;
    return message;
}

auto authenticate_chunks(std::string_view const message) -> std::vector<std::string>
{
    auto const encoded = encode(message);
    std::string_view remaining = encoded;

    std::vector<std::string> chunks;
    while (not remaining.empty())
    {
        chunks.emplace_back(remaining.substr(0, chunk_size));
        remaining.remove_prefix(chunks.back().size());
    }

    if (encoded.size() % chunk_size == 0)
    {
        chunks.emplace_back("+");
    }
    return chunks;
}

} // namespace sasl
