/**
 * @file sasl.hpp
 * @brief SASL payload construction for the IRC AUTHENTICATE command
 *
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sasl {

/// @brief Largest base64 payload carried by one AUTHENTICATE line
inline constexpr std::size_t chunk_size = 400;

/**
 * @brief Calculate the size of the buffer needed to encode a base64 string
 *
 * @param len Length of the input string
 * @return size_t Size of the output buffer needed for base64 encoding
 */
inline constexpr auto encoded_size(std::size_t const len) -> std::size_t
{
    return (len + 2) / 3 * 4;
}

/**
 * @brief Encode bytes into padded base64
 *
 * @param input input bytes
 * @param output Target buffer of at least encoded_size bytes
 */
auto encode(std::string_view input, char* output) -> void;

/// @brief Encode bytes into a new padded base64 string
auto encode(std::string_view input) -> std::string;

/**
 * @brief Build the PLAIN mechanism message
 *
 * @param authzid authorization identity, usually the account name
 * @param authcid authentication identity
 * @param password account password
 * @return authzid NUL authcid NUL password
 */
auto plain_message(std::string_view authzid, std::string_view authcid, std::string_view password) -> std::string;

/**
 * @brief Split a mechanism message into AUTHENTICATE arguments
 *
 * The message is base64 encoded and cut into 400 byte pieces. An
 * empty message, or one whose encoding is an exact multiple of 400
 * bytes, is terminated by a lone "+".
 *
 * @param message raw mechanism message
 * @return arguments for successive AUTHENTICATE commands
 */
auto authenticate_chunks(std::string_view message) -> std::vector<std::string>;

} // namespace sasl
