#pragma once
/**
 * @file text.hpp
 * @brief Byte-level text helpers for the IRC wire format
 *
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace lark {

/// @brief Maximum content bytes of an outbound line before CR-LF
inline constexpr std::size_t max_line_content = 510;

/// @brief True when the bytes form well-formed UTF-8
auto is_valid_utf8(std::string_view bytes) -> bool;

/**
 * @brief Decode raw line bytes into UTF-8 text
 *
 * Valid UTF-8 passes through unchanged. Otherwise the bytes are
 * decoded as Windows-1252 and, if that fails on an unassigned byte,
 * as ISO-8859-1, which accepts every byte.
 */
auto decode_line(std::string_view bytes) -> std::string;

/**
 * @brief Largest prefix length not exceeding limit that ends on a
 * UTF-8 sequence boundary
 */
auto utf8_prefix_length(std::string_view text, std::size_t limit) -> std::size_t;

/**
 * @brief Prepare one line for the wire
 *
 * Removes CR and LF characters, truncates the content to 510 bytes
 * on a character boundary, and appends CR-LF.
 */
auto frame_line(std::string_view line) -> std::string;

/**
 * @brief Split a message body into fragments for sending
 *
 * While more than one fragment remains available and the text is
 * longer than budget bytes, the text is cut at the last space that
 * keeps the head within budget (or at the last character boundary
 * when there is no such space). The final fragment holds whatever
 * remains. At most max_fragments fragments are produced.
 *
 * @param text message body
 * @param budget byte budget per fragment
 * @param max_fragments fragment limit, values below 1 are treated as 1
 */
auto split_message(std::string_view text, std::size_t budget, std::size_t max_fragments) -> std::vector<std::string>;

} // namespace lark
