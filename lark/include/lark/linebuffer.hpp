#pragma once
/**
 * @file linebuffer.hpp
 * @brief Growable receive buffer with line-oriented extraction
 *
 */

#include <boost/asio/buffer.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace lark {

/**
 * @brief Receive buffer that splits a byte stream into lines
 *
 * Lines end at '\n' and a single preceding '\r' is removed. The
 * buffer grows when a partial line fills it, so arbitrarily long
 * lines are reassembled intact.
 */
class LineBuffer
{
    std::vector<char> buffer_;

    // [start_, end_) contains buffered data
    // [search_, end_) has not yet been scanned for a newline
    // [end_, size) is available buffer space
    std::size_t start_ = 0;
    std::size_t search_ = 0;
    std::size_t end_ = 0;

public:
    /**
     * @brief Construct a new Line Buffer object
     *
     * @param n Initial buffer size
     */
    explicit LineBuffer(std::size_t n = 4096);

    /**
     * @brief Get the available buffer space
     *
     * Space is reclaimed or grown as needed so the returned buffer
     * is never empty.
     *
     * @return boost::asio::mutable_buffer
     */
    auto prepare() -> boost::asio::mutable_buffer;

    /**
     * @brief Mark bytes written into the last prepared buffer as filled
     *
     * @param n Bytes written to the last call of prepare
     */
    auto commit(std::size_t const n) -> void
    {
        end_ += n;
    }

    /**
     * @brief Return the next complete line in the buffer
     *
     * The view is valid until the next call to prepare.
     *
     * @return line without terminator or nullopt if no line is ready
     */
    auto next_line() -> std::optional<std::string_view>;

    /// @brief Number of buffered bytes not yet returned as lines
    auto pending() const -> std::size_t
    {
        return end_ - start_;
    }
};

} // namespace lark
