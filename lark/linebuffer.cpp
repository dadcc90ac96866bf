#include "lark/linebuffer.hpp"

#include <algorithm>

namespace lark {

LineBuffer::LineBuffer(std::size_t const n)
    : buffer_(std::max<std::size_t>(n, 1))
{
}

auto LineBuffer::prepare() -> boost::asio::mutable_buffer
{
    if (start_ != 0) // relocate incomplete line to front of buffer
    {
        std::copy(buffer_.begin() + start_, buffer_.begin() + end_, buffer_.begin());
        search_ -= start_;
        end_ -= start_;
        start_ = 0;
    }

    if (end_ == buffer_.size())
    {
        buffer_.resize(buffer_.size() * 2);
    }

    return boost::asio::buffer(buffer_.data() + end_, buffer_.size() - end_);
}

auto LineBuffer::next_line() -> std::optional<std::string_view>
{
    auto const first = buffer_.begin() + search_;
    auto const last = buffer_.begin() + end_;
    auto const nl = std::find(first, last, '\n');
    if (nl == last) // no newline found, line incomplete
    {
        search_ = end_;
        return std::nullopt;
    }

    auto const nl_pos = static_cast<std::size_t>(nl - buffer_.begin());
    auto len = nl_pos - start_;
    if (len > 0 && buffer_[nl_pos - 1] == '\r')
    {
        len--;
    }

    std::string_view const line{buffer_.data() + start_, len};
    start_ = search_ = nl_pos + 1;
    return line;
}

} // namespace lark
