#include "linebuffer.hpp"

#include <algorithm>

namespace pyshell {

auto LineBuffer::prepare() -> boost::asio::mutable_buffer
{
    if (end_ == buffer_.size())
    {
        if (start_ != 0)
        {
            shift();
        }
        else // a single incomplete line fills the whole buffer
        {
            buffer_.resize(buffer_.size() * 2);
        }
    }
    return boost::asio::buffer(buffer_.data() + end_, buffer_.size() - end_);
}

auto LineBuffer::next_line() -> std::optional<std::string_view>
{
    auto const first = buffer_.begin();
    auto const nl = std::find(first + search_, first + end_, '\n');
    if (nl == first + end_) // no newline found, line incomplete
    {
        search_ = end_;
        return std::nullopt;
    }

    auto const nl_pos = static_cast<std::size_t>(nl - first);

    // Support both \n and \r\n
    auto line_end = nl_pos;
    if (start_ < line_end && buffer_[line_end - 1] == '\r')
    {
        line_end--;
    }

    auto const result = std::string_view{buffer_.data() + start_, line_end - start_};
    start_ = search_ = nl_pos + 1;

    return result;
}

auto LineBuffer::shift() -> void
{
    if (start_ != 0) // relocate incomplete line to front of buffer
    {
        auto const first = buffer_.begin();
        std::move(first + start_, first + end_, first);
        end_ -= start_;
        search_ -= start_;
        start_ = 0;
    }
}

} // namespace pyshell
