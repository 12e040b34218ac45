#pragma once
/**
 * @file linebuffer.hpp
 * @brief A growable line buffering class
 *
 * One LineBuffer is kept per child output stream. Bytes are read
 * directly into the buffer, complete lines are handed out in order,
 * and the trailing partial line is kept for the next read.
 */

#include <boost/asio/buffer.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace pyshell {

/**
 * @brief Growable buffer with line-oriented dispatch
 *
 */
class LineBuffer
{
    std::vector<char> buffer_;

    // [0, start_) has already been handed out by next_line
    // [start_, end_) contains buffered data not yet returned as a line
    // [search_, end_) has not been searched for a terminator yet
    // [end_, buffer_.size()) is available buffer space
    std::size_t start_;
    std::size_t search_;
    std::size_t end_;

public:
    /**
     * @brief Construct a new Line Buffer object
     *
     * @param n Initial buffer size, grown on demand
     */
    explicit LineBuffer(std::size_t n = 4096)
        : buffer_(n == 0 ? 1 : n)
        , start_{0}
        , search_{0}
        , end_{0}
    {
    }

    /**
     * @brief Get the available buffer space
     *
     * The buffer is grown when it is full, so the result is never empty.
     * Any previously returned line views are invalidated.
     *
     * @return boost::asio::mutable_buffer
     */
    auto prepare() -> boost::asio::mutable_buffer;

    /**
     * @brief Commit new buffer bytes
     *
     * The first n bytes of the buffer returned by the last call to
     * prepare will be considered to be populated.
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
     * The line terminator is not included. Both \n and \r\n are
     * accepted. This function should be repeatedly called until it
     * returns nullopt. After that shift can be used to reclaim the
     * previously used buffer.
     *
     * @return line contents or nullopt if no line is ready
     */
    auto next_line() -> std::optional<std::string_view>;

    /**
     * @brief Reclaim used buffer space invalidating all previous
     * next_line() results.
     */
    auto shift() -> void;

    /**
     * @brief Buffered bytes that do not yet form a complete line
     *
     * Only meaningful after next_line() has returned nullopt.
     */
    auto pending() const -> std::string_view
    {
        return {buffer_.data() + start_, end_ - start_};
    }

    /**
     * @brief Append a chunk and dispatch every line it completes
     *
     * @param chunk Bytes received from the stream
     * @param line_cb Callback function to run on each completed line
     */
    auto add_bytes(std::string_view chunk, std::invocable<std::string_view> auto line_cb) -> void
    {
        while (not chunk.empty())
        {
            auto const space = prepare();
            auto const n = std::min(space.size(), chunk.size());
            std::copy_n(chunk.data(), n, static_cast<char*>(space.data()));
            commit(n);
            chunk.remove_prefix(n);
        }

        while (auto const line = next_line())
        {
            line_cb(*line);
        }
        shift();
    }
};

} // namespace pyshell
