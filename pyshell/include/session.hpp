#pragma once
/**
 * @file session.hpp
 * @brief Interactive interpreter session exchanging records over stdio
 *
 * A session spawns the interpreter on creation. Outbound messages are
 * encoded and written to the child's stdin. Complete stdout and stderr
 * records are decoded and delivered to the registered handlers. The
 * session finishes once both output streams are closed and the child
 * has been reaped; at that point the close handler and the completion
 * handler given to end() each run exactly once.
 *
 * Handlers should be registered right after create(), before the
 * io_context gets a chance to run.
 */

#include "codec.hpp"
#include "lifecycle.hpp"
#include "linebuffer.hpp"
#include "options.hpp"
#include "process_error.hpp"

#include <boost/asio.hpp>
#include <boost/process/v2/process.hpp>

#include <csignal>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pyshell {

/// @brief Completion signature for Session::end
/// @param error Error for an abnormal exit
/// @param exit_code Exit code for a normal exit
/// @param exit_signal Signal number for a signalled exit
using EndSig = void(std::optional<ProcessError> error, std::optional<int> exit_code, std::optional<int> exit_signal);

class Session final : public std::enable_shared_from_this<Session>
{
public:
    using MessageHandler = std::function<void(Message const&)>;
    using DataHandler = std::function<void(std::string_view)>;
    using ErrorHandler = std::function<void(ProcessError const&)>;
    using CloseHandler = std::function<void()>;

private:
    struct Private
    {
        explicit Private() = default;
    };

    boost::asio::writable_pipe stdin_;
    boost::asio::readable_pipe stdout_;
    boost::asio::readable_pipe stderr_;
    boost::process::v2::process proc_;

    Mode mode_;
    Codec codec_;
    std::string executable_;
    std::vector<std::string> interpreter_options_;
    std::vector<std::string> args_;
    std::string script_path_;
    std::vector<std::string> command_;

    LineBuffer stdout_buffer_;
    LineBuffer stderr_buffer_;
    std::string stderr_text_;

    std::deque<std::string> write_queue_;
    std::vector<std::string> write_inflight_;
    bool writing_;
    bool end_requested_;

    Lifecycle lifecycle_;
    bool terminated_;
    std::optional<ProcessError> final_error_;

    MessageHandler on_message_;
    MessageHandler on_stderr_;
    DataHandler on_stdout_data_;
    DataHandler on_stderr_data_;
    ErrorHandler on_error_;
    CloseHandler on_close_;
    boost::asio::any_completion_handler<EndSig> end_handler_;

public:
    Session(Private, boost::asio::io_context&, Options&&, std::string script_path);

    Session(Session const&) = delete;
    Session(Session&&) = delete;
    auto operator=(Session const&) -> Session& = delete;
    auto operator=(Session&&) -> Session& = delete;

    /**
     * @brief Spawn the interpreter and start a session
     *
     * @param io_context Event loop driving the session
     * @param script Script path, joined to Options::script_folder
     * @param options Launch options
     * @return new session
     * @throw boost::system::system_error when the interpreter can't be spawned
     * @throw std::invalid_argument for an unsupported encoding
     */
    static auto create(boost::asio::io_context& io_context, std::string_view script, Options options) -> std::shared_ptr<Session>;

    /**
     * @brief Encode a message and queue it for the child's stdin
     *
     * Non-binary modes terminate the record with a newline.
     *
     * @param message Message to send
     * @return this session for chaining
     * @throw std::invalid_argument for a non-string message in binary mode
     */
    auto send(Message const& message) -> Session&;

    /**
     * @brief Close the child's stdin and wait for the session to finish
     *
     * The stdin pipe is closed once queued messages are written. The
     * completion handler runs once, at the terminal transition.
     *
     * @param token Completion token for EndSig
     * @throw std::logic_error when end was already requested and the session is still running
     */
    template <boost::asio::completion_token_for<EndSig> CompletionToken>
    auto end(CompletionToken&& token)
    {
        return boost::asio::async_initiate<CompletionToken, EndSig>(
            [self = shared_from_this()](boost::asio::any_completion_handler<EndSig> handler) {
                self->end_impl(std::move(handler));
            },
            token
        );
    }

    /**
     * @brief Send a signal to the child and mark the session terminated
     *
     * The close and completion handlers still run once, after the
     * streams close and the child is reaped.
     *
     * @param signal Signal number
     * @return this session for chaining
     * @throw std::system_error when the signal can't be delivered
     */
    auto terminate(int signal = SIGTERM) -> Session&;

    auto on_message(MessageHandler handler) -> Session& { on_message_ = std::move(handler); return *this; }
    auto on_stderr(MessageHandler handler) -> Session& { on_stderr_ = std::move(handler); return *this; }
    auto on_stdout_data(DataHandler handler) -> Session& { on_stdout_data_ = std::move(handler); return *this; }
    auto on_stderr_data(DataHandler handler) -> Session& { on_stderr_data_ = std::move(handler); return *this; }
    auto on_error(ErrorHandler handler) -> Session& { on_error_ = std::move(handler); return *this; }
    auto on_close(CloseHandler handler) -> Session& { on_close_ = std::move(handler); return *this; }

    auto terminated() const -> bool { return terminated_; }

    /// @brief send() is still accepted
    auto writable() const -> bool { return not end_requested_ && stdin_.is_open(); }

    auto exit_code() const -> std::optional<int> { return lifecycle_.exit_code(); }
    auto exit_signal() const -> std::optional<int> { return lifecycle_.exit_signal(); }
    auto mode() const -> Mode { return mode_; }
    auto script_path() const -> std::string const& { return script_path_; }
    auto executable() const -> std::string const& { return executable_; }

    /// @brief Arguments passed to the interpreter: options, script, script arguments
    auto command() const -> std::vector<std::string> const& { return command_; }

    /// @brief Everything the child has written to stderr so far
    auto stderr_text() const -> std::string const& { return stderr_text_; }

private:
    auto start() -> void;
    auto read_stdout() -> void;
    auto read_stderr() -> void;
    auto write_actual() -> void;
    auto close_stdin() -> void;
    auto end_impl(boost::asio::any_completion_handler<EndSig> handler) -> void;
    auto finish() -> void;
};

} // namespace pyshell
