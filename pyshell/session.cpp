#include "session.hpp"

#include "safecall.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <cerrno>
#include <iterator>
#include <stdexcept>
#include <system_error>

#include <signal.h>
#include <sys/wait.h>

namespace pyshell {

namespace process = boost::process::v2;

namespace {

/**
 * @brief Decode one record and hand it to the subscriber
 *
 * Decoder failures are reported and the record is dropped.
 */
auto deliver(
    char const* const location,
    Parser const& parser,
    Session::MessageHandler const handler,
    std::string_view const record
) -> void
{
    std::optional<Message> message;
    if (safecall(location, [&] { message = parser(record); }) && handler)
    {
        safecall(location, handler, *message);
    }
}

} // namespace

Session::Session(
    Private,
    boost::asio::io_context& io_context,
    Options&& options,
    std::string script_path
)
    : stdin_{io_context}
    , stdout_{io_context}
    , stderr_{io_context}
    , proc_{io_context}
    , mode_{options.mode}
    , codec_{resolve_codec(options.mode, options.formatter, options.parser, options.stderr_parser)}
    , executable_{std::move(options.interpreter_path)}
    , interpreter_options_{std::move(options.interpreter_options)}
    , args_{std::move(options.args)}
    , script_path_{std::move(script_path)}
    , writing_{false}
    , end_requested_{false}
    , terminated_{false}
{
    command_ = interpreter_options_;
    command_.push_back(script_path_);
    command_.insert(command_.end(), args_.begin(), args_.end());
}

auto Session::create(
    boost::asio::io_context& io_context,
    std::string_view const script,
    Options options
) -> std::shared_ptr<Session>
{
    if (not boost::algorithm::iequals(options.encoding, "utf8") &&
        not boost::algorithm::iequals(options.encoding, "utf-8"))
    {
        throw std::invalid_argument{"unsupported encoding: " + options.encoding};
    }

    auto cwd = std::move(options.cwd);
    auto env = std::move(options.env);
    auto script_path = join_script_path(options.script_folder, script);

    auto const self = std::make_shared<Session>(Private{}, io_context, std::move(options), std::move(script_path));

    boost::filesystem::path file = self->executable_;
    if (not file.has_parent_path())
    {
        file = process::environment::find_executable(file);
        if (file.empty())
        {
            throw boost::system::system_error{
                make_error_code(boost::system::errc::no_such_file_or_directory),
                "interpreter not found: " + self->executable_};
        }
    }

    auto const spawn = [&](auto&&... inits) {
        self->proc_ = process::process{
            io_context,
            file,
            self->command_,
            process::process_stdio{
                .in = {self->stdin_},
                .out = {self->stdout_},
                .err = {self->stderr_},
            },
            std::forward<decltype(inits)>(inits)...
        };
    };

    if (cwd && env)
    {
        spawn(process::process_start_dir{*cwd}, process::process_environment{*env});
    }
    else if (cwd)
    {
        spawn(process::process_start_dir{*cwd});
    }
    else if (env)
    {
        spawn(process::process_environment{*env});
    }
    else
    {
        spawn();
    }

    self->start();
    return self;
}

auto Session::start() -> void
{
    read_stdout();
    read_stderr();

    proc_.async_wait(
        [self = shared_from_this()](boost::system::error_code const err, int) {
            std::optional<int> exit_code;
            std::optional<int> exit_signal;
            if (err)
            {
                report_error("process wait", err.message().c_str());
            }
            else
            {
                auto const status = self->proc_.native_exit_code();
                if (WIFSIGNALED(status))
                {
                    exit_signal = WTERMSIG(status);
                }
                else
                {
                    exit_code = WEXITSTATUS(status);
                }
            }

            if (self->lifecycle_.exited(exit_code, exit_signal))
            {
                self->finish();
            }
        }
    );
}

auto Session::read_stdout() -> void
{
    auto const buffer = stdout_buffer_.prepare();
    stdout_.async_read_some(
        buffer,
        [self = shared_from_this(), buffer](boost::system::error_code const err, std::size_t const n) {
            if (err)
            {
                if (err != boost::asio::error::eof)
                {
                    report_error("stdout", err.message().c_str());
                }
                if (self->lifecycle_.stdout_ended())
                {
                    self->finish();
                }
                return;
            }

            if (auto const handler = self->on_stdout_data_)
            {
                safecall("stdout data handler", handler, std::string_view{static_cast<char const*>(buffer.data()), n});
            }

            // Without a parser the bytes are passed through only
            if (auto const& parser = self->codec_.parser)
            {
                auto& lines = self->stdout_buffer_;
                lines.commit(n);
                while (auto const line = lines.next_line())
                {
                    deliver("stdout parser", parser, self->on_message_, *line);
                }
                lines.shift();
            }

            self->read_stdout();
        }
    );
}

auto Session::read_stderr() -> void
{
    auto const buffer = stderr_buffer_.prepare();
    stderr_.async_read_some(
        buffer,
        [self = shared_from_this(), buffer](boost::system::error_code const err, std::size_t const n) {
            if (err)
            {
                if (err != boost::asio::error::eof)
                {
                    report_error("stderr", err.message().c_str());
                }
                if (self->lifecycle_.stderr_ended())
                {
                    self->finish();
                }
                return;
            }

            auto const chunk = std::string_view{static_cast<char const*>(buffer.data()), n};
            self->stderr_text_ += chunk;

            if (auto const handler = self->on_stderr_data_)
            {
                safecall("stderr data handler", handler, chunk);
            }

            if (auto const& parser = self->codec_.stderr_parser)
            {
                auto& lines = self->stderr_buffer_;
                lines.commit(n);
                while (auto const line = lines.next_line())
                {
                    deliver("stderr parser", parser, self->on_stderr_, *line);
                }
                lines.shift();
            }

            self->read_stderr();
        }
    );
}

auto Session::send(Message const& message) -> Session&
{
    if (not writable())
    {
        throw std::logic_error{"session input is closed"};
    }

    auto data = codec_.formatter ? codec_.formatter(message) : format::binary(message);
    if (mode_ != Mode::Binary)
    {
        data += '\n';
    }

    write_queue_.push_back(std::move(data));
    if (not writing_)
    {
        writing_ = true;
        write_actual();
    }
    return *this;
}

auto Session::write_actual() -> void
{
    write_inflight_.assign(std::make_move_iterator(write_queue_.begin()), std::make_move_iterator(write_queue_.end()));
    write_queue_.clear();

    std::vector<boost::asio::const_buffer> buffers;
    buffers.reserve(write_inflight_.size());
    for (auto const& data : write_inflight_)
    {
        buffers.push_back(boost::asio::buffer(data));
    }

    boost::asio::async_write(
        stdin_,
        buffers,
        [self = shared_from_this()](boost::system::error_code const error, std::size_t) {
            self->write_inflight_.clear();
            if (error)
            {
                // The child stopped reading or the session finished; nothing queued can be delivered
                if (error != boost::asio::error::broken_pipe && error != boost::asio::error::operation_aborted)
                {
                    report_error("stdin", error.message().c_str());
                }
                self->write_queue_.clear();
                self->writing_ = false;
                self->close_stdin();
            }
            else if (self->write_queue_.empty())
            {
                self->writing_ = false;
                if (self->end_requested_)
                {
                    self->close_stdin();
                }
            }
            else
            {
                self->write_actual();
            }
        }
    );
}

auto Session::close_stdin() -> void
{
    if (stdin_.is_open())
    {
        boost::system::error_code err;
        stdin_.close(err);
        if (err)
        {
            report_error("stdin close", err.message().c_str());
        }
    }
}

auto Session::end_impl(boost::asio::any_completion_handler<EndSig> handler) -> void
{
    if (lifecycle_.is_finished())
    {
        boost::asio::post(
            stdin_.get_executor(),
            [handler = std::move(handler), error = final_error_, exit_code = exit_code(), exit_signal = exit_signal()]() mutable {
                std::move(handler)(std::move(error), exit_code, exit_signal);
            }
        );
        return;
    }

    if (end_requested_)
    {
        throw std::logic_error{"session end already requested"};
    }

    end_handler_ = std::move(handler);
    end_requested_ = true;
    if (not writing_)
    {
        close_stdin();
    }
}

auto Session::terminate(int const signal) -> Session&
{
    // Once reaped the pid may belong to another process
    if (not lifecycle_.has_exited())
    {
        if (-1 == ::kill(proc_.id(), signal) && errno != ESRCH)
        {
            throw std::system_error{errno, std::generic_category(), "failed to signal process"};
        }
    }
    terminated_ = true;
    return *this;
}

auto Session::finish() -> void
{
    std::optional<ProcessError> error;
    if (lifecycle_.abnormal())
    {
        auto const code = *lifecycle_.exit_code();
        error = stderr_text_.empty() ? ProcessError::exited(code) : parse_error(stderr_text_);
        error->set_context(executable_, interpreter_options_, script_path_, args_, code);

        // Without a subscriber the error only reaches the completion handler, if any
        if (auto const handler = on_error_)
        {
            safecall("error handler", handler, *error);
        }
    }

    terminated_ = true;
    final_error_ = error;
    close_stdin();

    // Release every handler; they may hold references to this session
    auto const on_close = std::move(on_close_);
    auto end_handler = std::move(end_handler_);
    on_message_ = nullptr;
    on_stderr_ = nullptr;
    on_stdout_data_ = nullptr;
    on_stderr_data_ = nullptr;
    on_error_ = nullptr;
    on_close_ = nullptr;

    if (on_close)
    {
        safecall("close handler", on_close);
    }

    if (end_handler)
    {
        safecall("end handler", [&] {
            std::move(end_handler)(std::move(error), lifecycle_.exit_code(), lifecycle_.exit_signal());
        });
    }
}

} // namespace pyshell
