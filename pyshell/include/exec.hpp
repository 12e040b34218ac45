#pragma once
/**
 * @file exec.hpp
 * @brief Asynchronous one-shot process execution
 *
 * Runs a process to completion with stdin bound to the null device and
 * completes with its exit code and everything it wrote to stdout and
 * stderr. This is the bounded request/response form used by the
 * syntax check; interactive exchanges use Session.
 */

#include <boost/asio.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>

#include <memory>
#include <string>
#include <vector>

namespace pyshell {

/// @brief Everything a finished one-shot process produced
struct ExecResult
{
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
};

/// @brief Completion signature for async_exec
/// @param error Spawn or wait failure
/// @param result Exit code and captured output
using ExecSig = void(boost::system::error_code error, ExecResult result);

namespace detail {

template <boost::asio::completion_handler_for<ExecSig> Handler>
class OneShot : public std::enable_shared_from_this<OneShot<Handler>>
{
    Handler handler_;
    boost::asio::readable_pipe stdout_;
    boost::asio::readable_pipe stderr_;
    boost::process::v2::process proc_;

    // stdout, stderr, and exit
    int outstanding_ = 3;

    ExecResult result_;
    boost::system::error_code error_;

    auto finish_one() -> void
    {
        if (0 == --outstanding_)
        {
            std::move(handler_)(error_, std::move(result_));
        }
    }

    auto collect(boost::asio::readable_pipe& pipe, std::string& text) -> void
    {
        boost::asio::async_read(
            pipe,
            boost::asio::dynamic_buffer(text),
            [self = this->shared_from_this()](boost::system::error_code, std::size_t) { self->finish_one(); }
        );
    }

public:
    OneShot(Handler&& handler, boost::asio::io_context& io_context)
        : handler_{std::move(handler)}
        , stdout_{io_context}
        , stderr_{io_context}
        , proc_{io_context}
    {
    }

    auto start(boost::asio::io_context& io_context, boost::filesystem::path const& file, std::vector<std::string> const& args) -> void
    {
        try
        {
            proc_ = boost::process::v2::process{
                io_context,
                file,
                args,
                boost::process::v2::process_stdio{.in = nullptr, .out = {stdout_}, .err = {stderr_}}
            };
        }
        catch (boost::system::system_error const& e)
        {
            error_ = e.code();
            outstanding_ = 1;
            boost::asio::post(io_context, [self = this->shared_from_this()] { self->finish_one(); });
            return;
        }

        collect(stdout_, result_.stdout_text);
        collect(stderr_, result_.stderr_text);

        proc_.async_wait(
            [self = this->shared_from_this()](boost::system::error_code const err, int const exit_code) {
                self->error_ = err;
                self->result_.exit_code = exit_code;
                self->finish_one();
            }
        );
    }
};

} // namespace detail

/**
 * @brief Run a process to completion collecting its output
 *
 * @param io_context Event loop
 * @param file Executable, bare names are found on PATH
 * @param args Process arguments
 * @param token Completion token for ExecSig
 */
template <boost::asio::completion_token_for<ExecSig> CompletionToken>
auto async_exec(
    boost::asio::io_context& io_context,
    boost::filesystem::path file,
    std::vector<std::string> args,
    CompletionToken&& token
)
{
    return boost::asio::async_initiate<CompletionToken, ExecSig>(
        []<boost::asio::completion_handler_for<ExecSig> Handler>(
            Handler&& handler,
            boost::asio::io_context& io_context,
            boost::filesystem::path file,
            std::vector<std::string> const& args
        ) {
            if (not file.has_parent_path())
            {
                file = boost::process::v2::environment::find_executable(file);
            }
            auto const self = std::make_shared<detail::OneShot<std::decay_t<Handler>>>(std::forward<Handler>(handler), io_context);
            self->start(io_context, file, args);
        },
        token,
        std::ref(io_context),
        std::move(file),
        std::move(args)
    );
}

} // namespace pyshell
