#include "command_line.hpp"

#include <linebuffer.hpp>
#include <safecall.hpp>
#include <session.hpp>
#include <syntax_check.hpp>

#include <boost/asio.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <unistd.h>

namespace {

auto print_message(pyshell::Message const& message, std::ostream& out) -> void
{
    if (message.is_string())
    {
        out << message.get_ref<std::string const&>() << '\n';
    }
    else
    {
        out << message.dump() << '\n';
    }
}

/**
 * @brief Input record typed by the user, in the session's encoding
 */
auto input_message(pyshell::Mode const mode, std::string_view const line) -> pyshell::Message
{
    if (mode == pyshell::Mode::Json)
    {
        return pyshell::parse::json(line);
    }
    return pyshell::parse::text(line);
}

/**
 * @brief Forward our stdin to the session until either side is done
 *
 * Text and JSON input is forwarded one line at a time; binary input
 * is forwarded as it arrives.
 */
auto stdin_thread(
    boost::asio::posix::stream_descriptor& input,
    std::shared_ptr<pyshell::Session> const session
) -> boost::asio::awaitable<void>
{
    pyshell::LineBuffer lines;
    auto const mode = session->mode();

    for (;;)
    {
        auto const buffer = lines.prepare();
        auto const [err, n] = co_await input.async_read_some(buffer, boost::asio::as_tuple(boost::asio::use_awaitable));
        if (err or not session->writable())
        {
            break;
        }

        if (mode == pyshell::Mode::Binary)
        {
            session->send(pyshell::Message(std::string{static_cast<char const*>(buffer.data()), n}));
            continue;
        }

        lines.commit(n);
        while (auto const line = lines.next_line())
        {
            pyshell::safecall("stdin", [&] { session->send(input_message(mode, *line)); });
        }
        lines.shift();
    }

    if (session->writable())
    {
        session->end(boost::asio::detached);
    }
}

auto check_syntax(CommandLine const& cfg) -> int
{
    boost::asio::io_context io_context;
    auto status = EXIT_FAILURE;

    pyshell::async_check_syntax_file(
        io_context,
        pyshell::join_script_path(cfg.options.script_folder, cfg.script),
        cfg.options.interpreter_path,
        [&status](std::exception_ptr const error) {
            if (not error)
            {
                status = EXIT_SUCCESS;
                return;
            }
            try
            {
                std::rethrow_exception(error);
            }
            catch (std::exception const& e)
            {
                std::cerr << e.what();
            }
        }
    );

    io_context.run();
    return status;
}

} // namespace

auto main(int argc, char* argv[]) -> int
{
    auto const cfg = load_command_line(argc, argv);

    if (cfg.check_only)
    {
        return check_syntax(cfg);
    }

    // A child that stops reading must not take us down with it
    std::signal(SIGPIPE, SIG_IGN);

    boost::asio::io_context io_context;
    boost::asio::posix::stream_descriptor input{io_context, STDIN_FILENO};

    std::shared_ptr<pyshell::Session> session;
    try
    {
        session = pyshell::Session::create(io_context, cfg.script, cfg.options);
    }
    catch (std::exception const& e)
    {
        std::cerr << "pyshell: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::optional<pyshell::ProcessError> failure;

    session->on_message([](pyshell::Message const& message) { print_message(message, std::cout); });
    session->on_stderr([](pyshell::Message const& message) { print_message(message, std::cerr); });
    session->on_stdout_data([mode = cfg.options.mode](std::string_view const data) {
        if (mode == pyshell::Mode::Binary) std::cout.write(data.data(), data.size()).flush();
    });
    session->on_error([&failure](pyshell::ProcessError const& error) { failure = error; });
    session->on_close([&input] {
        boost::system::error_code err;
        input.cancel(err);
        if (err)
        {
            pyshell::report_error("stdin cancel", err.message().c_str());
        }
    });

    boost::asio::co_spawn(io_context, stdin_thread(input, session), boost::asio::detached);
    io_context.run();

    if (failure)
    {
        std::cerr << failure->diagnostic() << std::endl;
        return EXIT_FAILURE;
    }

    if (auto const signal = session->exit_signal())
    {
        return 128 + *signal;
    }
    return session->exit_code().value_or(EXIT_FAILURE);
}
