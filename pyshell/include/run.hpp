#pragma once
/**
 * @file run.hpp
 * @brief Run a script to completion and collect its messages
 *
 */

#include "options.hpp"
#include "session.hpp"
#include "temp_script.hpp"

#include <boost/asio.hpp>

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace pyshell {

/// @brief Completion signature for async_run and async_run_string
/// @param error ProcessError for an abnormal exit, or the spawn failure
/// @param messages Every message received, in order; nullopt on error or when nothing was received
using RunSig = void(std::exception_ptr error, std::optional<std::vector<Message>> messages);

namespace detail {

template <typename Handler>
auto post_failure(boost::asio::io_context& io_context, Handler&& handler, std::exception_ptr error) -> void
{
    boost::asio::post(
        io_context,
        [handler = std::forward<Handler>(handler), error]() mutable {
            std::move(handler)(error, std::nullopt);
        }
    );
}

inline constexpr auto run_initiation = []<boost::asio::completion_handler_for<RunSig> Handler>(
                                           Handler&& handler,
                                           boost::asio::io_context& io_context,
                                           std::string script,
                                           Options options
                                       ) -> void {
    std::shared_ptr<Session> session;
    try
    {
        session = Session::create(io_context, script, std::move(options));
    }
    catch (std::exception const&)
    {
        post_failure(io_context, std::forward<Handler>(handler), std::current_exception());
        return;
    }

    auto const output = std::make_shared<std::vector<Message>>();
    session->on_message([output](Message const& message) { output->push_back(message); });
    session->end(
        [handler = std::forward<Handler>(handler), output](
            std::optional<ProcessError> error,
            std::optional<int>,
            std::optional<int>
        ) mutable {
            if (error)
            {
                std::move(handler)(std::make_exception_ptr(std::move(*error)), std::nullopt);
            }
            else if (output->empty())
            {
                std::move(handler)(nullptr, std::nullopt);
            }
            else
            {
                std::move(handler)(nullptr, std::move(*output));
            }
        }
    );
};

inline constexpr auto run_string_initiation = []<boost::asio::completion_handler_for<RunSig> Handler>(
                                                  Handler&& handler,
                                                  boost::asio::io_context& io_context,
                                                  std::string code,
                                                  Options options
                                              ) -> void {
    std::optional<TempScript> staged;
    try
    {
        staged.emplace(TempScript::create(code));
    }
    catch (std::exception const&)
    {
        post_failure(io_context, std::forward<Handler>(handler), std::current_exception());
        return;
    }

    auto const path = staged->path().string();
    options.script_folder.clear();
    run_initiation(
        [handler = std::forward<Handler>(handler), staged = std::move(staged)](
            std::exception_ptr error,
            std::optional<std::vector<Message>> messages
        ) mutable {
            staged.reset();
            std::move(handler)(error, std::move(messages));
        },
        io_context,
        path,
        std::move(options)
    );
};

} // namespace detail

/**
 * @brief Run a script and collect every message it produces
 *
 * @param io_context Event loop
 * @param script Script path, joined to Options::script_folder
 * @param options Launch options
 * @param token Completion token for RunSig
 */
template <boost::asio::completion_token_for<RunSig> CompletionToken>
auto async_run(
    boost::asio::io_context& io_context,
    std::string script,
    Options options,
    CompletionToken&& token
)
{
    return boost::asio::async_initiate<CompletionToken, RunSig>(
        detail::run_initiation, token, std::ref(io_context), std::move(script), std::move(options)
    );
}

/**
 * @brief Run inline code and collect every message it produces
 *
 * The code is staged in a temporary file which is removed when the
 * run completes. Do not pass untrusted code.
 *
 * @param io_context Event loop
 * @param code Script source
 * @param options Launch options; script_folder is ignored
 * @param token Completion token for RunSig
 */
template <boost::asio::completion_token_for<RunSig> CompletionToken>
auto async_run_string(
    boost::asio::io_context& io_context,
    std::string code,
    Options options,
    CompletionToken&& token
)
{
    return boost::asio::async_initiate<CompletionToken, RunSig>(
        detail::run_string_initiation, token, std::ref(io_context), std::move(code), std::move(options)
    );
}

} // namespace pyshell
