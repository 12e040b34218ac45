#pragma once
/**
 * @file syntax_check.hpp
 * @brief Compile-only checks of interpreter scripts
 *
 * The interpreter is run once with `-m py_compile` against the
 * script. A zero exit means the script compiles; otherwise the check
 * fails with a SyntaxCheckFailure carrying the interpreter's stderr.
 */

#include "exec.hpp"
#include "options.hpp"
#include "process_error.hpp"
#include "temp_script.hpp"

#include <boost/asio.hpp>

#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace pyshell {

/// @brief Completion signature for syntax checks
/// @param error null on success, otherwise the ProcessError or spawn failure
using SyntaxCheckSig = void(std::exception_ptr error);

/**
 * @brief Arguments for a compile-only run of a script
 */
auto syntax_check_args(boost::filesystem::path const& file) -> std::vector<std::string>;

/**
 * @brief Interpret the result of a compile-only run
 *
 * @param interpreter Interpreter that was run
 * @param file Script that was checked
 * @param error Spawn or wait failure
 * @param exit_code Exit code of the interpreter
 * @param stderr_text Interpreter stderr
 * @return null on success, otherwise the failure
 */
auto syntax_check_result(
    std::string const& interpreter,
    boost::filesystem::path const& file,
    boost::system::error_code error,
    int exit_code,
    std::string const& stderr_text
) -> std::exception_ptr;

/**
 * @brief Check that a script file compiles without running it
 *
 * @param io_context Event loop
 * @param file Script path
 * @param interpreter Interpreter executable
 * @param token Completion token for SyntaxCheckSig
 */
template <boost::asio::completion_token_for<SyntaxCheckSig> CompletionToken>
auto async_check_syntax_file(
    boost::asio::io_context& io_context,
    boost::filesystem::path file,
    std::string interpreter,
    CompletionToken&& token
)
{
    return boost::asio::async_initiate<CompletionToken, SyntaxCheckSig>(
        []<boost::asio::completion_handler_for<SyntaxCheckSig> Handler>(
            Handler&& handler,
            boost::asio::io_context& io_context,
            boost::filesystem::path file,
            std::string interpreter
        ) {
            auto args = syntax_check_args(file);
            async_exec(
                io_context,
                interpreter,
                std::move(args),
                [handler = std::forward<Handler>(handler), interpreter, file](
                    boost::system::error_code const error,
                    ExecResult const result
                ) mutable {
                    std::move(handler)(syntax_check_result(interpreter, file, error, result.exit_code, result.stderr_text));
                }
            );
        },
        token,
        std::ref(io_context),
        std::move(file),
        std::move(interpreter)
    );
}

/**
 * @brief Check that inline code compiles without running it
 *
 * The code is staged in a temporary file which is removed when the
 * check completes.
 *
 * @param io_context Event loop
 * @param code Script source
 * @param interpreter Interpreter executable
 * @param token Completion token for SyntaxCheckSig
 */
template <boost::asio::completion_token_for<SyntaxCheckSig> CompletionToken>
auto async_check_syntax(
    boost::asio::io_context& io_context,
    std::string code,
    std::string interpreter,
    CompletionToken&& token
)
{
    return boost::asio::async_initiate<CompletionToken, SyntaxCheckSig>(
        []<boost::asio::completion_handler_for<SyntaxCheckSig> Handler>(
            Handler&& handler,
            boost::asio::io_context& io_context,
            std::string code,
            std::string interpreter
        ) {
            std::optional<TempScript> staged;
            try
            {
                staged.emplace(TempScript::create(code, "pyshellSyntaxCheck"));
            }
            catch (std::exception const&)
            {
                boost::asio::post(
                    io_context,
                    [handler = std::forward<Handler>(handler), error = std::current_exception()]() mutable {
                        std::move(handler)(error);
                    }
                );
                return;
            }

            auto file = staged->path();
            async_check_syntax_file(
                io_context,
                std::move(file),
                std::move(interpreter),
                [handler = std::forward<Handler>(handler), staged = std::move(staged)](std::exception_ptr const error) mutable {
                    staged.reset();
                    std::move(handler)(error);
                }
            );
        },
        token,
        std::ref(io_context),
        std::move(code),
        std::move(interpreter)
    );
}

} // namespace pyshell
