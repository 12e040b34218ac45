#pragma once
/**
 * @file process_error.hpp
 * @brief Structured errors for abnormal interpreter termination
 *
 */

#include <boost/system/error_code.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pyshell {

struct ProcessErrCategory : boost::system::error_category
{
    char const* name() const noexcept override;
    std::string message(int) const override;
};

extern ProcessErrCategory const theProcessErrCategory;

enum class ProcessErrc
{
    AbnormalExit = 1,
    InterpreterTraceback,
    SyntaxCheckFailure,
};

auto make_error_code(ProcessErrc err) -> boost::system::error_code;

/// @brief Marker that starts an interpreter traceback on stderr
inline constexpr std::string_view traceback_marker = "Traceback";

class ProcessError final : public std::runtime_error
{
    ProcessErrc kind_;
    std::optional<std::string> traceback_;
    std::string diagnostic_;
    std::optional<int> exit_code_;
    std::string executable_;
    std::vector<std::string> interpreter_options_;
    std::string script_;
    std::vector<std::string> args_;

public:
    ProcessError(ProcessErrc kind, std::string const& message)
        : std::runtime_error{message}
        , kind_{kind}
        , diagnostic_{message}
    {
    }

    /// @brief Error raised for a non-zero exit with nothing on stderr
    static auto exited(int exit_code) -> ProcessError;

    auto kind() const -> ProcessErrc { return kind_; }
    auto code() const -> boost::system::error_code { return make_error_code(kind_); }

    /// @brief Traceback body without the marker line and summary line
    auto traceback() const -> std::optional<std::string> const& { return traceback_; }

    /// @brief Message extended with the interpreter traceback, when present
    auto diagnostic() const -> std::string const& { return diagnostic_; }

    auto exit_code() const -> std::optional<int> { return exit_code_; }
    auto executable() const -> std::string const& { return executable_; }
    auto interpreter_options() const -> std::vector<std::string> const& { return interpreter_options_; }
    auto script() const -> std::string const& { return script_; }
    auto args() const -> std::vector<std::string> const& { return args_; }

    auto set_traceback(std::string traceback, std::string diagnostic) -> void
    {
        traceback_ = std::move(traceback);
        diagnostic_ = std::move(diagnostic);
    }

    /**
     * @brief Record the command that produced this error
     *
     * @param executable Interpreter that was run
     * @param interpreter_options Flags passed before the script
     * @param script Script path
     * @param args Script arguments
     * @param exit_code Exit code of the process
     */
    auto set_context(
        std::string executable,
        std::vector<std::string> interpreter_options,
        std::string script,
        std::vector<std::string> args,
        std::optional<int> exit_code
    ) -> void;
};

/**
 * @brief Classify accumulated stderr text
 *
 * Text starting with the traceback marker yields an InterpreterTraceback
 * error whose message is the last line of the traceback. Any other
 * text becomes the message of an AbnormalExit error verbatim.
 *
 * @param stderr_text Complete stderr output of the process
 * @return classified error
 */
auto parse_error(std::string_view stderr_text) -> ProcessError;

} // namespace pyshell

namespace boost::system {
template <>
struct is_error_code_enum<pyshell::ProcessErrc> : std::true_type {};
} // namespace boost::system
