#include "process_error.hpp"

#include <boost/algorithm/string/trim.hpp>

namespace pyshell {

ProcessErrCategory const theProcessErrCategory;

char const* ProcessErrCategory::name() const noexcept
{
    return "pyshell";
}

std::string ProcessErrCategory::message(int ev) const
{
    switch (static_cast<ProcessErrc>(ev))
    {
    case ProcessErrc::AbnormalExit:
        return "process exited abnormally";
    case ProcessErrc::InterpreterTraceback:
        return "interpreter raised an exception";
    case ProcessErrc::SyntaxCheckFailure:
        return "syntax check failed";
    default:
        return "(unrecognized error)";
    }
}

auto make_error_code(ProcessErrc const err) -> boost::system::error_code
{
    return boost::system::error_code{int(err), theProcessErrCategory};
}

auto ProcessError::exited(int const exit_code) -> ProcessError
{
    return ProcessError{ProcessErrc::AbnormalExit, "process exited with code " + std::to_string(exit_code)};
}

auto ProcessError::set_context(
    std::string executable,
    std::vector<std::string> interpreter_options,
    std::string script,
    std::vector<std::string> args,
    std::optional<int> const exit_code
) -> void
{
    executable_ = std::move(executable);
    interpreter_options_ = std::move(interpreter_options);
    script_ = std::move(script);
    args_ = std::move(args);
    exit_code_ = exit_code;
}

namespace {

auto split_lines(std::string_view text) -> std::vector<std::string_view>
{
    std::vector<std::string_view> lines;
    for (;;)
    {
        auto const nl = text.find('\n');
        auto line = text.substr(0, nl);
        if (not line.empty() && line.back() == '\r')
        {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (nl == text.npos)
        {
            return lines;
        }
        text.remove_prefix(nl + 1);
    }
}

} // namespace

auto parse_error(std::string_view const stderr_text) -> ProcessError
{
    if (not stderr_text.starts_with(traceback_marker))
    {
        return ProcessError{ProcessErrc::AbnormalExit, std::string{stderr_text}};
    }

    auto const trimmed = boost::algorithm::trim_copy(std::string{stderr_text});
    auto lines = split_lines(trimmed);

    // The last line is the exception summary
    auto const exception = std::string{lines.back()};
    lines.pop_back();

    std::string traceback;
    std::string diagnostic = exception + "\n    ----- Python Traceback -----\n  ";
    for (std::size_t i = 1; i < lines.size(); i++)
    {
        if (i > 1)
        {
            traceback += '\n';
            diagnostic += "\n  ";
        }
        traceback += lines[i];
        diagnostic += lines[i];
    }

    auto error = ProcessError{ProcessErrc::InterpreterTraceback, exception};
    error.set_traceback(std::move(traceback), std::move(diagnostic));
    return error;
}

} // namespace pyshell
