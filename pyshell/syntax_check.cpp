#include "syntax_check.hpp"

namespace pyshell {

auto syntax_check_args(boost::filesystem::path const& file) -> std::vector<std::string>
{
    return {"-m", "py_compile", file.string()};
}

auto syntax_check_result(
    std::string const& interpreter,
    boost::filesystem::path const& file,
    boost::system::error_code const error,
    int const exit_code,
    std::string const& stderr_text
) -> std::exception_ptr
{
    if (error)
    {
        return std::make_exception_ptr(boost::system::system_error{error, "syntax check of " + file.string()});
    }

    if (exit_code == 0)
    {
        return nullptr;
    }

    auto failure = ProcessError{ProcessErrc::SyntaxCheckFailure, stderr_text};
    failure.set_context(interpreter, {"-m", "py_compile"}, file.string(), {}, exit_code);
    return std::make_exception_ptr(std::move(failure));
}

} // namespace pyshell
