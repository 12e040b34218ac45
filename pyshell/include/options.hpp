#pragma once
/**
 * @file options.hpp
 * @brief Launch options for an interpreter session
 *
 */

#include "codec.hpp"

#include <boost/filesystem/path.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pyshell {

/// @brief Interpreter used when none is configured
#ifdef _WIN32
inline constexpr char const* default_interpreter = "python";
#else
inline constexpr char const* default_interpreter = "python3";
#endif

struct Options
{
    /// @brief Record encoding used for every role without an override
    Mode mode = Mode::Text;

    std::optional<CodecSpec<Formatter>> formatter;
    std::optional<CodecSpec<Parser>> parser;
    std::optional<CodecSpec<Parser>> stderr_parser;

    std::string encoding = "utf8";

    /// @brief Interpreter executable, bare names are found on PATH
    std::string interpreter_path = default_interpreter;

    /// @brief Interpreter flags placed before the script path
    std::vector<std::string> interpreter_options;

    /// @brief Directory the script path is relative to
    std::string script_folder;

    /// @brief Script arguments placed after the script path
    std::vector<std::string> args;

    /// @brief Working directory of the child, inherited when absent
    std::optional<boost::filesystem::path> cwd;

    /// @brief KEY=VALUE environment of the child, inherited when absent
    std::optional<std::vector<std::string>> env;
};

/**
 * @brief Path of a script as the interpreter will be given it
 *
 * @param folder Options::script_folder, ignored when empty
 * @param script Script path relative to the folder
 * @return joined path
 */
inline auto join_script_path(std::string const& folder, std::string_view const script) -> std::string
{
    if (folder.empty())
    {
        return std::string{script};
    }
    return (boost::filesystem::path{folder} / std::string{script}).string();
}

} // namespace pyshell
