#pragma once
/**
 * @file safecall.hpp
 * @brief Call user handlers with error reporting to stderr
 *
 */

#include <exception>
#include <functional>
#include <utility>

namespace pyshell {

/**
 * @brief Report an error that was caught at the boundary of a handler
 *
 * @param location Location to use in error reporting
 * @param what Error description
 */
auto report_error(char const* location, char const* what) -> void;

/**
 * @brief Call a function catching and reporting all exceptions
 *
 * @param location Location to use in error reporting
 * @param f Function to call
 * @param args Arguments to pass to the function
 * @return true when the function returned normally
 */
template <typename F, typename... Args>
auto safecall(char const* const location, F&& f, Args&&... args) -> bool
{
    try
    {
        std::invoke(std::forward<F>(f), std::forward<Args>(args)...);
        return true;
    }
    catch (std::exception const& e)
    {
        report_error(location, e.what());
        return false;
    }
}

} // namespace pyshell
