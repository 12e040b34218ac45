#include "lifecycle.hpp"

namespace pyshell {

auto Lifecycle::converge() -> bool
{
    if (finished_ || not stdout_ended_ || not stderr_ended_ || not exited_)
    {
        return false;
    }
    finished_ = true;
    return true;
}

auto Lifecycle::stdout_ended() -> bool
{
    stdout_ended_ = true;
    return converge();
}

auto Lifecycle::stderr_ended() -> bool
{
    stderr_ended_ = true;
    return converge();
}

auto Lifecycle::exited(std::optional<int> const exit_code, std::optional<int> const exit_signal) -> bool
{
    if (not exited_)
    {
        exited_ = true;
        exit_code_ = exit_code;
        exit_signal_ = exit_signal;
    }
    return converge();
}

} // namespace pyshell
