#pragma once
/**
 * @file lifecycle.hpp
 * @brief Convergence of the completion signals of a child process
 *
 * A session is finished only after both output streams have reached
 * end-of-file and the process has been reaped. Those three events
 * arrive in any order. Each report returns true only for the single
 * call that completes the set.
 */

#include <optional>

namespace pyshell {

class Lifecycle
{
    bool stdout_ended_ = false;
    bool stderr_ended_ = false;
    bool exited_ = false;
    bool finished_ = false;

    std::optional<int> exit_code_;
    std::optional<int> exit_signal_;

    auto converge() -> bool;

public:
    /// @brief stdout reached end-of-file
    /// @return true when this report completes the terminal transition
    auto stdout_ended() -> bool;

    /// @brief stderr reached end-of-file
    /// @return true when this report completes the terminal transition
    auto stderr_ended() -> bool;

    /**
     * @brief The process was reaped
     *
     * Only the first report is recorded.
     *
     * @param exit_code Exit status for a normal exit
     * @param exit_signal Signal number for a signalled exit
     * @return true when this report completes the terminal transition
     */
    auto exited(std::optional<int> exit_code, std::optional<int> exit_signal) -> bool;

    auto has_exited() const -> bool { return exited_; }
    auto is_finished() const -> bool { return finished_; }
    auto exit_code() const -> std::optional<int> { return exit_code_; }
    auto exit_signal() const -> std::optional<int> { return exit_signal_; }

    /// @brief Exit code is present and non-zero
    auto abnormal() const -> bool { return exit_code_ && *exit_code_ != 0; }
};

} // namespace pyshell
