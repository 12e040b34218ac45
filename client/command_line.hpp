/**
 * @file command_line.hpp
 * @brief Command-line application configuration
 *
 */

#pragma once

#include <options.hpp>

#include <string>

struct CommandLine
{
    pyshell::Options options;
    std::string script;
    bool check_only;
};

/**
 * @brief Process command-line arguments.
 *
 * Options from a configuration file given with -c are loaded first and
 * the remaining flags override them. Arguments after the script path
 * are passed to the script.
 *
 * On error this function prints usage and terminates the process.
 *
 * @param argc Number of arguments
 * @param argv Pointer to arguments
 * @return CommandLine Populated configuration value.
 */
auto load_command_line(int argc, char** argv) -> CommandLine;
