#pragma once
/**
 * @file configuration.hpp
 * @brief Session options loaded from TOML
 *
 * Recognized keys:
 *
 * ```toml
 * mode = "json"                # text, json, or binary
 * encoding = "utf8"
 * interpreter_path = "python3"
 * interpreter_options = ["-u"]
 * script_folder = "scripts"
 * args = ["--verbose"]
 * cwd = "/srv/work"
 *
 * [env]
 * PYTHONPATH = "/srv/lib"
 * ```
 *
 * Codec overrides can't be expressed in a file; they always follow
 * the mode.
 */

#include "options.hpp"

#include <boost/filesystem/path.hpp>

#include <string>

namespace pyshell {

/**
 * @brief Parse options from TOML text
 *
 * @param text TOML document
 * @return options with every missing key at its default
 * @throw toml::exception on malformed documents
 * @throw std::runtime_error on unknown modes
 */
auto parse_options(std::string const& text) -> Options;

/**
 * @brief Load options from a TOML file
 *
 * @param path Configuration file
 * @return options with every missing key at its default
 * @throw toml::exception on malformed documents
 * @throw std::runtime_error on unreadable files and unknown modes
 */
auto load_options(boost::filesystem::path const& path) -> Options;

} // namespace pyshell
