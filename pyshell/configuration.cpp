#include "configuration.hpp"

#include <toml.hpp>

#include <stdexcept>
#include <vector>

namespace pyshell {

namespace {

auto options_from_toml(toml::value const& config) -> Options
{
    Options options;

    auto const mode_name = toml::find_or(config, "mode", std::string{"text"});
    if (auto const mode = mode_from_string(mode_name))
    {
        options.mode = *mode;
    }
    else
    {
        throw std::runtime_error{"unknown mode: " + mode_name};
    }

    options.encoding = toml::find_or(config, "encoding", options.encoding);
    options.interpreter_path = toml::find_or(config, "interpreter_path", options.interpreter_path);
    options.interpreter_options = toml::find_or(config, "interpreter_options", std::vector<std::string>{});
    options.script_folder = toml::find_or(config, "script_folder", std::string{});
    options.args = toml::find_or(config, "args", std::vector<std::string>{});

    if (config.contains("cwd"))
    {
        options.cwd = toml::find<std::string>(config, "cwd");
    }

    if (config.contains("env"))
    {
        std::vector<std::string> env;
        for (auto const& [key, value] : toml::find(config, "env").as_table())
        {
            env.push_back(key + "=" + value.as_string());
        }
        options.env = std::move(env);
    }

    return options;
}

} // namespace

auto parse_options(std::string const& text) -> Options
{
    return options_from_toml(toml::parse_str(text, toml::spec::v(1, 1, 0)));
}

auto load_options(boost::filesystem::path const& path) -> Options
{
    return options_from_toml(toml::parse(path.string(), toml::spec::v(1, 1, 0)));
}

} // namespace pyshell
