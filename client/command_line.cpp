#include "command_line.hpp"

#include <configuration.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <unistd.h>

[[noreturn]] static void usage(void)
{
    std::cerr <<
    "usage: pyshell\n"
    "         [-c config.toml]\n"
    "         [-m text|json|binary]\n"
    "         [-p interpreter]\n"
    "         [-s]\n"
    "         [-h]\n"
    "         script [args...]\n";
    exit(EXIT_FAILURE);
}

auto load_command_line(int argc, char** argv) -> CommandLine
{
    CommandLine cfg {};

    char const* config_path = nullptr;
    char const* mode = nullptr;
    char const* interpreter = nullptr;

    // + stops at the script so its own flags are left alone
    char const* const flags = "+:c:hm:p:s";
    int opt;
    while ((opt = getopt(argc, argv, flags)) != -1) {
        switch (opt) {
        default: usage();
        case '?': std::cerr << "Unknown flag: " << char(optopt) << std::endl; usage();
        case ':': std::cerr << "Missing flag argument: " << char(optopt) << std::endl; usage();
        case 'h': usage();
        case 'c': config_path     = optarg; break;
        case 'm': mode            = optarg; break;
        case 'p': interpreter     = optarg; break;
        case 's': cfg.check_only  = true; break;
        }
    }

    argv += optind;
    argc -= optind;

    if (nullptr != config_path) {
        try {
            cfg.options = pyshell::load_options(config_path);
        } catch (std::exception const& e) {
            std::cerr << "Bad configuration file " << config_path << ": " << e.what() << std::endl;
            usage();
        }
    }

    bool show_usage = false;

    if (nullptr != mode) {
        if (auto const m = pyshell::mode_from_string(mode)) {
            cfg.options.mode = *m;
        } else {
            std::cerr << "Mode should be text, json, or binary (-m).\n";
            show_usage = true;
        }
    }

    if (nullptr != interpreter) {
        cfg.options.interpreter_path = interpreter;
    }

    if (0 == argc) {
        std::cerr << "Script path required.\n";
        show_usage = true;
    } else {
        cfg.script = argv[0];
        cfg.options.args.insert(cfg.options.args.end(), argv + 1, argv + argc);
    }

    if (show_usage) {
        usage();
    }

    return cfg;
}
