#include "cli_options.hpp"

#include <args.hxx>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

namespace {

// Parser and its flags. The flags register themselves with the parser, so
// they live and die together.
struct CliParser {
    CliParser()
        : parser("Fractal Cinema - interactive Mandelbrot viewer",
                 std::string("Settings are read from ") + DEFAULT_CONFIG_FILE +
                     " when present and no --config is given."),
          help(parser, "help", "Display this help menu", {'h', "help"}),
          config(parser, "FILE", "YAML settings file", {"config"}),
          overrides(parser, "K=V", "Override one option, e.g. framebuffer.size=512", {"set"}),
          render(parser, "render", "Render the export region to an image and exit", {"render"})
    {
    }

    args::ArgumentParser               parser;
    args::HelpFlag                     help;
    args::ValueFlag<std::string>       config;
    args::ValueFlagList<std::string>   overrides;
    args::Flag                         render;
};

}  // namespace

std::string parse_cli(int argc, char* argv[], CliOptions& out)
{
    CliParser cli;
    try {
        cli.parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        out.help = true;
        return {};
    } catch (const args::ParseError& e) {
        return e.what();
    } catch (const args::ValidationError& e) {
        return e.what();
    }

    if (cli.config)    out.config_path = args::get(cli.config);
    if (cli.overrides) out.overrides   = args::get(cli.overrides);
    out.render = static_cast<bool>(cli.render);
    return {};
}

void print_usage(const char* argv0)
{
    CliParser cli;
    cli.parser.Prog(argv0);
    std::cout << cli.parser;
}

bool resolve_settings(const CliOptions& opts, bool strict, Settings& out)
{
    std::string path = opts.config_path;
    if (path.empty() && std::filesystem::exists(DEFAULT_CONFIG_FILE))
        path = DEFAULT_CONFIG_FILE;

    if (!path.empty()) {
        spdlog::info("Reading configuration from {}", path);
        const std::string err = load_settings(path.c_str(), out);
        if (!err.empty()) {
            spdlog::error("{}", err);
            if (strict) return false;
            spdlog::warn("Continuing with default settings");
        }
    }

    for (const std::string& o : opts.overrides) {
        const std::string err = apply_setting_override(o, out);
        if (!err.empty()) {
            spdlog::error("{}", err);
            return false;
        }
    }
    return true;
}
