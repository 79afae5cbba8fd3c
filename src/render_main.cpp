// Headless renderer: same options as the viewer, always renders to a file.

#include "cli_options.hpp"
#include "cli_render.hpp"
#include "log.hpp"

#include <spdlog/spdlog.h>

int main(int argc, char* argv[])
{
    init_logging(false);

    CliOptions opts;
    const std::string err = parse_cli(argc, argv, opts);
    if (!err.empty()) {
        spdlog::error("{}", err);
        print_usage(argv[0]);
        return 1;
    }
    if (opts.help) {
        print_usage(argv[0]);
        return 0;
    }

    Settings settings;
    if (!resolve_settings(opts, true, settings))
        return 1;
    set_debug_logging(settings.debug.log);

    return run_cli_render(settings);
}
