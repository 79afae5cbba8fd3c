#include "log.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>

void init_logging(bool debug)
{
    try {
        auto logger = spdlog::stderr_color_mt("fractal-cinema");
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        // Logger already registered (second init); keep the existing one.
        std::fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    }
    set_debug_logging(debug);
}

void set_debug_logging(bool debug)
{
    spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::info);
}
