#pragma once

#include "settings.hpp"

#include <string>
#include <vector>

constexpr const char* DEFAULT_CONFIG_FILE = "fractal_cinema.yaml";

struct CliOptions {
    std::string              config_path;   // empty: DEFAULT_CONFIG_FILE if present
    std::vector<std::string> overrides;     // "section.key=value"
    bool                     render = false;
    bool                     help   = false;
};

// Returns empty string on success, or an error message on failure.
std::string parse_cli(int argc, char* argv[], CliOptions& out);

void print_usage(const char* argv0);

// Reads the config file, then applies the overrides.
// strict: a config-file error is fatal; otherwise it is logged and the
// defaults are kept. A bad override is always fatal. Returns false on a
// fatal error (already logged).
bool resolve_settings(const CliOptions& opts, bool strict, Settings& out);
