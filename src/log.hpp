#pragma once

// Installs the "fractal-cinema" stderr logger as the spdlog default.
// debug = true lowers the level to debug (viewport / resolution tracing).
void init_logging(bool debug);

// Runtime toggle for the debug.log option.
void set_debug_logging(bool debug);
