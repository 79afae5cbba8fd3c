#pragma once

// AVX escape-time kernel - implementation in escape_time_avx.cpp.
// Computes 4 pixels of one row at once.
// re4:   real coordinates of the 4 pixels
// im:    imaginary coordinate (same for all 4 pixels in a row)
// out4:  receives 4 escape depths, bit-identical to escape_depth()
void avx_escape_depth_4(const double* re4, double im, int max_iter, double* out4);
