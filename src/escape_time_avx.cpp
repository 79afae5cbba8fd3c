// Compiled with -mavx only - do NOT include from other translation units.

#include "escape_time_avx.hpp"

#include <immintrin.h>

// -----------------------------------------------------------------------
// 4-lane escape-time kernel.
//
// Mirrors escape_depth() operation for operation (no FMA) so that every
// lane produces the same double as the scalar path:
//   new_zr = (zr^2 - zi^2) + cr
//   new_zi = (zr + zr) * zi + ci
// and the escape test runs on the freshly updated z.
// -----------------------------------------------------------------------
void avx_escape_depth_4(const double* re4, double im, int max_iter, double* out4)
{
    const __m256d cr   = _mm256_loadu_pd(re4);
    const __m256d ci   = _mm256_set1_pd(im);
    const __m256d four = _mm256_set1_pd(4.0);

    __m256d zr = _mm256_setzero_pd();
    __m256d zi = _mm256_setzero_pd();

    // active: all bits set for lanes that have not yet escaped
    __m256d active   = _mm256_castsi256_pd(_mm256_set1_epi64x(-1LL));
    // escape_n: step index at which each lane escaped
    __m256d escape_n = _mm256_setzero_pd();

    for (int n = 0; n < max_iter; ++n) {
        const __m256d zr2    = _mm256_mul_pd(zr, zr);
        const __m256d zi2    = _mm256_mul_pd(zi, zi);
        const __m256d new_zr = _mm256_add_pd(_mm256_sub_pd(zr2, zi2), cr);
        const __m256d new_zi = _mm256_add_pd(_mm256_mul_pd(_mm256_add_pd(zr, zr), zi), ci);

        // Freeze escaped lanes
        zr = _mm256_blendv_pd(zr, new_zr, active);
        zi = _mm256_blendv_pd(zi, new_zi, active);

        const __m256d mag2 = _mm256_add_pd(_mm256_mul_pd(zr, zr), _mm256_mul_pd(zi, zi));
        const __m256d just_esc = _mm256_and_pd(
            _mm256_cmp_pd(mag2, four, _CMP_GT_OQ), active);

        escape_n = _mm256_blendv_pd(escape_n,
                                    _mm256_set1_pd(static_cast<double>(n)), just_esc);
        active   = _mm256_andnot_pd(just_esc, active);

        if (_mm256_movemask_pd(active) == 0) break;
    }

    alignas(32) double steps[4];
    _mm256_store_pd(steps, escape_n);
    const int still_active = _mm256_movemask_pd(active);

    // Division done per lane in scalar so rounding matches escape_depth()
    for (int k = 0; k < 4; ++k) {
        out4[k] = (still_active & (1 << k))
                ? 1.0
                : steps[k] / static_cast<double>(max_iter);
    }
}
