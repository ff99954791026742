#ifndef FOURIER_TRANSFORM_H
#define FOURIER_TRANSFORM_H

#include "KSpaceTypes.h"
#include "../core/ErrorHandling.h"
#include <complex>
#include <optional>
#include <vector>

/**
 * @brief Centered 2D discrete Fourier transform.
 *
 * Forward: samples are multiplied by (-1)^(x+y) before transforming, which
 * places the zero frequency at (cols/2, rows/2) without a quadrant swap.
 * Rows are transformed first, then columns. The inverse runs columns then
 * rows, scales by 1/(rows*cols), keeps the real part and undoes the flip.
 *
 * Power-of-two lengths use an iterative radix-2 FFT, every other length
 * goes through Bluestein's chirp-z reformulation on a padded radix-2 FFT,
 * so all sizes are O(N log N). Results are deterministic for a given input.
 */
class FourierTransform {
public:
    using Complex = std::complex<double>;

    /**
     * @brief Forward transform of a sample grid.
     * Fails with InvalidDimensions when rows or cols <= 0 (or the sample
     * count does not match).
     */
    static Result<Spectrum> forward(const SampleGrid& grid);

    /**
     * @brief Inverse transform, optionally restricted to a circular mask.
     * Coefficients strictly outside the circle are treated as zero.
     * Without a mask the full spectrum is used.
     */
    static Result<SampleGrid> inverse(const Spectrum& spectrum,
                                      const std::optional<CircleMask>& mask = std::nullopt);

    /**
     * @brief In-place 1D DFT of any length. The inverse applies the 1/N scale.
     */
    static void transform1D(std::vector<Complex>& data, bool inverse);

    static bool isPowerOfTwo(size_t n) { return n != 0 && (n & (n - 1)) == 0; }

private:
    // Unscaled in both directions; size must be a power of two.
    static void radix2(std::vector<Complex>& data, bool inverse);
    static void bluestein(std::vector<Complex>& data, bool inverse);

    static void transformRows(std::vector<Complex>& work, int rows, int cols, bool inverse);
    static void transformColumns(std::vector<Complex>& work, int rows, int cols, bool inverse);

    static double checkerboard(int x, int y) { return ((x + y) & 1) ? -1.0 : 1.0; }
};

#endif // FOURIER_TRANSFORM_H
