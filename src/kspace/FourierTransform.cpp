#include "FourierTransform.h"
#include "../core/Logger.h"
#include <algorithm>
#include <cmath>
#include <cstdint>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {

constexpr double kPi = 3.14159265358979323846;

size_t nextPowerOfTwo(size_t n) {
    size_t p = 1;
    while (p < n) p <<= 1;
    return p;
}

} // namespace

// ============================================================================
// 1D transforms
// ============================================================================

void FourierTransform::transform1D(std::vector<Complex>& data, bool inverse) {
    const size_t n = data.size();
    if (n <= 1) return;

    if (isPowerOfTwo(n)) {
        radix2(data, inverse);
    } else {
        bluestein(data, inverse);
    }

    if (inverse) {
        const double scale = 1.0 / static_cast<double>(n);
        for (Complex& v : data) v *= scale;
    }
}

void FourierTransform::radix2(std::vector<Complex>& a, bool inverse) {
    const size_t n = a.size();

    // Bit-reversal permutation
    for (size_t i = 1, j = 0; i < n; ++i) {
        size_t bit = n >> 1;
        for (; j & bit; bit >>= 1) j ^= bit;
        j ^= bit;
        if (i < j) std::swap(a[i], a[j]);
    }

    const double sign = inverse ? 1.0 : -1.0;
    for (size_t len = 2; len <= n; len <<= 1) {
        const size_t half = len / 2;
        const double step = sign * 2.0 * kPi / static_cast<double>(len);
        for (size_t k = 0; k < half; ++k) {
            // Twiddles are evaluated directly; repeated multiplication drifts.
            const Complex w = std::polar(1.0, step * static_cast<double>(k));
            for (size_t i = k; i < n; i += len) {
                const Complex u = a[i];
                const Complex v = a[i + half] * w;
                a[i] = u + v;
                a[i + half] = u - v;
            }
        }
    }
}

// X_k = w_k * sum_j (x_j w_j) conj(w_{k-j}),  w_k = exp(-+ i pi k^2 / n)
void FourierTransform::bluestein(std::vector<Complex>& data, bool inverse) {
    const size_t n = data.size();
    const size_t m = nextPowerOfTwo(2 * n - 1);
    const double sign = inverse ? 1.0 : -1.0;

    std::vector<Complex> chirp(n);
    const uint64_t period = 2 * static_cast<uint64_t>(n);
    for (size_t k = 0; k < n; ++k) {
        // k^2 mod 2n keeps the angle small and exact for large k
        const uint64_t k2 = (static_cast<uint64_t>(k) * k) % period;
        chirp[k] = std::polar(1.0, sign * kPi * static_cast<double>(k2) / static_cast<double>(n));
    }

    std::vector<Complex> a(m, Complex(0.0, 0.0));
    std::vector<Complex> b(m, Complex(0.0, 0.0));
    for (size_t k = 0; k < n; ++k) {
        a[k] = data[k] * chirp[k];
    }
    b[0] = std::conj(chirp[0]);
    for (size_t k = 1; k < n; ++k) {
        b[k] = std::conj(chirp[k]);
        b[m - k] = std::conj(chirp[k]);
    }

    radix2(a, false);
    radix2(b, false);
    for (size_t i = 0; i < m; ++i) a[i] *= b[i];
    radix2(a, true);

    const double scale = 1.0 / static_cast<double>(m);
    for (size_t k = 0; k < n; ++k) {
        data[k] = a[k] * scale * chirp[k];
    }
}

// ============================================================================
// 2D passes
// ============================================================================

void FourierTransform::transformRows(std::vector<Complex>& work, int rows, int cols, bool inverse) {
    #pragma omp parallel for
    for (int y = 0; y < rows; ++y) {
        std::vector<Complex> line(work.begin() + static_cast<size_t>(y) * cols,
                                  work.begin() + static_cast<size_t>(y + 1) * cols);
        transform1D(line, inverse);
        std::copy(line.begin(), line.end(), work.begin() + static_cast<size_t>(y) * cols);
    }
}

void FourierTransform::transformColumns(std::vector<Complex>& work, int rows, int cols, bool inverse) {
    #pragma omp parallel for
    for (int x = 0; x < cols; ++x) {
        std::vector<Complex> line(rows);
        for (int y = 0; y < rows; ++y) line[y] = work[static_cast<size_t>(y) * cols + x];
        transform1D(line, inverse);
        for (int y = 0; y < rows; ++y) work[static_cast<size_t>(y) * cols + x] = line[y];
    }
}

// ============================================================================
// Public API
// ============================================================================

Result<Spectrum> FourierTransform::forward(const SampleGrid& grid) {
    QString err;
    if (!validateDimensions(grid.rows, grid.cols, &err)) {
        return Result<Spectrum>(KSpaceError::InvalidDimensions, err);
    }
    if (!grid.isValid()) {
        return Result<Spectrum>(KSpaceError::InvalidDimensions,
            QString("Sample count %1 does not match %2x%3").arg(grid.samples.size()).arg(grid.rows).arg(grid.cols));
    }

    const int rows = grid.rows;
    const int cols = grid.cols;
    const size_t n = static_cast<size_t>(rows) * cols;

    std::vector<Complex> work(n);
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            const size_t i = static_cast<size_t>(y) * cols + x;
            work[i] = Complex(grid.samples[i] * checkerboard(x, y), 0.0);
        }
    }

    transformRows(work, rows, cols, false);
    transformColumns(work, rows, cols, false);
    Logger::debug(QString("Forward transform %1x%2").arg(cols).arg(rows), "Transform");

    Spectrum spectrum;
    spectrum.rows = rows;
    spectrum.cols = cols;
    spectrum.re.resize(n);
    spectrum.im.resize(n);
    for (size_t i = 0; i < n; ++i) {
        spectrum.re[i] = static_cast<float>(work[i].real());
        spectrum.im[i] = static_cast<float>(work[i].imag());
    }
    return Result<Spectrum>(std::move(spectrum));
}

Result<SampleGrid> FourierTransform::inverse(const Spectrum& spectrum, const std::optional<CircleMask>& mask) {
    QString err;
    if (!validateDimensions(spectrum.rows, spectrum.cols, &err)) {
        return Result<SampleGrid>(KSpaceError::InvalidDimensions, err);
    }
    if (!spectrum.isValid()) {
        return Result<SampleGrid>(KSpaceError::InvalidDimensions,
            QString("Spectrum planes do not match %1x%2").arg(spectrum.rows).arg(spectrum.cols));
    }

    const int rows = spectrum.rows;
    const int cols = spectrum.cols;
    const size_t n = static_cast<size_t>(rows) * cols;

    std::vector<Complex> work(n, Complex(0.0, 0.0));
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            if (mask && !mask->contains(x, y)) continue;
            const size_t i = static_cast<size_t>(y) * cols + x;
            work[i] = Complex(spectrum.re[i], spectrum.im[i]);
        }
    }

    transformColumns(work, rows, cols, true);
    transformRows(work, rows, cols, true);
    if (mask) {
        Logger::debug(QString("Masked inverse %1x%2, circle (%3,%4) r=%5")
                          .arg(cols).arg(rows).arg(mask->cx).arg(mask->cy).arg(mask->radius), "Transform");
    }

    SampleGrid grid(rows, cols);
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            const size_t i = static_cast<size_t>(y) * cols + x;
            grid.samples[i] = static_cast<float>(work[i].real() * checkerboard(x, y));
        }
    }
    return Result<SampleGrid>(std::move(grid));
}
