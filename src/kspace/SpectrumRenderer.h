#ifndef SPECTRUM_RENDERER_H
#define SPECTRUM_RENDERER_H

#include "KSpaceTypes.h"
#include <vector>

/**
 * @brief Turns spectra and reconstructions into displayable 8-bit rasters.
 *
 * Both paths share one linear rescale: (v - min) / (max - min) * 255,
 * rounded and clamped. A flat input (max == min) uses a scale of 1.
 */
class SpectrumRenderer {
public:
    // log(1 + |c|) per coefficient, then rescaled. Never mutates the spectrum.
    static GrayscaleImage render(const Spectrum& spectrum);

    // Linear rescale of an inverse transform result.
    static GrayscaleImage normalize(const SampleGrid& grid);

    static GrayscaleImage rescale(const std::vector<float>& values, int rows, int cols);

    // Relative spread below which an input counts as flat.
    static constexpr double kFlatTolerance = 1e-6;
};

#endif // SPECTRUM_RENDERER_H
