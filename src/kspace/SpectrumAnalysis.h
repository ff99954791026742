#ifndef SPECTRUM_ANALYSIS_H
#define SPECTRUM_ANALYSIS_H

#include "KSpaceTypes.h"
#include "../core/ErrorHandling.h"

/**
 * @brief Everything derived once from a newly loaded image.
 */
struct ImageAnalysis {
    SampleGrid grid;
    Spectrum spectrum;
    GrayscaleImage kspace;          ///< Log-magnitude rendering
    GrayscaleImage reconstruction;  ///< Unmasked inverse, normalized
};

class SpectrumAnalysis {
public:
    /**
     * @brief Forward transform, k-space rendering and full reconstruction.
     * Pure; safe to run on a pool thread.
     */
    static Result<ImageAnalysis> analyze(const SampleGrid& grid);
};

#endif // SPECTRUM_ANALYSIS_H
