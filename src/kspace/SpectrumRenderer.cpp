#include "SpectrumRenderer.h"
#include <algorithm>
#include <cmath>
#include <limits>

GrayscaleImage SpectrumRenderer::render(const Spectrum& spectrum) {
    if (!spectrum.isValid()) return GrayscaleImage();

    const size_t n = spectrum.re.size();
    std::vector<float> mags(n);
    for (size_t i = 0; i < n; ++i) {
        mags[i] = static_cast<float>(std::log1p(std::hypot(static_cast<double>(spectrum.re[i]),
                                                           static_cast<double>(spectrum.im[i]))));
    }
    return rescale(mags, spectrum.rows, spectrum.cols);
}

GrayscaleImage SpectrumRenderer::normalize(const SampleGrid& grid) {
    if (!grid.isValid()) return GrayscaleImage();
    return rescale(grid.samples, grid.rows, grid.cols);
}

GrayscaleImage SpectrumRenderer::rescale(const std::vector<float>& values, int rows, int cols) {
    GrayscaleImage out;
    if (rows <= 0 || cols <= 0 || values.size() != static_cast<size_t>(rows) * cols) return out;

    double minV = std::numeric_limits<double>::infinity();
    double maxV = -std::numeric_limits<double>::infinity();
    for (float v : values) {
        minV = std::min(minV, static_cast<double>(v));
        maxV = std::max(maxV, static_cast<double>(v));
    }

    // Float round-off leaves a constant image with a spread of a few ulps;
    // stretching that to 0..255 would display pure noise.
    const double magnitude = std::max({1.0, std::abs(minV), std::abs(maxV)});
    const bool flat = (maxV - minV) <= kFlatTolerance * magnitude;
    const double scale = flat ? 1.0 : 255.0 / (maxV - minV);

    out.rows = rows;
    out.cols = cols;
    out.pixels.resize(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        const double v = std::round((static_cast<double>(values[i]) - minV) * scale);
        out.pixels[i] = static_cast<uint8_t>(std::clamp(v, 0.0, 255.0));
    }
    return out;
}
