#ifndef KSPACE_TYPES_H
#define KSPACE_TYPES_H

#include <QImage>
#include <QMetaType>
#include <algorithm>
#include <cstdint>
#include <vector>

// ============================================================================
// SampleGrid: rows x cols real intensities (0-255 scale), row-major
// ============================================================================
struct SampleGrid {
    int rows = 0;
    int cols = 0;
    std::vector<float> samples;

    SampleGrid() = default;
    SampleGrid(int r, int c, float fill = 0.0f)
        : rows(r), cols(c), samples(static_cast<size_t>(r > 0 ? r : 0) * (c > 0 ? c : 0), fill) {}

    bool isValid() const {
        return rows > 0 && cols > 0 && samples.size() == static_cast<size_t>(rows) * cols;
    }

    size_t index(int x, int y) const { return static_cast<size_t>(y) * cols + x; }
    float at(int x, int y) const { return samples[index(x, y)]; }
    float& at(int x, int y) { return samples[index(x, y)]; }
};

// ============================================================================
// Spectrum: centered 2D frequency coefficients as parallel planes.
// (x, y) maps to offset y * cols + x; zero frequency sits at (cols/2, rows/2).
// ============================================================================
struct Spectrum {
    int rows = 0;
    int cols = 0;
    std::vector<float> re;
    std::vector<float> im;

    bool isValid() const {
        const size_t n = static_cast<size_t>(rows) * cols;
        return rows > 0 && cols > 0 && re.size() == n && im.size() == n;
    }

    size_t index(int x, int y) const { return static_cast<size_t>(y) * cols + x; }
};

// ============================================================================
// CircleMask: natural (spectrum) pixel coordinates. Inclusive boundary.
// The center may lie outside the grid; only valid indices are ever visited.
// ============================================================================
struct CircleMask {
    int cx = 0;
    int cy = 0;
    int radius = 1;

    bool contains(int x, int y) const {
        const int64_t dx = static_cast<int64_t>(x) - cx;
        const int64_t dy = static_cast<int64_t>(y) - cy;
        const int64_t r = radius;
        return radius >= 0 && dx * dx + dy * dy <= r * r;
    }

    bool operator==(const CircleMask& o) const {
        return cx == o.cx && cy == o.cy && radius == o.radius;
    }
    bool operator!=(const CircleMask& o) const { return !(*this == o); }
};

// ============================================================================
// GrayscaleImage: 8-bit single channel raster, row-major
// ============================================================================
struct GrayscaleImage {
    int rows = 0;
    int cols = 0;
    std::vector<uint8_t> pixels;

    bool isValid() const {
        return rows > 0 && cols > 0 && pixels.size() == static_cast<size_t>(rows) * cols;
    }

    uint8_t at(int x, int y) const { return pixels[static_cast<size_t>(y) * cols + x]; }

    /** Deep copy into a QImage (Format_Grayscale8). Null image if invalid. */
    QImage toQImage() const {
        if (!isValid()) return QImage();
        QImage img(cols, rows, QImage::Format_Grayscale8);
        for (int y = 0; y < rows; ++y) {
            std::copy(pixels.begin() + static_cast<size_t>(y) * cols,
                      pixels.begin() + static_cast<size_t>(y + 1) * cols,
                      img.scanLine(y));
        }
        return img;
    }
};

/** The normalized masked inverse transform handed back to the host. */
using ReconstructionResult = GrayscaleImage;

Q_DECLARE_METATYPE(CircleMask)
Q_DECLARE_METATYPE(GrayscaleImage)

#endif // KSPACE_TYPES_H
