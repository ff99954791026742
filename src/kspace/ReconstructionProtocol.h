#ifndef RECONSTRUCTION_PROTOCOL_H
#define RECONSTRUCTION_PROTOCOL_H

#include "KSpaceTypes.h"
#include "../core/ErrorHandling.h"
#include <QMetaType>
#include <QString>

// ============================================================================
// Messages exchanged with the reconstruction worker thread.
// All are plain values copied by the queued connection; neither side keeps
// a reference into the other's memory.
// ============================================================================

// -> worker: replace the cached spectrum
struct LoadSpectrumMessage {
    quint64 generation = 0;
    int rows = 0;
    int cols = 0;
    std::vector<float> realPlane;
    std::vector<float> imagPlane;

    static LoadSpectrumMessage fromSpectrum(quint64 generation, const Spectrum& s) {
        LoadSpectrumMessage msg;
        msg.generation = generation;
        msg.rows = s.rows;
        msg.cols = s.cols;
        msg.realPlane = s.re;
        msg.imagPlane = s.im;
        return msg;
    }

    Spectrum toSpectrum() const {
        Spectrum s;
        s.rows = rows;
        s.cols = cols;
        s.re = realPlane;
        s.im = imagPlane;
        return s;
    }
};

// -> worker: reconstruct from the circle
struct CircleReconMessage {
    quint64 sequence = 0;
    int cx = 0;
    int cy = 0;
    int radius = 1;

    CircleMask mask() const { return CircleMask{cx, cy, radius}; }
};

// <- worker
struct ReconstructedMessage {
    quint64 sequence = 0;
    int rows = 0;
    int cols = 0;
    std::vector<uint8_t> pixels;

    GrayscaleImage image() const {
        GrayscaleImage img;
        img.rows = rows;
        img.cols = cols;
        img.pixels = pixels;
        return img;
    }
};

// <- worker
struct ErrorMessage {
    quint64 sequence = 0;
    KSpaceError kind = KSpaceError::None;
    QString message;
};

Q_DECLARE_METATYPE(LoadSpectrumMessage)
Q_DECLARE_METATYPE(CircleReconMessage)
Q_DECLARE_METATYPE(ReconstructedMessage)
Q_DECLARE_METATYPE(ErrorMessage)
Q_DECLARE_METATYPE(KSpaceError)

#endif // RECONSTRUCTION_PROTOCOL_H
