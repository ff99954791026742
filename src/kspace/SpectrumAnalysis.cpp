#include "SpectrumAnalysis.h"
#include "FourierTransform.h"
#include "SpectrumRenderer.h"
#include "../core/Logger.h"
#include <QElapsedTimer>

Result<ImageAnalysis> SpectrumAnalysis::analyze(const SampleGrid& grid) {
    QElapsedTimer timer;
    timer.start();

    Result<Spectrum> spectrum = FourierTransform::forward(grid);
    if (!spectrum) {
        return Result<ImageAnalysis>(spectrum.errorKind(), spectrum.error());
    }

    Result<SampleGrid> recon = FourierTransform::inverse(spectrum.value());
    if (!recon) {
        return Result<ImageAnalysis>(recon.errorKind(), recon.error());
    }

    ImageAnalysis analysis;
    analysis.grid = grid;
    analysis.spectrum = spectrum.take();
    analysis.kspace = SpectrumRenderer::render(analysis.spectrum);
    analysis.reconstruction = SpectrumRenderer::normalize(recon.value());

    Logger::info(QString("Analysed %1x%2 image in %3 ms")
                     .arg(grid.cols).arg(grid.rows).arg(timer.elapsed()), "Transform");
    return Result<ImageAnalysis>(std::move(analysis));
}
