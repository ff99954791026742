#include "MainWindow.h"
#include "core/Logger.h"
#include "core/Version.h"
#include "dialogs/ImagePreviewDialog.h"
#include "io/ImageLoader.h"
#include "io/ImageWriter.h"
#include "kspace/MaskController.h"
#include "kspace/ReconstructionService.h"
#include "kspace/SpectrumRenderer.h"
#include "widgets/KSpaceCanvas.h"
#include "widgets/PreviewPanel.h"

#include <QAction>
#include <QCloseEvent>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFileDialog>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QMenuBar>
#include <QMimeData>
#include <QPushButton>
#include <QSettings>
#include <QStatusBar>
#include <QTimer>
#include <QToolBar>
#include <QUrl>
#include <QVBoxLayout>
#include <QtConcurrent/QtConcurrent>

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
{
    setObjectName("MainWindow");
    setWindowTitle(tr("K-Space Lab v%1").arg(KSpaceLab::getVersion()));
    setAcceptDrops(true);

    m_settings = AppSettings::load();

    MaskController::Config cfg;
    cfg.debounceMs = m_settings.debounceMs;
    cfg.initialRadiusPx = m_settings.initialRadiusPx;
    cfg.minRadiusPx = m_settings.minRadiusPx;
    cfg.handleHitRadiusPx = m_settings.handleHitRadiusPx;
    m_controller = new MaskController(cfg, this);

    m_service = new ReconstructionService(this);

    createActions();
    createLayout();

    connect(m_controller, &MaskController::maskSettled, this, &MainWindow::onMaskSettled);
    connect(m_controller, &MaskController::radiusPreview, this, &MainWindow::onRadiusPreview);
    connect(m_service, &ReconstructionService::resultReady, this, &MainWindow::onReconstruction);
    connect(m_service, &ReconstructionService::failed, this, &MainWindow::onServiceFailed);
    connect(m_service, &ReconstructionService::busyChanged, m_reconPanel, &PreviewPanel::setBusy);
    connect(m_service, &ReconstructionService::spectrumLoaded, this, [this](int rows, int cols) {
        showStatus(tr("Spectrum ready (%1 x %2)").arg(cols).arg(rows), 4000);
    });

    m_service->start();

    QSettings settings("KSpaceLab", "KSpaceLab");
    if (settings.contains("MainWindow/geometry")) {
        restoreGeometry(settings.value("MainWindow/geometry").toByteArray());
    } else {
        resize(1200, 520);
    }

    updateActions();
    showStatus(tr("Open an image or drop one onto the window"));
}

MainWindow::~MainWindow() {
    m_service->shutdown();
}

// ============================================================================
// UI construction
// ============================================================================

void MainWindow::createActions() {
    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));

    m_openAction = fileMenu->addAction(tr("&Open Image..."), this, &MainWindow::onOpenFile);
    m_openAction->setShortcut(QKeySequence::Open);

    m_removeAction = fileMenu->addAction(tr("&Remove Selected Image"), this, &MainWindow::onRemoveImage);

    fileMenu->addSeparator();
    m_exportKSpaceAction = fileMenu->addAction(tr("Export &K-space..."), this, &MainWindow::onExportKSpace);
    m_exportReconAction = fileMenu->addAction(tr("Export &Reconstruction..."), this, &MainWindow::onExportReconstruction);

    fileMenu->addSeparator();
    QAction* quit = fileMenu->addAction(tr("&Quit"), this, &QWidget::close);
    quit->setShortcut(QKeySequence::Quit);

    QToolBar* toolbar = addToolBar(tr("Main"));
    toolbar->setObjectName("MainToolbar");
    toolbar->setMovable(false);
    toolbar->addAction(m_openAction);
    toolbar->addAction(m_exportKSpaceAction);
    toolbar->addAction(m_exportReconAction);
}

void MainWindow::createLayout() {
    QWidget* central = new QWidget(this);
    QHBoxLayout* mainLayout = new QHBoxLayout(central);
    mainLayout->setContentsMargins(8, 8, 8, 8);
    mainLayout->setSpacing(8);

    // --- Left column: source and controls ---
    QVBoxLayout* leftCol = new QVBoxLayout();

    m_sourcePanel = new PreviewPanel(tr("Source"), tr("No image"), central);
    m_sourcePanel->setClickable(true);
    connect(m_sourcePanel, &PreviewPanel::clicked, this, &MainWindow::onShowSourcePreview);
    leftCol->addWidget(m_sourcePanel, 1);

    QGroupBox* editBox = new QGroupBox(tr("Edit K-space"), central);
    QVBoxLayout* editLayout = new QVBoxLayout(editBox);

    m_selectButton = new QPushButton(tr("Select region"), editBox);
    m_selectButton->setCheckable(true);
    connect(m_selectButton, &QPushButton::toggled, this, &MainWindow::onToggleSelection);
    editLayout->addWidget(m_selectButton);

    m_removeButton = new QPushButton(tr("Remove selected image"), editBox);
    connect(m_removeButton, &QPushButton::clicked, this, &MainWindow::onRemoveImage);
    editLayout->addWidget(m_removeButton);

    m_maskLabel = new QLabel(editBox);
    m_maskLabel->setStyleSheet("color: #a0a0a0;");
    m_maskLabel->setWordWrap(true);
    editLayout->addWidget(m_maskLabel);

    leftCol->addWidget(editBox);
    mainLayout->addLayout(leftCol, 1);

    // --- Center: k-space with the selection overlay ---
    QGroupBox* kspaceBox = new QGroupBox(tr("K-space (log magnitude)"), central);
    QVBoxLayout* kspaceLayout = new QVBoxLayout(kspaceBox);
    kspaceLayout->setContentsMargins(6, 6, 6, 6);
    m_canvas = new KSpaceCanvas(kspaceBox);
    m_canvas->setController(m_controller);
    kspaceLayout->addWidget(m_canvas);
    mainLayout->addWidget(kspaceBox, 2);

    // --- Right: reconstruction ---
    m_reconPanel = new PreviewPanel(tr("Reconstructed Image"), tr("No reconstruction"), central);
    mainLayout->addWidget(m_reconPanel, 2);

    setCentralWidget(central);
}

void MainWindow::updateActions() {
    m_removeAction->setEnabled(m_hasAnalysis);
    m_removeButton->setEnabled(m_hasAnalysis);
    m_selectButton->setEnabled(m_hasAnalysis);
    m_exportKSpaceAction->setEnabled(m_hasAnalysis);
    m_exportReconAction->setEnabled(m_currentReconstruction.isValid());
}

void MainWindow::showStatus(const QString& message, int timeoutMs) {
    statusBar()->showMessage(message, timeoutMs);
}

void MainWindow::showError(const QString& title, const QString& message) {
    reportUserError(title, message);
    statusBar()->showMessage(QString("%1: %2").arg(title, message));
}

// ============================================================================
// Image loading
// ============================================================================

void MainWindow::onOpenFile() {
    QSettings settings("KSpaceLab", "KSpaceLab");
    const QString initialDir = settings.value("MainWindow/lastOpenDir").toString();

    const QString path = QFileDialog::getOpenFileName(this, tr("Open Image"), initialDir,
                                                      ImageLoader::fileDialogFilter());
    if (path.isEmpty()) return;

    settings.setValue("MainWindow/lastOpenDir", QFileInfo(path).absolutePath());
    openImage(path);
}

void MainWindow::openImage(const QString& path) {
    if (!ImageLoader::isSupportedImage(path)) {
        showError(tr("Open Image"), tr("Please select an image file"));
        return;
    }
    startAnalysis(++m_generation, path, QImage(), QFileInfo(path).fileName());
}

void MainWindow::openImage(const QImage& image, const QString& label) {
    if (image.isNull()) {
        showError(tr("Open Image"), tr("Please select an image file"));
        return;
    }
    startAnalysis(++m_generation, QString(), image, label);
}

void MainWindow::startAnalysis(quint64 generation, const QString& path, const QImage& image, const QString& label) {
    const int maxDim = m_settings.maxDimension;
    showStatus(tr("Analysing %1...").arg(label));
    Logger::info(QString("Analysing %1 (generation %2)").arg(label).arg(generation), "App");

    QFuture<AnalysisJob> future = QtConcurrent::run([generation, path, image, label, maxDim]() {
        AnalysisJob job;
        job.generation = generation;
        job.sourcePath = path;
        job.label = label;

        Result<SampleGrid> grid = path.isEmpty() ? ImageLoader::fromQImage(image, maxDim)
                                                 : ImageLoader::loadFile(path, maxDim);
        if (!grid) {
            job.errorKind = grid.errorKind();
            job.error = grid.error();
            return job;
        }

        job.thumbnail = path.isEmpty() ? image : QImage(path);
        if (job.thumbnail.isNull()) job.thumbnail = SpectrumRenderer::normalize(grid.value()).toQImage();

        Result<ImageAnalysis> analysis = SpectrumAnalysis::analyze(grid.value());
        if (!analysis) {
            job.errorKind = analysis.errorKind();
            job.error = analysis.error();
            return job;
        }

        job.analysis = analysis.take();
        job.ok = true;
        return job;
    });

    QFutureWatcher<AnalysisJob>* watcher = new QFutureWatcher<AnalysisJob>(this);
    connect(watcher, &QFutureWatcher<AnalysisJob>::finished, this, [this, watcher]() {
        const AnalysisJob job = watcher->result();
        watcher->deleteLater();

        // A newer open or a removal happened while this one was running.
        if (job.generation != m_generation) {
            Logger::debug(QString("Discarded analysis generation %1").arg(job.generation), "App");
            return;
        }
        applyAnalysis(job);
    });
    watcher->setFuture(future);
}

void MainWindow::applyAnalysis(const AnalysisJob& job) {
    if (!job.ok) {
        showError(tr("Open Image"), QString("%1 (%2)").arg(job.error, errorKindName(job.errorKind)));
        return;
    }

    setSelectionEnabled(false);

    m_analysis = job.analysis;
    m_hasAnalysis = true;
    m_sourceLabel = job.label;
    m_currentReconstruction = m_analysis.reconstruction;

    m_sourcePanel->setImage(job.thumbnail);
    m_canvas->setImage(m_analysis.kspace.toQImage());
    m_reconPanel->setImage(m_analysis.reconstruction.toQImage());
    m_maskLabel->clear();

    if (!m_service->load(m_analysis.spectrum)) {
        showError(tr("Reconstruction"), tr("Worker unavailable; selection will not update the reconstruction"));
    }

    m_settings.lastImage = job.sourcePath;
    m_settings.save();

    updateActions();
    showStatus(tr("%1: %2 x %3").arg(job.label).arg(m_analysis.grid.cols).arg(m_analysis.grid.rows));
}

void MainWindow::restoreSession() {
    if (!m_settings.restoreLastImage || m_settings.lastImage.isEmpty()) return;

    if (!QFileInfo::exists(m_settings.lastImage)) {
        reportWarning("Session", QString("Last session image is gone: %1").arg(m_settings.lastImage));
        m_settings.lastImage.clear();
        m_settings.save();
        return;
    }
    openImage(m_settings.lastImage);
}

void MainWindow::clearOutputs() {
    m_sourcePanel->clear();
    m_canvas->clear();
    m_reconPanel->clear();
    m_maskLabel->clear();
    m_analysis = ImageAnalysis();
    m_currentReconstruction = GrayscaleImage();
    m_hasAnalysis = false;
}

void MainWindow::onRemoveImage() {
    ++m_generation;
    setSelectionEnabled(false);
    clearOutputs();

    m_settings.lastImage.clear();
    m_settings.save();

    updateActions();
    showStatus(tr("Image removed"), 3000);
    Logger::info("Image removed", "App");
}

void MainWindow::onShowSourcePreview() {
    if (!m_sourcePanel->hasImage()) return;
    ImagePreviewDialog dlg(m_sourcePanel->image(), m_sourceLabel, this);
    dlg.exec();
}

// ============================================================================
// Selection and reconstruction
// ============================================================================

void MainWindow::setSelectionEnabled(bool on) {
    // Route through the button so its text and checked state stay in sync.
    if (m_selectButton->isChecked() != on) {
        m_selectButton->setChecked(on);
    } else {
        onToggleSelection(on);
    }
}

void MainWindow::onToggleSelection(bool on) {
    m_selectButton->setText(on ? tr("Stop selecting") : tr("Select region"));

    if (!m_hasAnalysis) {
        m_controller->setActive(false);
        return;
    }

    // Activation commits the centered mask, which requests a reconstruction.
    m_controller->setActive(on);

    if (!on) {
        m_currentReconstruction = m_analysis.reconstruction;
        m_reconPanel->setImage(m_currentReconstruction.toQImage());
        m_maskLabel->clear();
        updateActions();
    }
    m_canvas->update();
}

void MainWindow::onMaskSettled(const QPoint& center, int radiusNatural) {
    const QString text = tr("Mask center (%1, %2), radius %3").arg(center.x()).arg(center.y()).arg(radiusNatural);
    m_maskLabel->setText(text);
    showStatus(text);

    m_service->reconstruct(CircleMask{center.x(), center.y(), radiusNatural});
}

void MainWindow::onRadiusPreview(int radiusPx) {
    showStatus(tr("Radius %1 px").arg(radiusPx));
}

void MainWindow::onReconstruction(quint64 sequence, const ReconstructionResult& result) {
    // Selection was switched off while this was in flight.
    if (!m_controller->isActive()) return;

    m_currentReconstruction = result;
    m_reconPanel->setImage(result.toQImage());
    updateActions();
    Logger::debug(QString("Applied reconstruction #%1").arg(sequence), "App");
}

void MainWindow::onServiceFailed(quint64 sequence, KSpaceError kind, const QString& message) {
    Q_UNUSED(sequence);
    // The displayed mask is kept; only the reconstruction is stale.
    showError(tr("Reconstruction"), QString("%1 (%2)").arg(message, errorKindName(kind)));
}

// ============================================================================
// Export
// ============================================================================

bool MainWindow::exportImage(const GrayscaleImage& image, const QString& suggestedName) {
    QSettings settings("KSpaceLab", "KSpaceLab");
    const QString dir = settings.value("MainWindow/lastExportDir").toString();

    QString path = QFileDialog::getSaveFileName(this, tr("Export PNG"),
                                                dir.isEmpty() ? suggestedName : dir + "/" + suggestedName,
                                                tr("PNG Image (*.png)"));
    if (path.isEmpty()) return false;
    if (!path.endsWith(".png", Qt::CaseInsensitive)) path += ".png";
    settings.setValue("MainWindow/lastExportDir", QFileInfo(path).absolutePath());

    QString err;
    if (!ImageWriter::savePng(image, path, &err)) {
        showError(tr("Export"), err);
        return false;
    }
    showStatus(tr("Saved %1").arg(QFileInfo(path).fileName()), 4000);
    return true;
}

void MainWindow::onExportKSpace() {
    if (!m_hasAnalysis) return;
    exportImage(m_analysis.kspace, QFileInfo(m_sourceLabel).completeBaseName() + "_kspace.png");
}

void MainWindow::onExportReconstruction() {
    if (!m_currentReconstruction.isValid()) return;
    exportImage(m_currentReconstruction, QFileInfo(m_sourceLabel).completeBaseName() + "_recon.png");
}

// ============================================================================
// Window events
// ============================================================================

void MainWindow::dragEnterEvent(QDragEnterEvent* event) {
    const QMimeData* mimeData = event->mimeData();
    if (mimeData->hasUrls()) {
        for (const QUrl& url : mimeData->urls()) {
            if (url.isLocalFile() && ImageLoader::isSupportedImage(url.toLocalFile())) {
                event->acceptProposedAction();
                return;
            }
        }
    }
    if (mimeData->hasImage()) {
        event->acceptProposedAction();
        return;
    }
    event->ignore();
}

void MainWindow::dropEvent(QDropEvent* event) {
    const QMimeData* mimeData = event->mimeData();
    if (mimeData->hasUrls()) {
        for (const QUrl& url : mimeData->urls()) {
            if (url.isLocalFile()) {
                openImage(url.toLocalFile());
                event->acceptProposedAction();
                return;
            }
        }
    }
    if (mimeData->hasImage()) {
        openImage(qvariant_cast<QImage>(mimeData->imageData()), tr("Dropped image"));
        event->acceptProposedAction();
        return;
    }
    event->ignore();
}

void MainWindow::closeEvent(QCloseEvent* event) {
    QSettings settings("KSpaceLab", "KSpaceLab");
    settings.setValue("MainWindow/geometry", saveGeometry());

    m_settings.save();
    m_service->shutdown();
    Logger::info("Main window closed", "App");
    event->accept();
}
