#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QImage>
#include <QPoint>
#include "core/AppSettings.h"
#include "kspace/SpectrumAnalysis.h"

class QAction;
class QLabel;
class QPushButton;
class KSpaceCanvas;
class PreviewPanel;
class MaskController;
class ReconstructionService;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    // Decodes and analyses in the background; the newest request wins.
    void openImage(const QString& path);
    void openImage(const QImage& image, const QString& label);

    /** Reload the last session's image if the settings allow it. */
    void restoreSession();

protected:
    void closeEvent(QCloseEvent* event) override;
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dropEvent(QDropEvent* event) override;

private slots:
    void onOpenFile();
    void onRemoveImage();
    void onToggleSelection(bool on);
    void onExportKSpace();
    void onExportReconstruction();
    void onShowSourcePreview();

    void onMaskSettled(const QPoint& center, int radiusNatural);
    void onRadiusPreview(int radiusPx);
    void onReconstruction(quint64 sequence, const ReconstructionResult& result);
    void onServiceFailed(quint64 sequence, KSpaceError kind, const QString& message);

private:
    // Result of the background decode + analysis of one image.
    struct AnalysisJob {
        quint64 generation = 0;
        QString sourcePath;
        QString label;
        QImage thumbnail;
        bool ok = false;
        KSpaceError errorKind = KSpaceError::None;
        QString error;
        ImageAnalysis analysis;
    };

    void createActions();
    void createLayout();
    void startAnalysis(quint64 generation, const QString& path, const QImage& image, const QString& label);
    void applyAnalysis(const AnalysisJob& job);
    void setSelectionEnabled(bool on);
    void clearOutputs();
    void updateActions();
    void showStatus(const QString& message, int timeoutMs = 0);
    void showError(const QString& title, const QString& message);
    bool exportImage(const GrayscaleImage& image, const QString& suggestedName);

    AppSettings m_settings;

    // Engine
    ReconstructionService* m_service = nullptr;
    MaskController* m_controller = nullptr;

    // Current image state
    quint64 m_generation = 0;
    bool m_hasAnalysis = false;
    ImageAnalysis m_analysis;
    GrayscaleImage m_currentReconstruction;
    QString m_sourceLabel;

    // Widgets
    PreviewPanel* m_sourcePanel = nullptr;
    KSpaceCanvas* m_canvas = nullptr;
    PreviewPanel* m_reconPanel = nullptr;
    QPushButton* m_selectButton = nullptr;
    QPushButton* m_removeButton = nullptr;
    QLabel* m_maskLabel = nullptr;

    QAction* m_openAction = nullptr;
    QAction* m_removeAction = nullptr;
    QAction* m_exportKSpaceAction = nullptr;
    QAction* m_exportReconAction = nullptr;
};

#endif // MAINWINDOW_H
