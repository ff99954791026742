#ifndef RECONSTRUCTION_SERVICE_H
#define RECONSTRUCTION_SERVICE_H

#include "ReconstructionProtocol.h"
#include <QObject>
#include <QSet>
#include <QThread>

// ============================================================================
// ReconstructionWorker: lives on the compute thread, owns the cached spectrum
// ============================================================================
class ReconstructionWorker : public QObject {
    Q_OBJECT
public:
    explicit ReconstructionWorker(QObject* parent = nullptr);

    /**
     * @brief Masked inverse transform of @p spectrum, normalized to 8 bits.
     * Idempotent: the same spectrum and mask always give the same pixels.
     */
    static Result<ReconstructionResult> reconstruct(const Spectrum& spectrum, const CircleMask& mask);

public slots:
    void loadSpectrum(const LoadSpectrumMessage& msg);
    void circleRecon(const CircleReconMessage& msg);

signals:
    void spectrumLoaded(quint64 generation, int rows, int cols);
    void reconstructed(const ReconstructedMessage& msg);
    void failed(const ErrorMessage& msg);

private:
    Spectrum m_spectrum;
    quint64 m_generation = 0;
};

// ============================================================================
// ReconstructionService: interaction-thread front end
// ============================================================================
/**
 * @brief Runs masked reconstructions on a dedicated worker thread.
 *
 * Requests are delivered to the worker in arrival order over a queued
 * connection. Each reconstruct() call gets a monotonically increasing
 * sequence number; a reply is forwarded through resultReady() only if it
 * is newer than the last one forwarded, so a slow old result can never
 * overwrite a newer one. Loading a new spectrum invalidates every request
 * issued before it.
 *
 * Usage:
 * @code
 *   m_service = new ReconstructionService(this);
 *   connect(m_service, &ReconstructionService::resultReady, this, &MainWindow::onReconstruction);
 *   m_service->start();
 *   m_service->load(analysis.spectrum);
 *   m_service->reconstruct(CircleMask{cx, cy, r});
 * @endcode
 */
class ReconstructionService : public QObject {
    Q_OBJECT
public:
    explicit ReconstructionService(QObject* parent = nullptr);
    ~ReconstructionService() override;

    void start();

    /** Stops the worker thread. Later requests fail with ChannelFailure. */
    void shutdown();

    bool isRunning() const;

    /**
     * @brief Replace the cached spectrum (copied to the worker).
     * @return false (and failed() with ChannelFailure) if the worker is down.
     */
    bool load(const Spectrum& spectrum);

    /**
     * @brief Queue a masked reconstruction. Radius is raised to at least 1.
     * @return The request's sequence number, or 0 if the channel is down.
     */
    quint64 reconstruct(const CircleMask& mask);

    bool isBusy() const { return !m_outstanding.isEmpty(); }
    quint64 lastIssuedSequence() const { return m_lastIssued; }
    quint64 lastAppliedSequence() const { return m_lastApplied; }

signals:
    void spectrumLoaded(int rows, int cols);
    void resultReady(quint64 sequence, const ReconstructionResult& result);
    void failed(quint64 sequence, KSpaceError kind, const QString& message);
    void busyChanged(bool busy);

public slots:
    // Worker replies. They may be fed in any order; stale ones are dropped.
    void handleReconstructed(const ReconstructedMessage& msg);
    void handleError(const ErrorMessage& msg);

private slots:
    void handleLoaded(quint64 generation, int rows, int cols);

private:
    bool isStale(quint64 sequence) const;
    void settle(quint64 sequence);
    void reportChannelFailure(const QString& operation);

    QThread* m_thread = nullptr;
    ReconstructionWorker* m_worker = nullptr;

    quint64 m_nextSequence = 1;
    quint64 m_lastIssued = 0;
    quint64 m_lastApplied = 0;
    quint64 m_generation = 0;
    QSet<quint64> m_outstanding;
};

#endif // RECONSTRUCTION_SERVICE_H
