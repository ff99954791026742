#include "ReconstructionService.h"
#include "FourierTransform.h"
#include "SpectrumRenderer.h"
#include "../core/Logger.h"
#include <QMetaObject>
#include <algorithm>
#include <exception>

namespace {

void registerProtocolTypes() {
    static bool registered = false;
    if (registered) return;
    qRegisterMetaType<LoadSpectrumMessage>();
    qRegisterMetaType<CircleReconMessage>();
    qRegisterMetaType<ReconstructedMessage>();
    qRegisterMetaType<ErrorMessage>();
    qRegisterMetaType<KSpaceError>();
    qRegisterMetaType<GrayscaleImage>();
    registered = true;
}

} // namespace

// ============================================================================
// Worker
// ============================================================================

ReconstructionWorker::ReconstructionWorker(QObject* parent)
    : QObject(parent) {}

Result<ReconstructionResult> ReconstructionWorker::reconstruct(const Spectrum& spectrum, const CircleMask& mask) {
    if (!spectrum.isValid()) {
        return Result<ReconstructionResult>(KSpaceError::NoSpectrumLoaded, "Spectrum not loaded");
    }

    Result<SampleGrid> grid = FourierTransform::inverse(spectrum, mask);
    if (!grid) {
        return Result<ReconstructionResult>(grid.errorKind(), grid.error());
    }
    return Result<ReconstructionResult>(SpectrumRenderer::normalize(grid.value()));
}

void ReconstructionWorker::loadSpectrum(const LoadSpectrumMessage& msg) {
    Spectrum spectrum = msg.toSpectrum();
    if (!spectrum.isValid()) {
        ErrorMessage err;
        err.kind = KSpaceError::InvalidDimensions;
        err.message = QString("Rejected spectrum %1x%2").arg(msg.cols).arg(msg.rows);
        emit failed(err);
        return;
    }

    m_spectrum = std::move(spectrum);
    m_generation = msg.generation;
    Logger::debug(QString("Worker cached spectrum %1x%2 (generation %3)")
                      .arg(msg.cols).arg(msg.rows).arg(msg.generation), "Reconstruction");
    emit spectrumLoaded(msg.generation, msg.rows, msg.cols);
}

void ReconstructionWorker::circleRecon(const CircleReconMessage& msg) {
    ErrorMessage err;
    err.sequence = msg.sequence;

    try {
        Result<ReconstructionResult> result = reconstruct(m_spectrum, msg.mask());
        if (!result) {
            err.kind = result.errorKind();
            err.message = result.error();
            emit failed(err);
            return;
        }

        ReconstructedMessage reply;
        reply.sequence = msg.sequence;
        reply.rows = result.value().rows;
        reply.cols = result.value().cols;
        reply.pixels = std::move(result.mutable_value().pixels);
        emit reconstructed(reply);
    } catch (const std::exception& ex) {
        err.kind = KSpaceError::ChannelFailure;
        err.message = QString::fromUtf8(ex.what());
        emit failed(err);
    }
}

// ============================================================================
// Service
// ============================================================================

ReconstructionService::ReconstructionService(QObject* parent)
    : QObject(parent) {
    registerProtocolTypes();
}

ReconstructionService::~ReconstructionService() {
    shutdown();
}

void ReconstructionService::start() {
    if (m_thread) return;

    m_thread = new QThread(this);
    m_thread->setObjectName("ReconstructionWorker");
    m_worker = new ReconstructionWorker();
    m_worker->moveToThread(m_thread);

    connect(m_thread, &QThread::finished, m_worker, &QObject::deleteLater);
    connect(m_worker, &ReconstructionWorker::spectrumLoaded, this, &ReconstructionService::handleLoaded, Qt::QueuedConnection);
    connect(m_worker, &ReconstructionWorker::reconstructed, this, &ReconstructionService::handleReconstructed, Qt::QueuedConnection);
    connect(m_worker, &ReconstructionWorker::failed, this, &ReconstructionService::handleError, Qt::QueuedConnection);

    m_thread->start();
    Logger::info("Reconstruction worker started", "Reconstruction");
}

void ReconstructionService::shutdown() {
    if (!m_thread) return;

    m_thread->quit();
    if (!m_thread->wait(5000)) {
        Logger::warning("Reconstruction worker did not stop in time, terminating", "Reconstruction");
        m_thread->terminate();
        m_thread->wait();
    }
    delete m_thread;
    m_thread = nullptr;
    m_worker = nullptr;

    const bool wasBusy = isBusy();
    m_outstanding.clear();
    if (wasBusy) emit busyChanged(false);

    Logger::info("Reconstruction worker stopped", "Reconstruction");
}

bool ReconstructionService::isRunning() const {
    return m_thread && m_worker && m_thread->isRunning();
}

bool ReconstructionService::load(const Spectrum& spectrum) {
    if (!isRunning()) {
        reportChannelFailure("load");
        return false;
    }

    ++m_generation;
    LoadSpectrumMessage msg = LoadSpectrumMessage::fromSpectrum(m_generation, spectrum);
    if (!QMetaObject::invokeMethod(m_worker, "loadSpectrum", Qt::QueuedConnection,
                                   Q_ARG(LoadSpectrumMessage, msg))) {
        reportChannelFailure("load");
        return false;
    }

    // Anything issued against the previous spectrum is now stale.
    m_lastApplied = m_lastIssued;
    const bool wasBusy = isBusy();
    m_outstanding.clear();
    if (wasBusy) emit busyChanged(false);

    Logger::info(QString("Spectrum %1x%2 sent to worker (generation %3)")
                     .arg(spectrum.cols).arg(spectrum.rows).arg(m_generation), "Reconstruction");
    return true;
}

quint64 ReconstructionService::reconstruct(const CircleMask& mask) {
    if (!isRunning()) {
        reportChannelFailure("reconstruct");
        return 0;
    }

    CircleReconMessage msg;
    msg.sequence = m_nextSequence;
    msg.cx = mask.cx;
    msg.cy = mask.cy;
    msg.radius = std::max(1, mask.radius);

    if (!QMetaObject::invokeMethod(m_worker, "circleRecon", Qt::QueuedConnection,
                                   Q_ARG(CircleReconMessage, msg))) {
        reportChannelFailure("reconstruct");
        return 0;
    }

    ++m_nextSequence;
    m_lastIssued = msg.sequence;
    const bool wasBusy = isBusy();
    m_outstanding.insert(msg.sequence);
    if (!wasBusy) emit busyChanged(true);

    Logger::debug(QString("Request #%1: circle (%2,%3) r=%4")
                      .arg(msg.sequence).arg(msg.cx).arg(msg.cy).arg(msg.radius), "Reconstruction");
    return msg.sequence;
}

void ReconstructionService::handleLoaded(quint64 generation, int rows, int cols) {
    if (generation != m_generation) return;
    emit spectrumLoaded(rows, cols);
}

void ReconstructionService::handleReconstructed(const ReconstructedMessage& msg) {
    settle(msg.sequence);

    if (isStale(msg.sequence)) {
        Logger::debug(QString("Dropped stale result #%1 (newest applied #%2)")
                          .arg(msg.sequence).arg(m_lastApplied), "Reconstruction");
        return;
    }

    m_lastApplied = msg.sequence;
    emit resultReady(msg.sequence, msg.image());
}

void ReconstructionService::handleError(const ErrorMessage& msg) {
    if (msg.sequence != 0) {
        settle(msg.sequence);
        if (isStale(msg.sequence)) {
            Logger::debug(QString("Dropped stale error #%1: %2").arg(msg.sequence).arg(msg.message),
                          "Reconstruction");
            return;
        }
        m_lastApplied = msg.sequence;
    }

    Logger::error(QString("Request #%1 failed [%2]: %3")
                      .arg(msg.sequence).arg(errorKindName(msg.kind), msg.message), "Reconstruction");
    emit failed(msg.sequence, msg.kind, msg.message);
}

bool ReconstructionService::isStale(quint64 sequence) const {
    return sequence <= m_lastApplied || sequence > m_lastIssued;
}

void ReconstructionService::settle(quint64 sequence) {
    if (m_outstanding.remove(sequence) && m_outstanding.isEmpty()) {
        emit busyChanged(false);
    }
}

void ReconstructionService::reportChannelFailure(const QString& operation) {
    const QString message = QString("Reconstruction worker is not running (%1)").arg(operation);
    Logger::error(message, "Reconstruction");
    emit failed(0, KSpaceError::ChannelFailure, message);
}
