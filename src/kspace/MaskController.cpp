#include "MaskController.h"
#include "../core/Logger.h"
#include <QLineF>
#include <algorithm>
#include <cmath>

MaskController::MaskController(QObject* parent)
    : MaskController(Config(), parent) {}

MaskController::MaskController(const Config& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
{
    m_debounce = new QTimer(this);
    m_debounce->setSingleShot(true);
    m_debounce->setInterval(std::max(0, m_config.debounceMs));
    connect(m_debounce, &QTimer::timeout, this, &MaskController::commit);
}

void MaskController::setConfig(const Config& config) {
    m_config = config;
    m_debounce->setInterval(std::max(0, m_config.debounceMs));
}

// ---------------------------------------------------------------------------
// Geometry
// ---------------------------------------------------------------------------

void MaskController::setNaturalSize(const QSize& size) {
    if (size == m_naturalSize) return;

    m_naturalSize = size;
    m_debounce->stop();
    m_gesture = Gesture::Idle;
    m_placed = false;
    m_committed.reset();

    if (m_active && geometryValid()) placeInitialMask();
    emit displayedMaskChanged();
}

void MaskController::setDisplaySize(const QSizeF& size) {
    if (size == m_displaySize) return;

    const QSizeF old = m_displaySize;
    m_displaySize = size;

    if (m_placed && !old.isEmpty() && !size.isEmpty()) {
        // Keep the same natural circle under the new layout.
        const double fx = size.width() / old.width();
        const double fy = size.height() / old.height();
        m_radiusPx = std::max(1.0, m_radiusPx * fx);
        m_center = clampCenter(QPointF(m_center.x() * fx, m_center.y() * fy), m_radiusPx);
    } else if (m_active && !m_placed && geometryValid()) {
        placeInitialMask();
    }
    emit displayedMaskChanged();
}

bool MaskController::geometryValid() const {
    return m_naturalSize.width() > 0 && m_naturalSize.height() > 0
        && m_displaySize.width() > 0 && m_displaySize.height() > 0;
}

double MaskController::scaleX() const {
    return m_displaySize.width() > 0 ? m_naturalSize.width() / m_displaySize.width() : 0.0;
}

double MaskController::scaleY() const {
    return m_displaySize.height() > 0 ? m_naturalSize.height() / m_displaySize.height() : 0.0;
}

QPointF MaskController::toDisplay(const QPointF& natural) const {
    if (!geometryValid()) return QPointF();
    return QPointF(natural.x() * m_displaySize.width() / m_naturalSize.width(),
                   natural.y() * m_displaySize.height() / m_naturalSize.height());
}

QPoint MaskController::toNatural(const QPointF& display) const {
    if (!geometryValid()) return QPoint();
    return QPoint(static_cast<int>(std::lround(display.x() * scaleX())),
                  static_cast<int>(std::lround(display.y() * scaleY())));
}

// ---------------------------------------------------------------------------
// Activation
// ---------------------------------------------------------------------------

void MaskController::setActive(bool active) {
    if (active == m_active) return;
    m_active = active;

    m_debounce->stop();
    m_gesture = Gesture::Idle;

    if (active) {
        if (geometryValid()) placeInitialMask();
    } else {
        m_placed = false;
        m_committed.reset();
    }
    emit displayedMaskChanged();
}

void MaskController::setEnabled(bool enabled) {
    if (enabled == m_enabled) return;
    if (!enabled) finishGesture();
    m_enabled = enabled;
}

void MaskController::placeInitialMask() {
    const QPointF natCenter(m_naturalSize.width() / 2, m_naturalSize.height() / 2);
    m_center = toDisplay(natCenter);
    m_radiusPx = std::max(1.0, std::min<double>(m_config.initialRadiusPx, maxRadiusAt(m_center)));
    m_placed = true;

    Logger::debug(QString("Selection placed at (%1,%2) r=%3px")
                      .arg(m_center.x()).arg(m_center.y()).arg(m_radiusPx), "Mask");
    commit();
}

bool MaskController::canInteract() const {
    return m_active && m_enabled && m_placed && geometryValid();
}

// ---------------------------------------------------------------------------
// Hit testing
// ---------------------------------------------------------------------------

QPointF MaskController::handlePosition() const {
    const double offset = m_radiusPx / M_SQRT2;
    return QPointF(m_center.x() + offset, m_center.y() + offset);
}

bool MaskController::hitsHandle(const QPointF& pos) const {
    if (!m_placed) return false;
    return QLineF(pos, handlePosition()).length() <= m_config.handleHitRadiusPx;
}

bool MaskController::hitsCircle(const QPointF& pos) const {
    if (!m_placed) return false;
    return QLineF(pos, m_center).length() <= m_radiusPx;
}

// ---------------------------------------------------------------------------
// Clamping
// ---------------------------------------------------------------------------

QPointF MaskController::clampCenter(const QPointF& p, double r) const {
    const double w = m_displaySize.width();
    const double h = m_displaySize.height();
    return QPointF(std::max(r, std::min(w - r, p.x())),
                   std::max(r, std::min(h - r, p.y())));
}

double MaskController::maxRadiusAt(const QPointF& c) const {
    const double w = m_displaySize.width();
    const double h = m_displaySize.height();
    return std::min({c.x(), c.y(), w - c.x(), h - c.y()});
}

// ---------------------------------------------------------------------------
// Pointer input
// ---------------------------------------------------------------------------

bool MaskController::pointerDown(const QPointF& pos) {
    if (!canInteract() || m_gesture != Gesture::Idle) return false;

    // The handle sits on the rim, so it wins over the interior.
    if (hitsHandle(pos)) {
        m_gesture = Gesture::ResizingRadius;
        return true;
    }

    if (hitsCircle(pos)) {
        m_gesture = Gesture::DraggingCenter;
        m_center = clampCenter(pos, m_radiusPx);
        emit displayedMaskChanged();
        return true;
    }

    return false;
}

void MaskController::pointerMove(const QPointF& pos) {
    if (!canInteract()) return;

    switch (m_gesture) {
    case Gesture::DraggingCenter:
        m_center = clampCenter(pos, m_radiusPx);
        break;
    case Gesture::ResizingRadius: {
        const double raw = QLineF(m_center, pos).length();
        m_radiusPx = std::max<double>(m_config.minRadiusPx, std::min(maxRadiusAt(m_center), raw));
        emit radiusPreview(static_cast<int>(std::lround(m_radiusPx)));
        break;
    }
    case Gesture::Idle:
        return;
    }

    emit displayedMaskChanged();
    scheduleCommit();
}

void MaskController::pointerUp() {
    if (!m_enabled) return;
    finishGesture();
}

void MaskController::pointerCancel() {
    finishGesture();
}

void MaskController::finishGesture() {
    if (m_gesture == Gesture::Idle) return;
    m_gesture = Gesture::Idle;
    m_debounce->stop();
    commit();
}

void MaskController::scheduleCommit() {
    m_debounce->start();
}

// ---------------------------------------------------------------------------
// Commit
// ---------------------------------------------------------------------------

QPoint MaskController::naturalCenter() const {
    return toNatural(m_center);
}

int MaskController::radiusNatural() const {
    // Horizontal scale only; k-space pixels are drawn square.
    return std::max(1, static_cast<int>(std::lround(m_radiusPx * scaleX())));
}

CircleMask MaskController::displayedMask() const {
    const QPoint c = naturalCenter();
    return CircleMask{c.x(), c.y(), radiusNatural()};
}

void MaskController::commit() {
    m_debounce->stop();
    if (!m_active || !m_placed || !geometryValid()) return;

    const CircleMask mask = displayedMask();
    m_committed = mask;

    Logger::debug(QString("Mask settled: center (%1,%2) r=%3")
                      .arg(mask.cx).arg(mask.cy).arg(mask.radius), "Mask");
    emit maskSettled(QPoint(mask.cx, mask.cy), mask.radius);
}
