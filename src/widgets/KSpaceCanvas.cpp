#include "KSpaceCanvas.h"
#include "../kspace/MaskController.h"
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <algorithm>

KSpaceCanvas::KSpaceCanvas(QWidget* parent)
    : QWidget(parent)
{
    setMouseTracking(true);
    setMinimumSize(160, 160);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
}

void KSpaceCanvas::setImage(const QImage& image) {
    m_image = image;
    if (m_controller) m_controller->setNaturalSize(m_image.size());
    syncDisplaySize();
    update();
}

void KSpaceCanvas::clear() {
    m_image = QImage();
    if (m_controller) m_controller->setNaturalSize(QSize());
    syncDisplaySize();
    update();
}

void KSpaceCanvas::setController(MaskController* controller) {
    if (m_controller) disconnect(m_controller, nullptr, this, nullptr);
    m_controller = controller;
    if (m_controller) {
        connect(m_controller, &MaskController::displayedMaskChanged, this, QOverload<>::of(&QWidget::update));
        m_controller->setNaturalSize(m_image.size());
        syncDisplaySize();
    }
}

QRectF KSpaceCanvas::imageRect() const {
    if (m_image.isNull() || width() <= 0 || height() <= 0) return QRectF();

    const double scale = std::min(static_cast<double>(width()) / m_image.width(),
                                  static_cast<double>(height()) / m_image.height());
    const double w = m_image.width() * scale;
    const double h = m_image.height() * scale;
    return QRectF((width() - w) / 2.0, (height() - h) / 2.0, w, h);
}

void KSpaceCanvas::syncDisplaySize() {
    if (m_controller) m_controller->setDisplaySize(imageRect().size());
}

QPointF KSpaceCanvas::toDisplaySpace(const QPointF& widgetPos) const {
    return widgetPos - imageRect().topLeft();
}

void KSpaceCanvas::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    syncDisplaySize();
}

void KSpaceCanvas::paintEvent(QPaintEvent*) {
    QPainter painter(this);
    painter.fillRect(rect(), QColor(20, 20, 20));

    if (m_image.isNull()) {
        painter.setPen(QColor(120, 120, 120));
        painter.drawText(rect(), Qt::AlignCenter, tr("Open an image to see its k-space"));
        return;
    }

    const QRectF target = imageRect();
    painter.setRenderHint(QPainter::SmoothPixmapTransform, false);
    painter.drawImage(target, m_image);

    if (!m_controller || !m_controller->isActive() || !m_controller->hasMask()) return;

    painter.setRenderHint(QPainter::Antialiasing);
    painter.translate(target.topLeft());

    const QPointF c = m_controller->displayCenter();
    const double r = m_controller->radiusPx();

    // Dim everything outside the circle
    QPainterPath outside;
    outside.setFillRule(Qt::OddEvenFill);
    outside.addRect(QRectF(QPointF(0, 0), target.size()));
    outside.addEllipse(c, r, r);
    painter.fillPath(outside, QColor(0, 0, 0, 153));

    painter.setPen(QPen(QColor(255, 255, 255, 220), 1.5));
    painter.setBrush(Qt::NoBrush);
    painter.drawEllipse(c, r, r);

    // Resize handle at 45 degrees
    const QPointF hp = m_controller->handlePosition();
    painter.setPen(QPen(QColor(30, 30, 30), 1));
    painter.setBrush(m_controller->gesture() == MaskController::Gesture::ResizingRadius
                         ? QColor(255, 200, 60) : QColor(240, 240, 240));
    painter.drawEllipse(hp, 6.0, 6.0);
}

void KSpaceCanvas::updateCursor(const QPointF& displayPos) {
    if (!m_controller || !m_controller->isActive() || !m_controller->isEnabled()) {
        unsetCursor();
        return;
    }
    switch (m_controller->gesture()) {
    case MaskController::Gesture::DraggingCenter:
        setCursor(Qt::ClosedHandCursor);
        return;
    case MaskController::Gesture::ResizingRadius:
        setCursor(Qt::SizeFDiagCursor);
        return;
    case MaskController::Gesture::Idle:
        break;
    }
    if (m_controller->hitsHandle(displayPos)) setCursor(Qt::SizeFDiagCursor);
    else if (m_controller->hitsCircle(displayPos)) setCursor(Qt::OpenHandCursor);
    else unsetCursor();
}

void KSpaceCanvas::mousePressEvent(QMouseEvent* event) {
    if (m_controller && event->button() == Qt::LeftButton) {
        const QPointF p = toDisplaySpace(event->position());
        if (m_controller->pointerDown(p)) {
            updateCursor(p);
            event->accept();
            return;
        }
    }
    QWidget::mousePressEvent(event);
}

void KSpaceCanvas::mouseMoveEvent(QMouseEvent* event) {
    if (!m_controller) {
        QWidget::mouseMoveEvent(event);
        return;
    }
    const QPointF p = toDisplaySpace(event->position());
    m_controller->pointerMove(p);
    updateCursor(p);
}

void KSpaceCanvas::mouseReleaseEvent(QMouseEvent* event) {
    if (m_controller && event->button() == Qt::LeftButton) {
        m_controller->pointerUp();
        updateCursor(toDisplaySpace(event->position()));
        update();
        return;
    }
    QWidget::mouseReleaseEvent(event);
}

void KSpaceCanvas::leaveEvent(QEvent* event) {
    // Moves outside the widget are still delivered while a button is held.
    if (m_controller && m_controller->gesture() == MaskController::Gesture::Idle) unsetCursor();
    QWidget::leaveEvent(event);
}
