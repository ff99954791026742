#ifndef MASK_CONTROLLER_H
#define MASK_CONTROLLER_H

#include "KSpaceTypes.h"
#include <QObject>
#include <QPoint>
#include <QPointF>
#include <QSize>
#include <QSizeF>
#include <QTimer>
#include <optional>

/**
 * @brief Turns pointer gestures over the k-space image into circular masks.
 *
 * Works in display space (widget pixels of the drawn spectrum) and hands
 * out masks in natural space (spectrum pixels). Two states are kept apart:
 * the displayed mask, updated on every pointer event, and the committed
 * mask, which is the last one sent out through maskSettled().
 *
 * Moves re-arm a single-shot debounce timer; only the timer that actually
 * fires commits. Pointer-up and pointer-cancel commit immediately so the
 * displayed and requested masks agree once a gesture ends.
 */
class MaskController : public QObject {
    Q_OBJECT
public:
    enum class Gesture { Idle, DraggingCenter, ResizingRadius };

    struct Config {
        int debounceMs = 120;
        int initialRadiusPx = 35;
        int minRadiusPx = 5;
        int handleHitRadiusPx = 10;
    };

    explicit MaskController(QObject* parent = nullptr);
    explicit MaskController(const Config& config, QObject* parent = nullptr);

    void setConfig(const Config& config);
    const Config& config() const { return m_config; }

    // Geometry
    void setNaturalSize(const QSize& size);
    void setDisplaySize(const QSizeF& size);
    QSize naturalSize() const { return m_naturalSize; }
    QSizeF displaySize() const { return m_displaySize; }

    /**
     * @brief Show or hide the selection.
     * Showing places the circle at the spectrum center with the initial
     * radius and commits it once, without any pointer interaction.
     */
    void setActive(bool active);
    bool isActive() const { return m_active; }

    /** While disabled every pointer event is ignored. */
    void setEnabled(bool enabled);
    bool isEnabled() const { return m_enabled; }

    // Pointer input (display coordinates). Returns true if a gesture started.
    bool pointerDown(const QPointF& pos);
    void pointerMove(const QPointF& pos);
    void pointerUp();
    void pointerCancel();

    Gesture gesture() const { return m_gesture; }

    // Displayed state
    QPointF displayCenter() const { return m_center; }
    double radiusPx() const { return m_radiusPx; }
    QPoint naturalCenter() const;
    int radiusNatural() const;
    CircleMask displayedMask() const;
    QPointF handlePosition() const;
    bool hitsHandle(const QPointF& pos) const;
    bool hitsCircle(const QPointF& pos) const;
    bool hasMask() const { return m_placed; }

    // Committed state
    std::optional<CircleMask> committedMask() const { return m_committed; }
    bool hasPendingCommit() const { return m_debounce->isActive(); }

    // Coordinate mapping
    QPointF toDisplay(const QPointF& natural) const;
    QPoint toNatural(const QPointF& display) const;
    double scaleX() const;
    double scaleY() const;

signals:
    /** One completed (debounced or final) update, natural coordinates. */
    void maskSettled(const QPoint& center, int radiusNatural);

    /** Fired on every resize move with the clamped display radius. */
    void radiusPreview(int radiusPx);

    void displayedMaskChanged();

private slots:
    void commit();

private:
    bool geometryValid() const;
    bool canInteract() const;
    void placeInitialMask();
    void finishGesture();
    void scheduleCommit();

    QPointF clampCenter(const QPointF& p, double r) const;
    double maxRadiusAt(const QPointF& c) const;

    Config m_config;
    QSize m_naturalSize;
    QSizeF m_displaySize;

    bool m_active = false;
    bool m_enabled = true;
    bool m_placed = false;
    Gesture m_gesture = Gesture::Idle;

    QPointF m_center;
    double m_radiusPx = 0.0;

    std::optional<CircleMask> m_committed;
    QTimer* m_debounce = nullptr;
};

#endif // MASK_CONTROLLER_H
