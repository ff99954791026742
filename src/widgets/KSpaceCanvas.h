#ifndef KSPACECANVAS_H
#define KSPACECANVAS_H

#include <QImage>
#include <QWidget>

class MaskController;

/**
 * @brief Draws the log-magnitude spectrum and the circular selection on top.
 *
 * The image is scaled to fit with its aspect kept; the drawn rectangle is
 * the controller's display space. Mouse events are translated into that
 * space and forwarded to the controller.
 */
class KSpaceCanvas : public QWidget {
    Q_OBJECT
public:
    explicit KSpaceCanvas(QWidget* parent = nullptr);

    void setImage(const QImage& image);
    void clear();
    const QImage& image() const { return m_image; }

    void setController(MaskController* controller);

    /** Rectangle the image occupies inside the widget. */
    QRectF imageRect() const;

    QSize sizeHint() const override { return QSize(320, 320); }

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void leaveEvent(QEvent* event) override;

private:
    void syncDisplaySize();
    void updateCursor(const QPointF& displayPos);
    QPointF toDisplaySpace(const QPointF& widgetPos) const;

    QImage m_image;
    MaskController* m_controller = nullptr;
};

#endif // KSPACECANVAS_H
