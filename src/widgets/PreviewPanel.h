#ifndef PREVIEWPANEL_H
#define PREVIEWPANEL_H

#include <QGroupBox>
#include <QImage>

class QLabel;

// Titled image box with a placeholder and an optional busy line.
class PreviewPanel : public QGroupBox {
    Q_OBJECT
public:
    explicit PreviewPanel(const QString& title, const QString& placeholder, QWidget* parent = nullptr);

    void setImage(const QImage& image);
    void clear();
    const QImage& image() const { return m_image; }
    bool hasImage() const { return !m_image.isNull(); }

    void setBusy(bool busy);
    void setClickable(bool clickable);

signals:
    void clicked();

protected:
    void resizeEvent(QResizeEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;

private:
    void refreshPixmap();

    QLabel* m_imageLabel;
    QLabel* m_busyLabel;
    QString m_placeholder;
    QImage m_image;
    bool m_clickable = false;
};

#endif // PREVIEWPANEL_H
