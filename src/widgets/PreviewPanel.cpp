#include "PreviewPanel.h"
#include <QLabel>
#include <QMouseEvent>
#include <QPixmap>
#include <QVBoxLayout>

PreviewPanel::PreviewPanel(const QString& title, const QString& placeholder, QWidget* parent)
    : QGroupBox(title, parent)
    , m_placeholder(placeholder)
{
    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->setContentsMargins(6, 6, 6, 6);

    m_imageLabel = new QLabel(this);
    m_imageLabel->setAlignment(Qt::AlignCenter);
    m_imageLabel->setMinimumSize(120, 120);
    m_imageLabel->setSizePolicy(QSizePolicy::Ignored, QSizePolicy::Ignored);
    m_imageLabel->setStyleSheet("QLabel { background-color: #141414; color: #808080; }");
    layout->addWidget(m_imageLabel, 1);

    m_busyLabel = new QLabel(tr("Reconstructing..."), this);
    m_busyLabel->setAlignment(Qt::AlignCenter);
    m_busyLabel->setStyleSheet("color: #e0b040;");
    m_busyLabel->setVisible(false);
    layout->addWidget(m_busyLabel);

    clear();
}

void PreviewPanel::setImage(const QImage& image) {
    m_image = image;
    refreshPixmap();
}

void PreviewPanel::clear() {
    m_image = QImage();
    m_imageLabel->setPixmap(QPixmap());
    m_imageLabel->setText(m_placeholder);
    setBusy(false);
}

void PreviewPanel::setBusy(bool busy) {
    m_busyLabel->setVisible(busy);
}

void PreviewPanel::setClickable(bool clickable) {
    m_clickable = clickable;
    setCursor(clickable ? Qt::PointingHandCursor : Qt::ArrowCursor);
    if (clickable) setToolTip(tr("Click to enlarge"));
}

void PreviewPanel::refreshPixmap() {
    if (m_image.isNull()) {
        m_imageLabel->setPixmap(QPixmap());
        m_imageLabel->setText(m_placeholder);
        return;
    }
    // Nearest neighbour keeps the 256 px grids crisp when enlarged.
    const QPixmap pix = QPixmap::fromImage(m_image)
        .scaled(m_imageLabel->size(), Qt::KeepAspectRatio, Qt::FastTransformation);
    m_imageLabel->setText(QString());
    m_imageLabel->setPixmap(pix);
}

void PreviewPanel::resizeEvent(QResizeEvent* event) {
    QGroupBox::resizeEvent(event);
    refreshPixmap();
}

void PreviewPanel::mouseReleaseEvent(QMouseEvent* event) {
    if (m_clickable && hasImage() && event->button() == Qt::LeftButton) {
        emit clicked();
        return;
    }
    QGroupBox::mouseReleaseEvent(event);
}
