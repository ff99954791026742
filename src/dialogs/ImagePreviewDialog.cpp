#include "ImagePreviewDialog.h"
#include <QKeyEvent>
#include <QLabel>
#include <QPixmap>
#include <QVBoxLayout>

ImagePreviewDialog::ImagePreviewDialog(const QImage& image, const QString& title, QWidget* parent)
    : DialogBase(parent, title, 720, 720)
    , m_image(image)
{
    setModal(true);

    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);

    m_label = new QLabel(this);
    m_label->setAlignment(Qt::AlignCenter);
    m_label->setSizePolicy(QSizePolicy::Ignored, QSizePolicy::Ignored);
    m_label->setStyleSheet("QLabel { background-color: #101010; }");
    layout->addWidget(m_label);

    restoreWindowGeometry();
    refresh();
}

void ImagePreviewDialog::refresh() {
    if (m_image.isNull()) return;
    m_label->setPixmap(QPixmap::fromImage(m_image)
        .scaled(m_label->size(), Qt::KeepAspectRatio, Qt::SmoothTransformation));
}

void ImagePreviewDialog::resizeEvent(QResizeEvent* event) {
    DialogBase::resizeEvent(event);
    refresh();
}

void ImagePreviewDialog::keyPressEvent(QKeyEvent* event) {
    if (event->key() == Qt::Key_Escape || event->key() == Qt::Key_Space) {
        accept();
        return;
    }
    DialogBase::keyPressEvent(event);
}
