#ifndef IMAGEPREVIEWDIALOG_H
#define IMAGEPREVIEWDIALOG_H

#include "DialogBase.h"
#include <QImage>

class QLabel;

// Enlarged view of the source image.
class ImagePreviewDialog : public DialogBase {
    Q_OBJECT
public:
    ImagePreviewDialog(const QImage& image, const QString& title, QWidget* parent = nullptr);

protected:
    void resizeEvent(QResizeEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;

private:
    void refresh();

    QImage m_image;
    QLabel* m_label;
};

#endif // IMAGEPREVIEWDIALOG_H
