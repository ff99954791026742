#include "DialogBase.h"
#include <QApplication>
#include <QRect>
#include <QScreen>
#include <QSettings>

DialogBase::DialogBase(QWidget* parent,
                       const QString& title,
                       int defaultWidth,
                       int defaultHeight,
                       bool deleteOnClose)
    : QDialog(parent) {
    // Center on parent or screen
    if (parentWidget()) {
        move(parentWidget()->frameGeometry().topLeft() + QPoint(40, 40));
    } else if (QScreen* screen = QApplication::primaryScreen()) {
        const QRect screenGeometry = screen->geometry();
        move(screenGeometry.width() / 2 - defaultWidth / 2, screenGeometry.height() / 2 - defaultHeight / 2);
    }

    if (deleteOnClose) {
        setAttribute(Qt::WA_DeleteOnClose);
    }

    setWindowProperties(title, defaultWidth, defaultHeight);
}

void DialogBase::setWindowProperties(const QString& title, int width, int height) {
    if (!title.isEmpty()) {
        setWindowTitle(title);
    }

    if (width > 0 && height > 0) {
        resize(width, height);
    }
}

void DialogBase::done(int result) {
    saveWindowGeometry();
    QDialog::done(result);
}

QString DialogBase::geometryKey(const QString& settingsKey) const {
    const QString key = settingsKey.isEmpty() ? QString(metaObject()->className()) : settingsKey;
    return key + "/geometry";
}

void DialogBase::restoreWindowGeometry(const QString& settingsKey) {
    QSettings settings("KSpaceLab", "KSpaceLab");
    const QString key = geometryKey(settingsKey);

    if (settings.contains(key)) {
        restoreGeometry(settings.value(key).toByteArray());
    }
}

void DialogBase::saveWindowGeometry(const QString& settingsKey) {
    QSettings settings("KSpaceLab", "KSpaceLab");
    settings.setValue(geometryKey(settingsKey), saveGeometry());
}
