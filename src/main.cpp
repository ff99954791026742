#include <QApplication>
#include <QStyleFactory>
#include <QPalette>
#include <QTimer>
#include "MainWindow.h"
#include "core/AppSettings.h"
#include "core/KSpaceApplication.h"
#include "core/Logger.h"
#include "core/ResourceManager.h"
#include "core/Version.h"

int main(int argc, char *argv[])
{
    KSpaceApplication app(argc, argv);
    QCoreApplication::setOrganizationName("KSpaceLab");
    QCoreApplication::setApplicationName("KSpaceLab");
    QCoreApplication::setApplicationVersion(KSpaceLab::getVersion());

    const AppSettings settings = AppSettings::load();
    Logger::init(settings.logDirectory, settings.logMaxFiles);
    Logger::info(QString("Log file: %1").arg(Logger::currentLogFile()), "App");
    ResourceManager::instance().init();

    // Set Dark Theme
    QApplication::setStyle(QStyleFactory::create("Fusion"));
    QPalette p = qApp->palette();
    p.setColor(QPalette::Window, QColor(53, 53, 53));
    p.setColor(QPalette::WindowText, Qt::white);
    p.setColor(QPalette::Base, QColor(25, 25, 25));
    p.setColor(QPalette::AlternateBase, QColor(53, 53, 53));
    p.setColor(QPalette::ToolTipBase, Qt::white);
    p.setColor(QPalette::ToolTipText, Qt::white);
    p.setColor(QPalette::Text, Qt::white);
    p.setColor(QPalette::Button, QColor(53, 53, 53));
    p.setColor(QPalette::ButtonText, Qt::white);
    p.setColor(QPalette::BrightText, Qt::red);
    p.setColor(QPalette::Link, QColor(42, 130, 218));
    p.setColor(QPalette::Highlight, QColor(42, 130, 218));
    p.setColor(QPalette::HighlightedText, Qt::black);
    qApp->setPalette(p);

    qApp->setStyleSheet(
        "QToolTip { color: #ffffff; background-color: #2a82da; border: 1px solid white; }"
        "QGroupBox { border: 1px solid #555; border-radius: 4px; margin-top: 14px; }"
        "QGroupBox::title { subcontrol-origin: margin; left: 8px; padding: 0 4px; }"
        "QPushButton:checked { background-color: #2a82da; color: white; }"
    );

    MainWindow window;
    window.show();

    // Reload the previous image once the event loop is running.
    QTimer::singleShot(0, &window, &MainWindow::restoreSession);

    const int rc = app.exec();
    Logger::shutdown();
    return rc;
}
