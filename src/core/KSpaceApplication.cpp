#include "KSpaceApplication.h"
#include "Logger.h"
#include <exception>

KSpaceApplication::KSpaceApplication(int& argc, char** argv)
    : QApplication(argc, argv)
{
}

KSpaceApplication::~KSpaceApplication()
{
}

bool KSpaceApplication::notify(QObject* receiver, QEvent* event)
{
    try {
        return QApplication::notify(receiver, event);
    } catch (const std::exception& e) {
        Logger::critical(QString("Unhandled exception in event loop: %1").arg(QString::fromUtf8(e.what())), "App");
        return false;
    }
}
