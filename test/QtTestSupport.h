#ifndef KSPACELAB_QT_TEST_SUPPORT_H
#define KSPACELAB_QT_TEST_SUPPORT_H

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QThread>
#include <memory>

//one QCoreApplication per test executable, for timers and queued connections
struct QtAppFixture
{
    QtAppFixture()
    {
        static int argc = 1;
        static char name[] = "kspacelab_test";
        static char* argv[] = {name, nullptr};
        app = std::make_unique<QCoreApplication>(argc, argv);
    }
    std::unique_ptr<QCoreApplication> app;
};

//run the event loop until pred() holds or timeoutMs elapsed
template<typename Pred>
bool waitFor(Pred pred, int timeoutMs = 5000)
{
    QElapsedTimer timer;
    timer.start();
    while (!pred())
    {
        if (timer.elapsed() > timeoutMs)
            return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
    return true;
}

//run the event loop for a fixed time
inline void pumpEvents(int ms)
{
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < ms)
    {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
        QThread::msleep(1);
    }
}

#endif // KSPACELAB_QT_TEST_SUPPORT_H
