#ifndef KSPACEAPPLICATION_H
#define KSPACEAPPLICATION_H

#include <QApplication>

class KSpaceApplication : public QApplication
{
public:
    KSpaceApplication(int& argc, char** argv);
    ~KSpaceApplication() override;

    // Exceptions escaping an event handler are logged instead of unwinding the event loop.
    bool notify(QObject* receiver, QEvent* event) override;
};

#endif // KSPACEAPPLICATION_H
