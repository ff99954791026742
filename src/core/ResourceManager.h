#ifndef RESOURCEMANAGER_H
#define RESOURCEMANAGER_H

#include <QObject>
#include <QtGlobal>

/**
 * @brief Thread budget for the transform kernel and background analysis
 *
 * Keeps CPU usage at or below 90% of the logical cores.
 */
class ResourceManager : public QObject {
    Q_OBJECT
public:
    static ResourceManager& instance();

    /**
     * @brief Compute the thread budget and apply it to OpenMP and the
     * global QThreadPool (used by QtConcurrent for image analysis).
     */
    void init();

    /**
     * @return 90% of available logical cores, minimum 1
     */
    int maxThreads() const;

private:
    ResourceManager();
    ~ResourceManager() = default;

    int m_maxThreads = 1;
};

#endif // RESOURCEMANAGER_H
