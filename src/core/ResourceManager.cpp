#include "ResourceManager.h"
#include "Logger.h"
#include <QThread>
#include <QThreadPool>
#include <cmath>
#include <algorithm>

#ifdef _OPENMP
#include <omp.h>
#endif

ResourceManager& ResourceManager::instance() {
    static ResourceManager _instance;
    return _instance;
}

ResourceManager::ResourceManager() {
    m_maxThreads = std::max(1, QThread::idealThreadCount() - 1);
}

void ResourceManager::init() {
    int totalCores = QThread::idealThreadCount();

    // 16 cores -> 14 threads, 4 cores -> 3 threads, 1 core -> 1 thread.
    m_maxThreads = std::max(1, static_cast<int>(std::floor(totalCores * 0.9)));

    Logger::info(QString("CPU limit set to %1 threads (total: %2)").arg(m_maxThreads).arg(totalCores),
                 "Resources");

#ifdef _OPENMP
    omp_set_num_threads(m_maxThreads);
    Logger::info("OpenMP configured", "Resources");
#endif

    QThreadPool::globalInstance()->setMaxThreadCount(m_maxThreads);
}

int ResourceManager::maxThreads() const {
    return m_maxThreads;
}
