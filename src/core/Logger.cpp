#include "Logger.h"
#include "Version.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QStringConverter>
#include <iostream>
#include <csignal>
#include <cstring>
#include <algorithm>

QFile* Logger::s_logFile = nullptr;
QTextStream* Logger::s_logStream = nullptr;
QRecursiveMutex Logger::s_mutex;
QString Logger::s_logDirPath;
QString Logger::s_currentLogPath;
int Logger::s_maxLogFiles = 5;
bool Logger::s_initialized = false;
QtMessageHandler Logger::s_previousHandler = nullptr;

static void crashSignalHandler(int signal)
{
    QString reason;
    switch (signal) {
        case SIGSEGV: reason = "Segmentation Fault (SIGSEGV)"; break;
        case SIGABRT: reason = "Abort Signal (SIGABRT)"; break;
        case SIGFPE:  reason = "Floating Point Exception (SIGFPE)"; break;
        case SIGILL:  reason = "Illegal Instruction (SIGILL)"; break;
        default:      reason = QString("Signal %1").arg(signal); break;
    }

    Logger::critical("=== APPLICATION CRASH ===");
    Logger::critical("Reason: " + reason);
    Logger::shutdown();

    std::signal(signal, SIG_DFL);
    std::raise(signal);
}

void Logger::init(const QString& logDirPath, int maxLogFiles)
{
    QMutexLocker locker(&s_mutex);

    if (s_initialized) return;

    s_maxLogFiles = std::max(1, maxLogFiles);

    if (logDirPath.isEmpty()) {
        s_logDirPath = QCoreApplication::applicationDirPath() + "/logs";
    } else {
        s_logDirPath = logDirPath;
    }

    QDir dir(s_logDirPath);
    if (!dir.exists()) {
        dir.mkpath(".");
    }

    s_currentLogPath = s_logDirPath + "/KSpaceLab.log";
    rotateLogFiles();

    s_logFile = new QFile(s_currentLogPath);
    if (!s_logFile->open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)) {
        std::cerr << "Failed to open log file: " << s_currentLogPath.toStdString() << std::endl;
        delete s_logFile;
        s_logFile = nullptr;
        return;
    }

    s_logStream = new QTextStream(s_logFile);
    s_logStream->setEncoding(QStringConverter::Utf8);

    *s_logStream << "================================================================================\n";
    *s_logStream << "KSpaceLab Log - Started " << QDateTime::currentDateTime().toString(Qt::ISODate) << "\n";
    *s_logStream << "Version: " << KSpaceLab::getVersion() << "\n";
#ifdef Q_OS_WIN
    *s_logStream << "Platform: Windows\n";
#elif defined(Q_OS_MAC)
    *s_logStream << "Platform: macOS\n";
#else
    *s_logStream << "Platform: Linux/Other\n";
#endif
    *s_logStream << "================================================================================\n\n";
    s_logStream->flush();

    s_previousHandler = qInstallMessageHandler(qtMessageHandler);

    std::signal(SIGSEGV, crashSignalHandler);
    std::signal(SIGABRT, crashSignalHandler);
    std::signal(SIGFPE, crashSignalHandler);
    std::signal(SIGILL, crashSignalHandler);

    s_initialized = true;

    log(Info, "Logging system initialized", "Logger");
    log(Info, QString("Log file: %1").arg(s_currentLogPath), "Logger");
}

void Logger::shutdown()
{
    QMutexLocker locker(&s_mutex);

    if (!s_initialized) return;

    qInstallMessageHandler(s_previousHandler);
    s_previousHandler = nullptr;

    if (s_logStream) {
        *s_logStream << "\n================================================================================\n";
        *s_logStream << "KSpaceLab Log - Ended " << QDateTime::currentDateTime().toString(Qt::ISODate) << "\n";
        *s_logStream << "================================================================================\n";
        s_logStream->flush();
        delete s_logStream;
        s_logStream = nullptr;
    }

    if (s_logFile) {
        s_logFile->close();
        delete s_logFile;
        s_logFile = nullptr;
    }

    s_initialized = false;
}

void Logger::log(Level level, const QString& message, const QString& category)
{
    QMutexLocker locker(&s_mutex);

    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    QString categoryStr = category.isEmpty() ? "" : QString("[%1] ").arg(category);

    QString formattedMsg = QString("[%1] [%2] %3%4")
                              .arg(timestamp)
                              .arg(levelToString(level), -8)
                              .arg(categoryStr)
                              .arg(message);

    if (s_logStream) {
        *s_logStream << formattedMsg << "\n";
        s_logStream->flush();
    }

#ifdef QT_DEBUG
    if (level >= Warning) {
        std::cerr << formattedMsg.toStdString() << std::endl;
    }
#endif
}

void Logger::qtMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    Level level;
    switch (type) {
        case QtDebugMsg:    level = Debug; break;
        case QtInfoMsg:     level = Info; break;
        case QtWarningMsg:  level = Warning; break;
        case QtCriticalMsg: level = Critical; break;
        case QtFatalMsg:    level = Fatal; break;
        default:            level = Info; break;
    }

    QString category;
    if (context.category && std::strcmp(context.category, "default") != 0) {
        category = QString::fromUtf8(context.category);
    }

    log(level, msg, category);

    if (type == QtFatalMsg) {
        shutdown();
        std::abort();
    }
}

// The previous session's log is renamed with its modification time; only the
// newest s_maxLogFiles renamed files survive.
void Logger::rotateLogFiles()
{
    QFileInfo current(s_currentLogPath);
    if (current.exists()) {
        QString stamp = current.lastModified().toString("yyyyMMdd_HHmmss");
        QString rotated = s_logDirPath + QString("/KSpaceLab_%1.log").arg(stamp);
        QFile::remove(rotated);
        QFile::rename(s_currentLogPath, rotated);
    }

    QDir dir(s_logDirPath);
    QFileInfoList logFiles = dir.entryInfoList(QStringList() << "KSpaceLab_*.log", QDir::Files, QDir::Time);

    while (logFiles.size() > s_maxLogFiles) {
        QFile::remove(logFiles.last().absoluteFilePath());
        logFiles.removeLast();
    }
}

QString Logger::levelToString(Level level)
{
    switch (level) {
        case Debug:    return "DEBUG";
        case Info:     return "INFO";
        case Warning:  return "WARNING";
        case Error:    return "ERROR";
        case Critical: return "CRITICAL";
        case Fatal:    return "FATAL";
        default:       return "UNKNOWN";
    }
}

QString Logger::currentLogFile()
{
    QMutexLocker locker(&s_mutex);
    return s_currentLogPath;
}
