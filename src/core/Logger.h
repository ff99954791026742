#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QFile>
#include <QRecursiveMutex>
#include <QTextStream>
#include <QDebug>

/**
 * @brief Application log for KSpaceLab
 *
 * - One log file per session under the log directory (default: app dir/logs)
 * - Previous sessions are rotated to KSpaceLab_<timestamp>.log, newest N kept
 * - Thread-safe (the reconstruction worker logs from its own thread)
 * - Captures qDebug, qInfo, qWarning, qCritical, qFatal
 *
 * Usage:
 *   Logger::init();
 *   Logger::info("Spectrum loaded", "Reconstruction");
 *   Logger::shutdown();
 */
class Logger
{
public:
    enum Level {
        Debug,
        Info,
        Warning,
        Error,
        Critical,
        Fatal
    };

    /**
     * @brief Initialize the logging system
     * @param logDirPath Optional custom log directory (defaults to app dir/logs)
     * @param maxLogFiles Number of rotated log files to keep
     */
    static void init(const QString& logDirPath = QString(), int maxLogFiles = 5);

    static void shutdown();

    static void log(Level level, const QString& message, const QString& category = QString());

    static QString currentLogFile();

    static void debug(const QString& msg, const QString& cat = QString())    { log(Debug, msg, cat); }
    static void info(const QString& msg, const QString& cat = QString())     { log(Info, msg, cat); }
    static void warning(const QString& msg, const QString& cat = QString())  { log(Warning, msg, cat); }
    static void error(const QString& msg, const QString& cat = QString())    { log(Error, msg, cat); }
    static void critical(const QString& msg, const QString& cat = QString()) { log(Critical, msg, cat); }

    static QString levelToString(Level level);

private:
    Logger() = default;
    ~Logger() = default;

    static void qtMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);
    static void rotateLogFiles();

    static QFile* s_logFile;
    static QTextStream* s_logStream;
    static QRecursiveMutex s_mutex;
    static QString s_logDirPath;
    static QString s_currentLogPath;
    static int s_maxLogFiles;
    static bool s_initialized;
    static QtMessageHandler s_previousHandler;
};

#endif // LOGGER_H
