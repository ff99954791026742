#include "ErrorHandling.h"
#include "Logger.h"
#include <QFile>

QString errorKindName(KSpaceError kind) {
    switch (kind) {
        case KSpaceError::None:              return "None";
        case KSpaceError::InvalidDimensions: return "InvalidDimensions";
        case KSpaceError::NoSpectrumLoaded:  return "NoSpectrumLoaded";
        case KSpaceError::ChannelFailure:    return "ChannelFailure";
        case KSpaceError::DecodeFailure:     return "DecodeFailure";
    }
    return "Unknown";
}

// ============================================================================
// Error Reporting to User
// ============================================================================

void reportUserError(const QString& title, const QString& message) {
    Logger::error(QString("%1 - %2").arg(title, message), "App");
}

void reportWarning(const QString& title, const QString& message) {
    Logger::warning(QString("%1 - %2").arg(title, message), "App");
}

// ============================================================================
// Validation Helpers
// ============================================================================

bool validateFileExists(const QString& path, QString* error) {
    if (path.isEmpty()) {
        if (error) *error = "File path cannot be empty";
        return false;
    }

    QFile file(path);
    if (!file.exists()) {
        if (error) *error = formatError("File not found", path, "");
        return false;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = formatError("Cannot open file", path, file.errorString());
        return false;
    }
    file.close();

    return true;
}

bool validateDimensions(int rows, int cols, QString* error) {
    if (rows <= 0 || cols <= 0) {
        if (error) *error = QString("Invalid grid dimensions: %1x%2").arg(rows).arg(cols);
        return false;
    }
    return true;
}
