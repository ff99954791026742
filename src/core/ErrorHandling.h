#ifndef ERRORHANDLING_H
#define ERRORHANDLING_H

#include <QString>
#include <utility>

/**
 * @brief Error handling utilities for KSpaceLab
 *
 * The engine reports failures as values, never as exceptions that could
 * unwind through the interaction thread.
 *
 * Standard patterns:
 * 1. Result<T> for engine entry points
 *    Result<Spectrum> FourierTransform::forward(const SampleGrid& grid)
 *
 * 2. Bool return + optional QString* error output for helpers
 *    bool validateDimensions(int rows, int cols, QString* err = nullptr)
 *
 * 3. Signal/slot for async operations with error reporting
 *    ReconstructionService::failed(quint64, KSpaceError, QString)
 */

// ============================================================================
// Error Kinds
// ============================================================================

enum class KSpaceError {
    None,
    InvalidDimensions,   ///< Non-positive grid size
    NoSpectrumLoaded,    ///< Reconstruction requested before any load
    ChannelFailure,      ///< Worker thread unavailable or shut down
    DecodeFailure        ///< Input image could not be read or decoded
};

/** Stable tag for log lines and Error{message} replies. */
QString errorKindName(KSpaceError kind);

// ============================================================================
// Error Message Formatting
// ============================================================================

/**
 * @brief Format error message with context
 *
 * Usage:
 *   QString errMsg = formatError("Failed to decode image", filePath, "unsupported format");
 *   // Output: "Failed to decode image: /path/to/file.png - unsupported format"
 */
inline QString formatError(const QString& operation, const QString& context, int errorCode) {
    return QString("%1: %2 (error %3)").arg(operation, context, QString::number(errorCode));
}

inline QString formatError(const QString& operation, const QString& context, const QString& reason) {
    return QString("%1: %2 - %3").arg(operation, context, reason);
}

#define KSPACELAB_ASSERT(cond, msg) Q_ASSERT_X(cond, __FUNCTION__, msg)

// ============================================================================
// Error Result Type
// ============================================================================

template<typename T>
class Result {
public:
    // Success constructor
    explicit Result(const T& value) : m_value(value) {}
    explicit Result(T&& value) : m_value(std::move(value)) {}

    // Error constructor
    Result(KSpaceError kind, const QString& error) : m_kind(kind), m_error(error) {
        Q_ASSERT(kind != KSpaceError::None);
    }

    bool isSuccess() const { return m_kind == KSpaceError::None; }
    bool isError() const { return m_kind != KSpaceError::None; }

    const T& value() const {
        Q_ASSERT(isSuccess());
        return m_value;
    }

    T& mutable_value() {
        Q_ASSERT(isSuccess());
        return m_value;
    }

    /** Moves the value out; the Result is left holding a moved-from T. */
    T take() {
        Q_ASSERT(isSuccess());
        return std::move(m_value);
    }

    KSpaceError errorKind() const { return m_kind; }

    const QString& error() const {
        Q_ASSERT(isError());
        return m_error;
    }

    explicit operator bool() const { return isSuccess(); }
    bool operator!() const { return isError(); }

private:
    T m_value{};
    KSpaceError m_kind = KSpaceError::None;
    QString m_error;
};

// ============================================================================
// Error Logging & Reporting
// ============================================================================

/**
 * @brief Log an error that the user should see.
 * The window mirrors these into its status bar.
 */
void reportUserError(const QString& title, const QString& message);
void reportWarning(const QString& title, const QString& message);

// ============================================================================
// Validation Helpers
// ============================================================================

/**
 * @brief Validate file exists and is readable
 */
bool validateFileExists(const QString& path, QString* error = nullptr);

/**
 * @brief Validate a rows x cols grid size (both strictly positive)
 */
bool validateDimensions(int rows, int cols, QString* error = nullptr);

#endif // ERRORHANDLING_H
