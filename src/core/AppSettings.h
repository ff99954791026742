#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QString>

/**
 * @brief Persistent application configuration.
 *
 * Backed by QSettings("KSpaceLab", "KSpaceLab"). Every key is optional;
 * missing or out-of-range values fall back to the defaults below.
 */
struct AppSettings {
    // engine/
    int maxDimension = 256;        ///< Longest side of the analysed grid

    // mask/
    int debounceMs = 120;          ///< Quiet period before a drag commits
    int initialRadiusPx = 35;      ///< Mask radius when selection starts (display px)
    int minRadiusPx = 5;           ///< Smallest radius a resize may produce (display px)
    int handleHitRadiusPx = 10;    ///< Pointer distance that grabs the resize handle

    // session/
    QString lastImage;
    bool restoreLastImage = true;

    // log/
    QString logDirectory;          ///< Empty = <app dir>/logs
    int logMaxFiles = 5;

    static AppSettings load();

    /** Writes the session keys only; engine and mask keys are user-edited. */
    void save() const;

    /** Clamp every field into its valid range. */
    void validate();
};

#endif // APPSETTINGS_H
