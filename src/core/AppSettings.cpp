#include "AppSettings.h"
#include <QSettings>
#include <algorithm>

namespace {

constexpr const char* kOrganization = "KSpaceLab";
constexpr const char* kApplication  = "KSpaceLab";

int positiveOr(int value, int fallback) {
    return value > 0 ? value : fallback;
}

} // namespace

AppSettings AppSettings::load() {
    AppSettings s;
    QSettings settings(kOrganization, kApplication);

    s.maxDimension      = settings.value("engine/maxDimension", s.maxDimension).toInt();
    s.debounceMs        = settings.value("mask/debounceMs", s.debounceMs).toInt();
    s.initialRadiusPx   = settings.value("mask/initialRadiusPx", s.initialRadiusPx).toInt();
    s.minRadiusPx       = settings.value("mask/minRadiusPx", s.minRadiusPx).toInt();
    s.handleHitRadiusPx = settings.value("mask/handleHitRadiusPx", s.handleHitRadiusPx).toInt();
    s.lastImage         = settings.value("session/lastImage").toString();
    s.restoreLastImage  = settings.value("session/restoreLastImage", s.restoreLastImage).toBool();
    s.logDirectory      = settings.value("log/directory").toString();
    s.logMaxFiles       = settings.value("log/maxFiles", s.logMaxFiles).toInt();

    s.validate();
    return s;
}

void AppSettings::save() const {
    QSettings settings(kOrganization, kApplication);
    settings.setValue("session/lastImage", lastImage);
    settings.setValue("session/restoreLastImage", restoreLastImage);
}

void AppSettings::validate() {
    const AppSettings defaults;
    maxDimension      = positiveOr(maxDimension, defaults.maxDimension);
    debounceMs        = debounceMs >= 0 ? debounceMs : defaults.debounceMs;
    minRadiusPx       = positiveOr(minRadiusPx, defaults.minRadiusPx);
    initialRadiusPx   = std::max(positiveOr(initialRadiusPx, defaults.initialRadiusPx), minRadiusPx);
    handleHitRadiusPx = positiveOr(handleHitRadiusPx, defaults.handleHitRadiusPx);
    logMaxFiles       = positiveOr(logMaxFiles, defaults.logMaxFiles);
}
