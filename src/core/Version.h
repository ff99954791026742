#ifndef KSPACELAB_CORE_VERSION_H
#define KSPACELAB_CORE_VERSION_H

#ifndef KSPACELAB_VERSION
#define KSPACELAB_VERSION "0.0.0"
#endif

namespace KSpaceLab {
    /**
     * @brief Get the application version string.
     * @return The version string (e.g., "1.2.3").
     */
    const char* getVersion();
}

#endif // KSPACELAB_CORE_VERSION_H
