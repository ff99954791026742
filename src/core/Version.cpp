#include "Version.h"

namespace KSpaceLab {

const char* getVersion()
{
    return KSPACELAB_VERSION;
}

}
