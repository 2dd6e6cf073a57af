#pragma once

#define ROON_MPRIS_VERSION_MAJOR 1
#define ROON_MPRIS_VERSION_MINOR 0
#define ROON_MPRIS_VERSION_PATCH 1

#define ROON_MPRIS_STRINGIFY(x) #x
#define ROON_MPRIS_TOSTRING(x) ROON_MPRIS_STRINGIFY(x)

// "MAJOR.MINOR.PATCH", also reported to the Roon core at registration
#define ROON_MPRIS_VERSION_STRING                  \
    ROON_MPRIS_TOSTRING(ROON_MPRIS_VERSION_MAJOR) "." \
    ROON_MPRIS_TOSTRING(ROON_MPRIS_VERSION_MINOR) "." \
    ROON_MPRIS_TOSTRING(ROON_MPRIS_VERSION_PATCH)

#define ROON_MPRIS_VERSION_NUM \
    ((ROON_MPRIS_VERSION_MAJOR * 10000) + (ROON_MPRIS_VERSION_MINOR * 100) + ROON_MPRIS_VERSION_PATCH)
