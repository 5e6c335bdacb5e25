#pragma once

#define TROVE_VERSION_MAJOR 0
#define TROVE_VERSION_MINOR 3
#define TROVE_VERSION_PATCH 0

#define TROVE_VERSION ((TROVE_VERSION_MAJOR << 16) | (TROVE_VERSION_MINOR << 8) | TROVE_VERSION_PATCH)

namespace Trove
{
    inline constexpr int VERSION_MAJOR = TROVE_VERSION_MAJOR;
    inline constexpr int VERSION_MINOR = TROVE_VERSION_MINOR;
    inline constexpr int VERSION_PATCH = TROVE_VERSION_PATCH;
    inline constexpr int VERSION = TROVE_VERSION;
}
