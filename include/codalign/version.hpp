#pragma once

#include <cstdint>

#define CODALIGN_VERSION_MAJOR 0
#define CODALIGN_VERSION_MINOR 3
#define CODALIGN_VERSION_PATCH 0

namespace codalign {

/// Library version encoded as major * 10000 + minor * 100 + patch.
inline constexpr int version() {
    return CODALIGN_VERSION_MAJOR * 10000 + CODALIGN_VERSION_MINOR * 100 + CODALIGN_VERSION_PATCH;
}

/// Version of the on-disk corpus cache layout. Bump when the blob changes.
inline constexpr std::uint32_t cache_format_version() { return 2; }

} // namespace codalign
