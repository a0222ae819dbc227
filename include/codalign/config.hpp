#pragma once

#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <thread>

#ifndef CODALIGN_CANONICAL_SAMPLE_RATE
#define CODALIGN_CANONICAL_SAMPLE_RATE 16000
#endif

#ifndef CODALIGN_CACHE_FILE_NAME
#define CODALIGN_CACHE_FILE_NAME "aligner_train_cache.bin"
#endif

#ifndef CODALIGN_AUDIT_FILE_NAME
#define CODALIGN_AUDIT_FILE_NAME "files_used.txt"
#endif

namespace codalign {

/// Rate every stored waveform is resampled to.
inline constexpr int canonical_sample_rate() { return CODALIGN_CANONICAL_SAMPLE_RATE; }

/// Worker count used when the caller does not pick one.
inline std::size_t default_loading_processes() {
    if (const char* env = std::getenv("CODALIGN_LOADING_PROCESSES")) {
        std::size_t val = std::strtoul(env, nullptr, 10);
        if (val > 0)
            return val;
    }
    std::size_t hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

/// Whether cache blobs are zstd compressed unless the caller says otherwise.
inline bool default_cache_compression() {
    const char* env = std::getenv("CODALIGN_CACHE_COMPRESS");
    return env && std::strcmp(env, "1") == 0;
}

} // namespace codalign
