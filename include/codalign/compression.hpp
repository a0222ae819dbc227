#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <zstd.h>

namespace codalign {

inline std::string compress_bytes(const std::string& raw, int level = 1) {
    size_t bound = ZSTD_compressBound(raw.size());
    std::string comp(bound, '\0');
    size_t c = ZSTD_compress(comp.data(), bound, raw.data(), raw.size(), level);
    if (ZSTD_isError(c))
        throw std::runtime_error(std::string("zstd compression failed: ") + ZSTD_getErrorName(c));
    comp.resize(c);
    return comp;
}

inline std::string decompress_bytes(const char* data, std::size_t size) {
    unsigned long long decomp_size = ZSTD_getFrameContentSize(data, size);
    if (decomp_size == ZSTD_CONTENTSIZE_ERROR || decomp_size == ZSTD_CONTENTSIZE_UNKNOWN)
        throw std::runtime_error("not a sized zstd frame");
    std::string out(static_cast<std::size_t>(decomp_size), '\0');
    size_t got = ZSTD_decompress(out.data(), out.size(), data, size);
    if (ZSTD_isError(got))
        throw std::runtime_error(std::string("zstd decompression failed: ") +
                                 ZSTD_getErrorName(got));
    out.resize(got);
    return out;
}

} // namespace codalign
