#pragma once

#include <array>
#include <blake3.h>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>

namespace codalign {

using Digest = std::array<std::uint8_t, BLAKE3_OUT_LEN>;

inline std::string to_hex(const unsigned char* data, std::size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string out(2 * len, '0');
    for (std::size_t i = 0; i < len; ++i) {
        out[2 * i] = hex[data[i] >> 4];
        out[2 * i + 1] = hex[data[i] & 0xf];
    }
    return out;
}

/** Compute a BLAKE3 digest for arbitrary memory. */
inline Digest blake3_digest(const void* data, std::size_t size) {
    Digest out{};
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, size);
    blake3_hasher_finalize(&hasher, out.data(), out.size());
    return out;
}

/// Hex BLAKE3 digest of a file, streamed in small chunks.
inline std::string hash_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("failed to open " + path);
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    char buf[4096];
    while (in.good()) {
        in.read(buf, sizeof(buf));
        std::streamsize got = in.gcount();
        if (got > 0)
            blake3_hasher_update(&hasher, reinterpret_cast<const uint8_t*>(buf),
                                 static_cast<size_t>(got));
    }
    uint8_t out[BLAKE3_OUT_LEN];
    blake3_hasher_finalize(&hasher, out, BLAKE3_OUT_LEN);
    return to_hex(out, BLAKE3_OUT_LEN);
}

} // namespace codalign
