#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace codalign {

/**
 * @brief Unbiased in-place Fisher-Yates shuffle.
 *
 * Walks the sequence from the back and swaps element i with a uniformly
 * chosen element in [0, i]. The random source is supplied by the caller so
 * seeding it controls reproducibility. Sequences of length 0 or 1 are left
 * untouched and draw nothing from the generator.
 */
template <typename T, typename Rng> void fisher_yates_shuffle(std::vector<T>& items, Rng& rng) {
    if (items.size() < 2)
        return;
    for (std::size_t i = items.size() - 1; i > 0; --i) {
        std::uniform_int_distribution<std::size_t> pick(0, i);
        std::size_t j = pick(rng);
        if (i != j)
            std::swap(items[i], items[j]);
    }
}

/// Generator used for key shuffling. A seed of zero draws one from the OS.
inline std::mt19937_64 make_shuffle_rng(std::uint64_t seed) {
    if (seed == 0)
        seed = (static_cast<std::uint64_t>(std::random_device{}()) << 32) ^ std::random_device{}();
    return std::mt19937_64{seed};
}

} // namespace codalign
