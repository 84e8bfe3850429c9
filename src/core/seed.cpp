/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/seed.hpp"

namespace laia::core {

    namespace {
        // splitmix64 finalizer, a bijection on 64-bit values
        constexpr uint64_t mix(uint64_t z) {
            z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
            z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
            return z ^ (z >> 31);
        }

        constexpr uint64_t GOLDEN_GAMMA = 0x9E3779B97F4A7C15ULL;
    } // namespace

    uint64_t derive_seed(const uint64_t root_seed, const uint64_t index) {
        // mix() is a bijection, so distinct (root + gamma * (index + 1)) inputs give distinct outputs
        const uint64_t derived = mix(root_seed + GOLDEN_GAMMA * (index + 1));
        if (derived != root_seed) {
            return derived;
        }
        // Derived seed collided with the root: step once more along the sequence
        return mix(derived + GOLDEN_GAMMA);
    }

} // namespace laia::core
