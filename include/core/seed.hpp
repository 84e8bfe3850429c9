/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>

namespace laia::core {

    /**
     * @brief Derive the seed of a child stream (data worker, epoch shuffle) from a root seed.
     *
     * Deterministic; the result never equals the root seed and distinct indices
     * give distinct seeds for the same root.
     */
    uint64_t derive_seed(uint64_t root_seed, uint64_t index);

} // namespace laia::core
