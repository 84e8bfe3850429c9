/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "data/dataset.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace laia::training {

    struct SyntheticDatasetConfig {
        size_t num_samples = 128;
        size_t num_symbols = 12; // including blank (0)
        size_t feature_dim = 16;
        size_t min_length = 3;
        size_t max_length = 8;
        size_t frames_per_symbol = 2; // each symbol is followed by one blank frame
        float noise = 0.35f;
        uint64_t seed = 0;
        std::string id_prefix = "sample";
    };

    /**
     * @brief Deterministic generator of labelled symbol sequences.
     *
     * Every symbol owns a fixed prototype feature vector; frames are the
     * prototype of their target plus Gaussian noise. All samples are generated
     * up front, so get() is read-only and thread-safe.
     */
    class SyntheticSequenceDataset final : public Dataset {
    public:
        explicit SyntheticSequenceDataset(const SyntheticDatasetConfig& config);

        [[nodiscard]] size_t size() const override { return samples_.size(); }
        [[nodiscard]] Sample get(size_t index) const override;

        [[nodiscard]] const SyntheticDatasetConfig& config() const { return config_; }

    private:
        SyntheticDatasetConfig config_;
        std::vector<Sample> samples_;
    };

} // namespace laia::training
