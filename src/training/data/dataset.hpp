/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace laia::training {

    // One labelled sequence: per-frame features plus the symbol transcript
    struct Sample {
        std::string id;
        std::vector<int> labels;       // transcript, blank-free
        std::vector<int> frame_labels; // per-frame targets, 0 = blank
        std::vector<float> features;   // frame-major [num_frames, feature_dim]
        size_t feature_dim = 0;

        [[nodiscard]] size_t num_frames() const {
            return feature_dim == 0 ? 0 : features.size() / feature_dim;
        }
    };

    struct Batch {
        size_t index = 0; // position within the epoch
        std::vector<std::string> ids;
        std::vector<Sample> samples;

        [[nodiscard]] size_t size() const { return samples.size(); }
    };

    /**
     * @brief Random-access sample collection.
     *
     * get() must be safe to call concurrently from data loader workers.
     */
    class Dataset {
    public:
        virtual ~Dataset() = default;

        [[nodiscard]] virtual size_t size() const = 0;
        [[nodiscard]] virtual Sample get(size_t index) const = 0;
    };

} // namespace laia::training
