/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "data/dataset.hpp"
#include "model/module.hpp"

#include <cstdint>
#include <vector>

namespace laia::training {

    /**
     * @brief Frame-wise affine classifier with softmax output.
     *
     * Parameters: "output.weight" [num_classes, feature_dim] and
     * "output.bias" [num_classes]. Class 0 is the blank symbol.
     */
    class LinearClassifier final : public Module {
    public:
        LinearClassifier(size_t feature_dim, size_t num_classes, uint64_t seed);

        [[nodiscard]] size_t feature_dim() const { return feature_dim_; }
        [[nodiscard]] size_t num_classes() const { return num_classes_; }

        /// Per-frame logits, frame-major [num_frames, num_classes]
        [[nodiscard]] std::vector<float> forward(const Sample& sample) const;

        /// Mean per-frame cross-entropy of the batch
        [[nodiscard]] double loss(const Batch& batch) const;

        /// Computes the batch loss and adds its gradient to the parameter gradients
        double accumulate_gradients(const Batch& batch);

        /// Greedy decoding: per-frame argmax, repeats merged, blanks removed
        [[nodiscard]] std::vector<int> decode(const Sample& sample) const;

    private:
        void check_sample(const Sample& sample) const;

        size_t feature_dim_;
        size_t num_classes_;
    };

} // namespace laia::training
