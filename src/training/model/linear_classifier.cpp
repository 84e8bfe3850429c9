/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "model/linear_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace laia::training {

    namespace {
        void softmax_inplace(float* row, const size_t n) {
            const float max_v = *std::max_element(row, row + n);
            float sum = 0.0f;
            for (size_t i = 0; i < n; ++i) {
                row[i] = std::exp(row[i] - max_v);
                sum += row[i];
            }
            for (size_t i = 0; i < n; ++i) {
                row[i] /= sum;
            }
        }
    } // namespace

    LinearClassifier::LinearClassifier(const size_t feature_dim, const size_t num_classes, const uint64_t seed)
        : feature_dim_(feature_dim),
          num_classes_(num_classes) {
        if (feature_dim == 0 || num_classes < 2) {
            throw std::invalid_argument("LinearClassifier needs feature_dim > 0 and at least 2 classes");
        }

        std::mt19937_64 rng(seed);
        const float bound = 1.0f / std::sqrt(static_cast<float>(feature_dim));
        std::uniform_real_distribution<float> init(-bound, bound);

        auto weight = Tensor::zeros({num_classes, feature_dim});
        for (auto& w : weight.data) {
            w = init(rng);
        }
        register_parameter("output.weight", std::move(weight));
        register_parameter("output.bias", Tensor::zeros({num_classes}));
    }

    void LinearClassifier::check_sample(const Sample& sample) const {
        if (sample.feature_dim != feature_dim_) {
            throw std::invalid_argument("Sample '" + sample.id + "' has feature_dim " +
                                        std::to_string(sample.feature_dim) + ", model expects " +
                                        std::to_string(feature_dim_));
        }
    }

    std::vector<float> LinearClassifier::forward(const Sample& sample) const {
        check_sample(sample);
        const auto& w = parameter("output.weight").data;
        const auto& b = parameter("output.bias").data;
        const size_t frames = sample.num_frames();

        std::vector<float> logits(frames * num_classes_);
        for (size_t t = 0; t < frames; ++t) {
            const float* x = &sample.features[t * feature_dim_];
            for (size_t c = 0; c < num_classes_; ++c) {
                const float* wc = &w[c * feature_dim_];
                float acc = b[c];
                for (size_t d = 0; d < feature_dim_; ++d) {
                    acc += wc[d] * x[d];
                }
                logits[t * num_classes_ + c] = acc;
            }
        }
        return logits;
    }

    double LinearClassifier::loss(const Batch& batch) const {
        double total = 0.0;
        size_t frames = 0;
        for (const auto& sample : batch.samples) {
            auto probs = forward(sample);
            for (size_t t = 0; t < sample.num_frames(); ++t) {
                float* row = &probs[t * num_classes_];
                softmax_inplace(row, num_classes_);
                const auto target = static_cast<size_t>(sample.frame_labels[t]);
                total -= std::log(std::max(row[target], 1e-12f));
            }
            frames += sample.num_frames();
        }
        return frames == 0 ? 0.0 : total / static_cast<double>(frames);
    }

    double LinearClassifier::accumulate_gradients(const Batch& batch) {
        size_t total_frames = 0;
        for (const auto& sample : batch.samples) {
            total_frames += sample.num_frames();
        }
        if (total_frames == 0) {
            return 0.0;
        }

        auto& gw = grad("output.weight").data;
        auto& gb = grad("output.bias").data;
        const float scale = 1.0f / static_cast<float>(total_frames);

        double total = 0.0;
        for (const auto& sample : batch.samples) {
            auto probs = forward(sample);
            for (size_t t = 0; t < sample.num_frames(); ++t) {
                float* row = &probs[t * num_classes_];
                softmax_inplace(row, num_classes_);
                const auto target = static_cast<size_t>(sample.frame_labels[t]);
                total -= std::log(std::max(row[target], 1e-12f));

                // d(CE)/d(logit_c) = p_c - [c == target]
                const float* x = &sample.features[t * feature_dim_];
                for (size_t c = 0; c < num_classes_; ++c) {
                    const float delta = (row[c] - (c == target ? 1.0f : 0.0f)) * scale;
                    gb[c] += delta;
                    float* gwc = &gw[c * feature_dim_];
                    for (size_t d = 0; d < feature_dim_; ++d) {
                        gwc[d] += delta * x[d];
                    }
                }
            }
        }
        return total / static_cast<double>(total_frames);
    }

    std::vector<int> LinearClassifier::decode(const Sample& sample) const {
        const auto logits = forward(sample);
        std::vector<int> out;
        int prev = -1;
        for (size_t t = 0; t < sample.num_frames(); ++t) {
            const float* row = &logits[t * num_classes_];
            const int best = static_cast<int>(std::max_element(row, row + num_classes_) - row);
            if (best != prev && best != 0) {
                out.push_back(best);
            }
            prev = best;
        }
        return out;
    }

} // namespace laia::training
