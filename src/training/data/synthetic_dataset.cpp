/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "data/synthetic_dataset.hpp"
#include "core/logger.hpp"
#include "core/seed.hpp"

#include <fmt/format.h>
#include <random>
#include <stdexcept>

namespace laia::training {

    namespace {
        // Prototypes depend only on the symbol inventory, so train and valid sets share them
        constexpr uint64_t PROTOTYPE_SEED = 0x70726F746F;

        std::vector<float> make_prototypes(const size_t num_symbols, const size_t feature_dim) {
            std::mt19937_64 rng(PROTOTYPE_SEED);
            std::normal_distribution<float> dist(0.0f, 1.0f);
            std::vector<float> prototypes(num_symbols * feature_dim);
            for (auto& v : prototypes) {
                v = dist(rng);
            }
            return prototypes;
        }
    } // namespace

    SyntheticSequenceDataset::SyntheticSequenceDataset(const SyntheticDatasetConfig& config)
        : config_(config) {
        if (config.num_symbols < 2 || config.feature_dim == 0 || config.min_length == 0 ||
            config.min_length > config.max_length || config.frames_per_symbol == 0) {
            throw std::invalid_argument("Invalid synthetic dataset configuration");
        }

        const auto prototypes = make_prototypes(config.num_symbols, config.feature_dim);
        std::mt19937_64 rng(core::derive_seed(config.seed, 0));
        std::uniform_int_distribution<size_t> length_dist(config.min_length, config.max_length);
        std::uniform_int_distribution<int> symbol_dist(1, static_cast<int>(config.num_symbols) - 1);
        std::normal_distribution<float> noise(0.0f, config.noise);

        samples_.reserve(config.num_samples);
        for (size_t i = 0; i < config.num_samples; ++i) {
            Sample s;
            s.id = fmt::format("{}-{:06d}", config.id_prefix, i);
            s.feature_dim = config.feature_dim;

            const size_t length = length_dist(rng);
            for (size_t k = 0; k < length; ++k) {
                const int symbol = symbol_dist(rng);
                s.labels.push_back(symbol);
                for (size_t f = 0; f < config.frames_per_symbol; ++f) {
                    s.frame_labels.push_back(symbol);
                }
                s.frame_labels.push_back(0);
            }

            s.features.resize(s.frame_labels.size() * config.feature_dim);
            for (size_t t = 0; t < s.frame_labels.size(); ++t) {
                const auto* proto = &prototypes[static_cast<size_t>(s.frame_labels[t]) * config.feature_dim];
                for (size_t d = 0; d < config.feature_dim; ++d) {
                    s.features[t * config.feature_dim + d] = proto[d] + noise(rng);
                }
            }
            samples_.push_back(std::move(s));
        }

        LOG_DEBUG("Generated {} synthetic samples ({} symbols, dim {})",
                  samples_.size(), config.num_symbols, config.feature_dim);
    }

    Sample SyntheticSequenceDataset::get(const size_t index) const {
        return samples_.at(index);
    }

} // namespace laia::training
