/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace laia::core::param {

    struct OptimizationParameters {
        float learning_rate = 0.05f;
        float momentum = 0.9f;
        float lr_decay = 1.0f; // per-epoch exponential factor, 1.0 disables decay
        size_t batch_size = 16;
        size_t iterations_per_update = 1;
        std::optional<int64_t> max_epochs;
        std::optional<int64_t> early_stop_epochs;
        size_t valid_every = 1;

        nlohmann::json to_json() const;
        static OptimizationParameters from_json(const nlohmann::json& j);
    };

    struct CheckpointParameters {
        std::filesystem::path output_dir = "output";
        std::string experiment_name = "experiment";
        std::string model_filename = "model";
        size_t checkpoint_keep = 2;
        std::optional<int64_t> save_every;
        std::string best_metric = "valid_cer";
        std::optional<std::string> resume_pattern;

        nlohmann::json to_json() const;
        static CheckpointParameters from_json(const nlohmann::json& j);
    };

    struct DataParameters {
        uint64_t seed = 0x74726169;
        size_t num_workers = 2;
        size_t prefetch_batches = 4;
        size_t train_samples = 512;
        size_t valid_samples = 128;
        std::optional<size_t> samples_per_epoch;
        size_t feature_dim = 16;
        size_t num_symbols = 12; // symbol 0 is the CTC-style blank
        std::vector<int> word_delimiters = {1};

        nlohmann::json to_json() const;
        static DataParameters from_json(const nlohmann::json& j);
    };

    struct TrainingParameters {
        OptimizationParameters optimization;
        CheckpointParameters checkpoint;
        DataParameters data;

        nlohmann::json to_json() const;
        static TrainingParameters from_json(const nlohmann::json& j);

        // Fails fast on values that would otherwise silently disable behavior
        [[nodiscard]] std::expected<void, std::string> validate() const;
    };

    [[nodiscard]] std::expected<TrainingParameters, std::string> load_parameters(
        const std::filesystem::path& path);

} // namespace laia::core::param
