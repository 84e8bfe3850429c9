/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "engine/engine.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace laia::app {

    struct TrainingSummary {
        training::EngineState state = training::EngineState::Idle;
        uint64_t epochs = 0;
        uint64_t iterations = 0;
        std::optional<std::filesystem::path> resumed_from;
        std::optional<double> best_value; // lowest observation of the best metric
        std::optional<std::filesystem::path> last_checkpoint;
    };

    /**
     * @brief Builds the whole training pipeline from parameters and runs it.
     *
     * Hooks registered on the trainer:
     *   EpochStart: epochs >= max_epochs            -> stop
     *   EpochEnd:   epochs % save_every == 0        -> rolling state save "<name>.ckpt-<epoch>"
     *   EpochEnd:   lowest best_metric              -> rolling state save "<name>.lowest-<metric>-<epoch>"
     *                                                  and model save "<model>-lowest-<metric>"
     *   EpochEnd:   best_metric not improved for N  -> stop
     * A final state checkpoint "<name>.last-<epoch>" is always written.
     */
    std::expected<TrainingSummary, std::string> run_training(const core::param::TrainingParameters& params);

    class Application {
    public:
        int run(std::unique_ptr<core::param::TrainingParameters> params);
    };

} // namespace laia::app
