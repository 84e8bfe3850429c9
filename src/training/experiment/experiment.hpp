/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "checkpoint/state_archive.hpp"
#include "engine/evaluator.hpp"
#include "engine/trainer.hpp"
#include "metrics/metric_stream.hpp"
#include "model/module.hpp"
#include "optimizer/optimizer.hpp"
#include "optimizer/scheduler.hpp"

#include <map>
#include <string>

namespace laia::training {

    // Metric stream names
    inline constexpr const char* TRAIN_LOSS = "train_loss";
    inline constexpr const char* VALID_LOSS = "valid_loss";
    inline constexpr const char* VALID_CER = "valid_cer";
    inline constexpr const char* VALID_WER = "valid_wer";

    struct ExperimentOptions {
        uint64_t valid_every = 1; // evaluator pass every N training epochs
    };

    /**
     * @brief Trainer + evaluator + derived metric streams as one resumable unit.
     *
     * After every training epoch (before the trainer's EpochEnd hooks) the
     * experiment records the train loss, runs the evaluator when the epoch is a
     * multiple of valid_every, appends the validation metrics, steps the LR
     * scheduler and logs the epoch summary. Conditions bound to the metric streams
     * therefore always see the current epoch's values.
     */
    class Experiment {
    public:
        Experiment(std::string name,
                   Trainer& trainer,
                   Evaluator& evaluator,
                   Module& model,
                   IOptimizer& optimizer,
                   ExponentialLR* scheduler = nullptr,
                   ExperimentOptions options = {});

        Experiment(const Experiment&) = delete;
        Experiment& operator=(const Experiment&) = delete;

        [[nodiscard]] const std::string& name() const { return name_; }

        // Throws std::out_of_range for unknown names
        [[nodiscard]] const MetricStream& metric(const std::string& name) const;
        [[nodiscard]] bool has_metric(const std::string& name) const { return metrics_.contains(name); }

        [[nodiscard]] Trainer& trainer() { return trainer_; }
        [[nodiscard]] const Trainer& trainer() const { return trainer_; }
        [[nodiscard]] Evaluator& evaluator() { return evaluator_; }
        [[nodiscard]] const Evaluator& evaluator() const { return evaluator_; }

        // Sections: trainer, evaluator, metrics, model, gradients, optimizer[, scheduler]
        [[nodiscard]] StateArchive state() const;
        [[nodiscard]] StateArchive model_state() const;

        // Throws std::runtime_error on a corrupt or incompatible section; model is loaded non-strictly
        LoadReport load_state(const StateArchive& archive);

        EngineState run();

    private:
        void on_epoch_complete(const Engine& engine);
        MetricStream& stream(const std::string& name);

        std::string name_;
        Trainer& trainer_;
        Evaluator& evaluator_;
        Module& model_;
        IOptimizer& optimizer_;
        ExponentialLR* scheduler_;
        ExperimentOptions options_;
        std::map<std::string, MetricStream> metrics_;
    };

} // namespace laia::training
