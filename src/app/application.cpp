/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "checkpoint/loader.hpp"
#include "checkpoint/saver.hpp"
#include "conditions/conditions.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include "core/seed.hpp"
#include "data/data_loader.hpp"
#include "data/synthetic_dataset.hpp"
#include "experiment/experiment.hpp"
#include "model/linear_classifier.hpp"
#include "optimizer/scheduler.hpp"
#include "optimizer/sgd.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <set>

namespace laia::app {

    using namespace laia::training;

    namespace {
        // Dataset and model seeds live in their own index range of the root seed
        constexpr uint64_t TRAIN_DATA_STREAM = 1000;
        constexpr uint64_t VALID_DATA_STREAM = 1001;
        constexpr uint64_t MODEL_INIT_STREAM = 1002;

        void save_or_log(ISaver& saver, const std::string& suffix) {
            if (auto result = saver.save(suffix); !result) {
                LOG_ERROR("Checkpoint '{}' not written: {}", saver.filename(), result.error());
            }
        }
    } // namespace

    std::expected<TrainingSummary, std::string> run_training(const core::param::TrainingParameters& params) {
        if (auto valid = params.validate(); !valid) {
            return std::unexpected("Invalid configuration: " + valid.error());
        }

        const auto& opt = params.optimization;
        const auto& ck = params.checkpoint;
        const auto& data = params.data;

        try {
            // Data
            SyntheticDatasetConfig train_cfg;
            train_cfg.num_samples = data.train_samples;
            train_cfg.num_symbols = data.num_symbols;
            train_cfg.feature_dim = data.feature_dim;
            train_cfg.seed = core::derive_seed(data.seed, TRAIN_DATA_STREAM);
            train_cfg.id_prefix = "train";
            SyntheticSequenceDataset train_set(train_cfg);

            auto valid_cfg = train_cfg;
            valid_cfg.num_samples = data.valid_samples;
            valid_cfg.seed = core::derive_seed(data.seed, VALID_DATA_STREAM);
            valid_cfg.id_prefix = "valid";
            SyntheticSequenceDataset valid_set(valid_cfg);

            DataLoaderOptions train_opts;
            train_opts.batch_size = opt.batch_size;
            train_opts.shuffle = true;
            train_opts.samples_per_epoch = data.samples_per_epoch;
            train_opts.num_workers = data.num_workers;
            train_opts.prefetch_batches = data.prefetch_batches;
            train_opts.seed = data.seed;
            DataLoader train_loader(train_set, train_opts);

            auto valid_opts = train_opts;
            valid_opts.shuffle = false;
            valid_opts.samples_per_epoch.reset();
            DataLoader valid_loader(valid_set, valid_opts);

            // Model and optimizer
            LinearClassifier model(data.feature_dim, data.num_symbols, core::derive_seed(data.seed, MODEL_INIT_STREAM));
            Sgd optimizer(model, {.lr = opt.learning_rate, .momentum = opt.momentum});
            std::unique_ptr<ExponentialLR> scheduler;
            if (opt.lr_decay != 1.0f) {
                scheduler = std::make_unique<ExponentialLR>(optimizer, opt.lr_decay);
            }

            // Engines
            Trainer trainer(
                train_loader,
                [&model](const Batch& batch) { return model.accumulate_gradients(batch); },
                optimizer,
                {.iterations_per_update = opt.iterations_per_update});

            const std::set<int> delimiters(data.word_delimiters.begin(), data.word_delimiters.end());
            Evaluator evaluator(
                valid_loader,
                [&model](const Batch& batch) {
                    EvalOutput out;
                    out.loss = model.loss(batch);
                    for (const auto& sample : batch.samples) {
                        out.references.push_back(sample.labels);
                        out.hypotheses.push_back(model.decode(sample));
                    }
                    return out;
                },
                delimiters);

            Experiment experiment(ck.experiment_name, trainer, evaluator, model, optimizer, scheduler.get(),
                                  {.valid_every = opt.valid_every});

            // Checkpointing
            nlohmann::json metadata;
            metadata["experiment"] = ck.experiment_name;
            metadata["parameters"] = params.to_json();
            const StateProvider provide_state = [&experiment] { return experiment.state(); };
            const StateProvider provide_model = [&experiment] { return experiment.model_state(); };

            const auto make_state_saver = [&](const std::string& filename) {
                auto saver = std::make_unique<StateCheckpointSaver>(ck.output_dir, filename, provide_state);
                saver->set_metadata(metadata);
                return saver;
            };

            RollingSaver periodic_saver(make_state_saver(ck.experiment_name + ".ckpt"), ck.checkpoint_keep);
            RollingSaver best_saver(make_state_saver(ck.experiment_name + ".lowest-" + ck.best_metric), ck.checkpoint_keep);
            RollingSaver last_saver(make_state_saver(ck.experiment_name + ".last"), 1);
            ModelCheckpointSaver model_saver(ck.output_dir, ck.model_filename, provide_model);
            model_saver.set_metadata(metadata);

            // Hooks
            const auto stop = make_action("stop", [](Trainer& t, const HookContext&) { t.stop(); }, std::ref(trainer));

            if (opt.max_epochs) {
                trainer.add_hook(EngineEvent::EpochStart,
                                 std::make_shared<GEqThan>(trainer.epochs(), static_cast<uint64_t>(*opt.max_epochs)),
                                 stop);
            }
            if (ck.save_every) {
                trainer.add_hook(EngineEvent::EpochEnd,
                                 std::make_shared<MultipleOf>(trainer.epochs(), *ck.save_every),
                                 make_action(
                                     "save_periodic",
                                     [](RollingSaver& saver, const HookContext& ctx) {
                                         save_or_log(saver, std::to_string(ctx.epoch));
                                     },
                                     std::ref(periodic_saver)));
            }

            const auto& best_metric = experiment.metric(ck.best_metric);
            trainer.add_hook(EngineEvent::EpochEnd,
                             std::make_shared<Lowest>(best_metric),
                             make_action(
                                 "save_best",
                                 [](RollingSaver& best, ModelCheckpointSaver& model_out, const std::string& tag,
                                    const HookContext& ctx) {
                                     save_or_log(best, std::to_string(ctx.epoch));
                                     save_or_log(model_out, tag);
                                 },
                                 std::ref(best_saver), std::ref(model_saver), "lowest-" + ck.best_metric));

            if (opt.early_stop_epochs) {
                trainer.add_hook(EngineEvent::EpochEnd,
                                 std::make_shared<ConsecutiveNonDecreasing>(best_metric, *opt.early_stop_epochs),
                                 stop);
            }

            // Resume
            TrainingSummary summary;
            if (ck.resume_pattern) {
                LOG_TIMER("Resume");
                const StateCheckpointLoader loader([&experiment](const StateArchive& archive) {
                    experiment.load_state(archive);
                });
                auto resumed = loader.load_by(*ck.resume_pattern, ck.output_dir);
                if (!resumed) {
                    return std::unexpected("Resume failed: " + resumed.error());
                }
                if (*resumed) {
                    summary.resumed_from = **resumed;
                } else {
                    LOG_INFO("No checkpoint matches '{}', starting fresh", *ck.resume_pattern);
                }
            }

            // Train
            try {
                LOG_TIMER("Training");
                summary.state = experiment.run();
            } catch (const BatchFailure& e) {
                return std::unexpected("Training failed: " + describe_nested(e));
            }

            summary.epochs = trainer.epochs().value();
            summary.iterations = trainer.iterations().value();
            if (!best_metric.empty()) {
                summary.best_value = *std::min_element(best_metric.values().begin(), best_metric.values().end());
            }

            auto last = last_saver.save(std::to_string(summary.epochs));
            if (!last) {
                return std::unexpected("Final checkpoint failed: " + last.error());
            }
            summary.last_checkpoint = *last;
            return summary;

        } catch (const std::exception& e) {
            return std::unexpected(std::string("Training setup failed: ") + describe_nested(e));
        }
    }

    int Application::run(std::unique_ptr<core::param::TrainingParameters> params) {
        LOG_INFO("Experiment '{}', output {}", params->checkpoint.experiment_name,
                 core::path_to_utf8(params->checkpoint.output_dir));

        auto result = run_training(*params);
        if (!result) {
            LOG_ERROR("{}", result.error());
            return -1;
        }

        LOG_INFO("Training {} after {} epochs ({} iterations)", training::to_string(result->state),
                 result->epochs, result->iterations);
        if (result->best_value) {
            LOG_INFO("Best {}: {:.4f}", params->checkpoint.best_metric, *result->best_value);
        }
        return 0;
    }

} // namespace laia::app
