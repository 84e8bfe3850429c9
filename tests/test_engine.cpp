/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/evaluator.hpp"
#include "engine/trainer.hpp"
#include "metrics/metric_stream.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <sstream>

using namespace laia::training;
using laia::test::CountingOptimizer;
using laia::test::VectorSource;

namespace {

    Trainer::TrainStep constant_loss(double loss = 1.0) {
        return [loss](const Batch&) { return loss; };
    }

    Action stop_action() {
        return Action("stop", [](const HookContext& ctx) { ctx.engine->stop(); });
    }

    // ===================================================================================
    // Epoch loop and termination
    // ===================================================================================

    TEST(EngineTest, Trainer_ReachesMaxEpochsAsExhaustion) {
        VectorSource source(3);
        CountingOptimizer optimizer;
        Trainer trainer(source, constant_loss(), optimizer, {.max_epochs = 4});

        EXPECT_EQ(trainer.state(), EngineState::Idle);
        EXPECT_EQ(trainer.run(), EngineState::Exhausted);
        EXPECT_EQ(trainer.epochs().value(), 4u);
        EXPECT_EQ(trainer.iterations().value(), 12u);
        EXPECT_EQ(source.epochs_started(), 4u);
    }

    TEST(EngineTest, Trainer_EmptySourceIsExhaustion) {
        VectorSource source(0);
        CountingOptimizer optimizer;
        Trainer trainer(source, constant_loss(), optimizer);

        EXPECT_EQ(trainer.run(), EngineState::Exhausted);
        EXPECT_EQ(trainer.epochs().value(), 0u);
        EXPECT_EQ(optimizer.steps, 0);
    }

    TEST(EngineTest, Trainer_StopInsideEpochTakesEffectAtBoundary) {
        VectorSource source(5);
        CountingOptimizer optimizer;
        Trainer trainer(source, constant_loss(), optimizer);
        trainer.add_hook(EngineEvent::IterEnd, std::make_shared<MultipleOf>(trainer.iterations(), 2), stop_action());

        EXPECT_EQ(trainer.run(), EngineState::Stopped);
        // The in-flight epoch was completed
        EXPECT_EQ(trainer.epochs().value(), 1u);
        EXPECT_EQ(trainer.iterations().value(), 5u);
    }

    TEST(EngineTest, Trainer_StopAtEpochStartSkipsThatEpoch) {
        VectorSource source(2);
        CountingOptimizer optimizer;
        Trainer trainer(source, constant_loss(), optimizer);
        trainer.add_hook(EngineEvent::EpochStart, std::make_shared<GEqThan>(trainer.epochs(), 3), stop_action());

        EXPECT_EQ(trainer.run(), EngineState::Stopped);
        EXPECT_EQ(trainer.epochs().value(), 3u);
        EXPECT_EQ(source.epochs_started(), 3u);
    }

    TEST(EngineTest, Trainer_EpochEndSeesCompletedEpochCount) {
        VectorSource source(2);
        CountingOptimizer optimizer;
        Trainer trainer(source, constant_loss(), optimizer, {.max_epochs = 3});

        std::vector<uint64_t> start_epochs, end_epochs, end_iterations;
        trainer.add_hook(EngineEvent::EpochStart, std::make_shared<Always>(),
                         Action("start", [&](const HookContext& ctx) { start_epochs.push_back(ctx.epoch); }));
        trainer.add_hook(EngineEvent::EpochEnd, std::make_shared<Always>(),
                         Action("end", [&](const HookContext& ctx) {
                             end_epochs.push_back(ctx.epoch);
                             end_iterations.push_back(ctx.iteration);
                         }));
        trainer.run();

        EXPECT_EQ(start_epochs, (std::vector<uint64_t>{0, 1, 2}));
        EXPECT_EQ(end_epochs, (std::vector<uint64_t>{1, 2, 3}));
        EXPECT_EQ(end_iterations, (std::vector<uint64_t>{2, 4, 6}));
    }

    TEST(EngineTest, Trainer_EpochCallbacksRunBeforeEpochEndHooks) {
        VectorSource source(1);
        CountingOptimizer optimizer;
        Trainer trainer(source, constant_loss(), optimizer, {.max_epochs = 2});

        std::vector<std::string> order;
        trainer.add_hook(EngineEvent::EpochEnd, std::make_shared<Always>(),
                         Action("hook", [&](const HookContext&) { order.push_back("hook"); }));
        trainer.add_epoch_callback([&](Engine&) { order.push_back("callback"); });
        trainer.run();

        EXPECT_EQ(order, (std::vector<std::string>{"callback", "hook", "callback", "hook"}));
    }

    TEST(EngineTest, Trainer_CanContinueAfterStop) {
        VectorSource source(1);
        CountingOptimizer optimizer;
        Trainer trainer(source, constant_loss(), optimizer, {.max_epochs = 4});
        auto handle = trainer.add_hook(EngineEvent::EpochEnd, std::make_shared<MultipleOf>(trainer.epochs(), 2),
                                       stop_action());

        EXPECT_EQ(trainer.run(), EngineState::Stopped);
        EXPECT_EQ(trainer.epochs().value(), 2u);

        trainer.remove_hook(handle);
        EXPECT_EQ(trainer.run(), EngineState::Exhausted);
        EXPECT_EQ(trainer.epochs().value(), 4u);
    }

    // ===================================================================================
    // Gradient accumulation
    // ===================================================================================

    TEST(EngineTest, Trainer_UpdatesEveryIterationsPerUpdateBatches) {
        VectorSource source(5);
        CountingOptimizer optimizer;
        Trainer trainer(source, constant_loss(), optimizer, {.iterations_per_update = 2, .max_epochs = 2});
        trainer.run();

        // 10 iterations, the window opened by batch 5 closes with the first batch of epoch 2
        EXPECT_EQ(optimizer.steps, 5);
        EXPECT_EQ(optimizer.zero_grads, 5);
        EXPECT_EQ(trainer.updates(), 5u);
        EXPECT_EQ(trainer.iterations().value(), 10u);
        EXPECT_FALSE(trainer.window_open());
    }

    TEST(EngineTest, Trainer_OpenWindowCarriesAcrossEpochs) {
        VectorSource source(3);
        CountingOptimizer optimizer;
        Trainer trainer(source, constant_loss(), optimizer, {.iterations_per_update = 2});

        std::vector<int> steps_at_epoch_end;
        trainer.add_hook(EngineEvent::EpochEnd, std::make_shared<Always>(),
                         Action("record", [&](const HookContext&) { steps_at_epoch_end.push_back(optimizer.steps); }));
        std::vector<int> zero_grads_at_iter_start;
        trainer.add_hook(EngineEvent::IterStart, std::make_shared<Always>(),
                         Action("record", [&](const HookContext&) { zero_grads_at_iter_start.push_back(optimizer.zero_grads); }));

        auto handle = trainer.add_hook(EngineEvent::EpochStart, std::make_shared<GEqThan>(trainer.epochs(), 1),
                                       stop_action());
        trainer.run();
        EXPECT_TRUE(trainer.window_open());
        EXPECT_EQ(steps_at_epoch_end, (std::vector<int>{1}));

        // Resuming the same trainer must not clear the pending gradients
        trainer.remove_hook(handle);
        trainer.add_hook(EngineEvent::EpochStart, std::make_shared<GEqThan>(trainer.epochs(), 2), stop_action());
        trainer.run();
        EXPECT_EQ(steps_at_epoch_end, (std::vector<int>{1, 3}));
        EXPECT_EQ(zero_grads_at_iter_start, (std::vector<int>{0, 1, 1, 2, 2, 3}));
        EXPECT_FALSE(trainer.window_open());
    }

    TEST(EngineTest, Trainer_RejectsZeroIterationsPerUpdate) {
        VectorSource source(1);
        CountingOptimizer optimizer;
        EXPECT_THROW(Trainer(source, constant_loss(), optimizer, {.iterations_per_update = 0}),
                     std::invalid_argument);
    }

    TEST(EngineTest, Trainer_LossMeterAveragesOverEpochSamples) {
        VectorSource source(2, 3);
        CountingOptimizer optimizer;
        int call = 0;
        Trainer trainer(source, [&call](const Batch&) { return ++call == 1 ? 1.0 : 3.0; }, optimizer,
                        {.max_epochs = 1});
        trainer.run();
        EXPECT_DOUBLE_EQ(trainer.loss_meter().value(), 2.0);
        EXPECT_EQ(trainer.loss_meter().count(), 6u);
    }

    // ===================================================================================
    // Failure diagnostics
    // ===================================================================================

    TEST(EngineTest, Trainer_BatchFailureCarriesBatchIds) {
        VectorSource source(4);
        CountingOptimizer optimizer;
        Trainer trainer(source, [](const Batch& batch) -> double {
            if (batch.index == 2) {
                throw std::runtime_error("NaN in forward");
            }
            return 1.0;
        },
                        optimizer);

        try {
            trainer.run();
            FAIL() << "expected BatchFailure";
        } catch (const BatchFailure& e) {
            EXPECT_EQ(e.ids(), (std::vector<std::string>{"e0-b2-s0", "e0-b2-s1"}));
            EXPECT_EQ(e.batch_index(), 2u);
            EXPECT_EQ(e.epoch(), 0u);
            EXPECT_NE(std::string(e.what()).find("e0-b2-s1"), std::string::npos);
            EXPECT_NE(describe_nested(e).find("NaN in forward"), std::string::npos);
            EXPECT_THROW(std::rethrow_if_nested(e), std::runtime_error);
        }
        EXPECT_EQ(trainer.iterations().value(), 2u);
    }

    TEST(EngineTest, Trainer_NonFiniteLossIsABatchFailure) {
        VectorSource source(1);
        CountingOptimizer optimizer;
        Trainer trainer(source, [](const Batch&) { return std::numeric_limits<double>::quiet_NaN(); }, optimizer);
        EXPECT_THROW(trainer.run(), BatchFailure);
    }

    // ===================================================================================
    // Evaluator
    // ===================================================================================

    TEST(EngineTest, Evaluator_RunsOnePassPerRun) {
        VectorSource source(3);
        Evaluator evaluator(source, [](const Batch& batch) {
            EvalOutput out;
            out.loss = 0.5;
            for (size_t i = 0; i < batch.size(); ++i) {
                out.references.push_back({2, 3, 1, 4});
                out.hypotheses.push_back({2, 1, 4});
            }
            return out;
        },
                            {1});

        EXPECT_EQ(evaluator.run(), EngineState::Exhausted);
        EXPECT_EQ(evaluator.epochs().value(), 1u);
        EXPECT_EQ(evaluator.iterations().value(), 3u);
        EXPECT_DOUBLE_EQ(evaluator.loss_meter().value(), 0.5);
        EXPECT_DOUBLE_EQ(evaluator.error_meter().cer(), 0.25);
        EXPECT_DOUBLE_EQ(evaluator.error_meter().wer(), 0.5);

        evaluator.run();
        EXPECT_EQ(evaluator.epochs().value(), 2u);
        EXPECT_EQ(evaluator.error_meter().char_total(), 24u); // meters reset per pass
    }

    // ===================================================================================
    // State
    // ===================================================================================

    TEST(EngineTest, Serialization_RestoresCountersAndConditionState) {
        MetricStream metric("valid_cer");
        VectorSource source(2);
        CountingOptimizer optimizer;
        Trainer trainer(source, constant_loss(), optimizer, {.max_epochs = 3});
        auto lowest = std::make_shared<Lowest>(metric);
        trainer.add_hook(EngineEvent::EpochEnd, lowest, Action("noop", [](const HookContext&) {}));
        trainer.add_epoch_callback([&metric](Engine& e) { metric.append(10.0 - static_cast<double>(e.epochs().value())); });
        trainer.run();

        std::stringstream ss;
        trainer.serialize(ss);

        VectorSource source2(2);
        Trainer restored(source2, constant_loss(), optimizer, {.max_epochs = 5});
        auto lowest2 = std::make_shared<Lowest>(metric);
        restored.add_hook(EngineEvent::EpochEnd, lowest2, Action("noop", [](const HookContext&) {}));
        restored.deserialize(ss);

        EXPECT_EQ(restored.epochs().value(), 3u);
        EXPECT_EQ(restored.iterations().value(), 6u);
        EXPECT_EQ(lowest2->best(), lowest->best());
        EXPECT_EQ(lowest2->consumed(), 3u);

        restored.run();
        EXPECT_EQ(restored.epochs().value(), 5u);
        EXPECT_EQ(source2.epochs_started(), 2u);
    }

} // namespace
