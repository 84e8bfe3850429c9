/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "conditions/conditions.hpp"
#include "engine/counter.hpp"
#include "metrics/metric_stream.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <random>
#include <sstream>

using namespace laia::training;

namespace {

    // Feeds the sequence one observation per evaluation and records the decisions
    template <typename C>
    std::vector<bool> drive(MetricStream& stream, C& condition, const std::vector<double>& values) {
        std::vector<bool> fired;
        for (const double v : values) {
            stream.append(v);
            fired.push_back(condition.evaluate());
        }
        return fired;
    }

    std::vector<double> random_sequence(std::mt19937& rng, size_t n) {
        // Few distinct values so ties are common
        std::uniform_int_distribution<int> dist(0, 5);
        std::vector<double> out(n);
        for (auto& v : out) {
            v = static_cast<double>(dist(rng));
        }
        return out;
    }

    // ===================================================================================
    // Lowest / Highest
    // ===================================================================================

    TEST(ConditionsTest, Lowest_FiresOnStrictNewMinimumOnly) {
        MetricStream cer("valid_cer");
        Lowest lowest(cer);

        const auto fired = drive(cer, lowest, {3.0, 5.0, 2.0, 2.0, 1.0, 4.0});
        EXPECT_EQ(fired, (std::vector<bool>{true, false, true, false, true, false}));
        EXPECT_DOUBLE_EQ(*lowest.best(), 1.0);
    }

    TEST(ConditionsTest, Lowest_MatchesPrefixMinimumOnRandomSequences) {
        std::mt19937 rng(1234);
        for (int trial = 0; trial < 50; ++trial) {
            MetricStream metric("m");
            Lowest lowest(metric);
            const auto values = random_sequence(rng, 20);

            double prefix_min = std::numeric_limits<double>::infinity();
            for (const double v : values) {
                metric.append(v);
                const bool expected = v < prefix_min;
                prefix_min = std::min(prefix_min, v);
                ASSERT_EQ(lowest.evaluate(), expected) << "trial " << trial;
            }
        }
    }

    TEST(ConditionsTest, Lowest_NoNewObservationIsFalseAndKeepsState) {
        MetricStream metric("m");
        Lowest lowest(metric);

        EXPECT_FALSE(lowest.evaluate());
        EXPECT_FALSE(lowest.best().has_value());

        metric.append(2.0);
        EXPECT_TRUE(lowest.evaluate());
        EXPECT_FALSE(lowest.evaluate());
        EXPECT_FALSE(lowest.evaluate());
        EXPECT_EQ(lowest.consumed(), 1u);
        EXPECT_DOUBLE_EQ(*lowest.best(), 2.0);
    }

    TEST(ConditionsTest, Lowest_CatchesUpOnObservationsAppendedBetweenFirings) {
        MetricStream metric("m");
        Lowest lowest(metric);

        metric.append(5.0);
        metric.append(4.0);
        EXPECT_TRUE(lowest.evaluate());
        EXPECT_EQ(lowest.consumed(), 2u);

        metric.append(1.0);
        metric.append(3.0);
        // 1.0 updated the best, but the newest observation is not a new minimum
        EXPECT_FALSE(lowest.evaluate());
        EXPECT_DOUBLE_EQ(*lowest.best(), 1.0);
    }

    TEST(ConditionsTest, Highest_MirrorsLowest) {
        MetricStream acc("accuracy");
        Highest highest(acc);

        const auto fired = drive(acc, highest, {0.5, 0.4, 0.7, 0.7, 0.9});
        EXPECT_EQ(fired, (std::vector<bool>{true, false, true, false, true}));
    }

    // ===================================================================================
    // ConsecutiveNonDecreasing / ConsecutiveNonIncreasing
    // ===================================================================================

    TEST(ConditionsTest, ConsecutiveNonDecreasing_ScenarioB) {
        MetricStream metric("valid_cer");
        ConsecutiveNonDecreasing cond(metric, 2);

        std::vector<uint64_t> streaks;
        std::vector<bool> fired;
        for (const double v : {5.0, 5.0, 4.0, 4.0, 4.0}) {
            metric.append(v);
            fired.push_back(cond.evaluate());
            streaks.push_back(cond.streak());
        }
        EXPECT_EQ(streaks, (std::vector<uint64_t>{0, 1, 0, 1, 2}));
        EXPECT_EQ(fired, (std::vector<bool>{false, false, false, false, true}));
    }

    TEST(ConditionsTest, ConsecutiveNonDecreasing_MatchesStreakDefinition) {
        std::mt19937 rng(99);
        for (int64_t n = 1; n <= 4; ++n) {
            for (int trial = 0; trial < 20; ++trial) {
                MetricStream metric("m");
                ConsecutiveNonDecreasing cond(metric, n);
                const auto values = random_sequence(rng, 25);

                double best = std::numeric_limits<double>::infinity();
                uint64_t streak = 0;
                for (const double v : values) {
                    if (v < best) {
                        best = v;
                        streak = 0;
                    } else {
                        ++streak;
                    }
                    metric.append(v);
                    ASSERT_EQ(cond.evaluate(), streak >= static_cast<uint64_t>(n));
                    ASSERT_EQ(cond.streak(), streak);
                }
            }
        }
    }

    TEST(ConditionsTest, ConsecutiveNonDecreasing_RejectsNonPositiveN) {
        MetricStream metric("m");
        EXPECT_THROW(ConsecutiveNonDecreasing(metric, 0), std::invalid_argument);
        EXPECT_THROW(ConsecutiveNonDecreasing(metric, -3), std::invalid_argument);
        EXPECT_THROW(ConsecutiveNonIncreasing(metric, 0), std::invalid_argument);
    }

    TEST(ConditionsTest, ConsecutiveNonIncreasing_CountsEpochsWithoutNewMaximum) {
        MetricStream metric("accuracy");
        ConsecutiveNonIncreasing cond(metric, 2);

        const auto fired = drive(metric, cond, {0.1, 0.2, 0.2, 0.1, 0.3});
        EXPECT_EQ(fired, (std::vector<bool>{false, false, false, true, false}));
    }

    // ===================================================================================
    // Counter conditions
    // ===================================================================================

    TEST(ConditionsTest, MultipleOf_FiresOnMultiplesOnly) {
        Counter epochs("epochs");
        MultipleOf every3(epochs, 3);

        std::vector<uint64_t> fired_at;
        for (int i = 0; i <= 12; ++i) {
            if (every3.evaluate()) {
                fired_at.push_back(epochs.value());
            }
            epochs.increment();
        }
        EXPECT_EQ(fired_at, (std::vector<uint64_t>{0, 3, 6, 9, 12}));
    }

    TEST(ConditionsTest, MultipleOf_RejectsNonPositiveN) {
        Counter epochs("epochs");
        EXPECT_THROW(MultipleOf(epochs, 0), std::invalid_argument);
        EXPECT_THROW(MultipleOf(epochs, -1), std::invalid_argument);
    }

    TEST(ConditionsTest, GEqThan_ScenarioC) {
        Counter epochs("epochs");
        GEqThan horizon(epochs, 10);

        for (uint64_t e = 0; e <= 15; ++e) {
            epochs.restore(e);
            EXPECT_EQ(horizon.evaluate(), e >= 10) << "epoch " << e;
        }
    }

    // ===================================================================================
    // Composites
    // ===================================================================================

    TEST(ConditionsTest, Composites_CombineChildren) {
        EXPECT_TRUE(Not(std::make_shared<Never>()).evaluate());
        EXPECT_FALSE(Not(std::make_shared<Always>()).evaluate());
        EXPECT_TRUE(All({std::make_shared<Always>(), std::make_shared<Always>()}).evaluate());
        EXPECT_FALSE(All({std::make_shared<Always>(), std::make_shared<Never>()}).evaluate());
        EXPECT_TRUE(Any({std::make_shared<Never>(), std::make_shared<Always>()}).evaluate());
        EXPECT_FALSE(Any({std::make_shared<Never>(), std::make_shared<Never>()}).evaluate());
    }

    TEST(ConditionsTest, Composites_EvaluateEveryChild) {
        MetricStream metric("m");
        auto lowest = std::make_shared<Lowest>(metric);
        Any any({std::make_shared<Always>(), lowest});

        metric.append(1.0);
        EXPECT_TRUE(any.evaluate());
        EXPECT_EQ(lowest->consumed(), 1u);
    }

    TEST(ConditionsTest, Composites_RejectNullChildren) {
        EXPECT_THROW(Not(nullptr), std::invalid_argument);
        EXPECT_THROW(All({std::make_shared<Always>(), nullptr}), std::invalid_argument);
    }

    // ===================================================================================
    // State persistence
    // ===================================================================================

    TEST(ConditionsTest, Serialization_LowestResumesDecisionHistory) {
        MetricStream metric("valid_cer");
        Lowest original(metric);
        drive(metric, original, {3.0, 2.0, 2.5});

        std::stringstream ss;
        original.serialize(ss);

        Lowest restored(metric);
        restored.deserialize(ss);
        EXPECT_EQ(restored.best(), original.best());
        EXPECT_EQ(restored.consumed(), 3u);
        EXPECT_FALSE(restored.evaluate());

        metric.append(2.0);
        EXPECT_FALSE(restored.evaluate()); // tie with restored best
        metric.append(1.5);
        EXPECT_TRUE(restored.evaluate());
    }

    TEST(ConditionsTest, Serialization_StreakSurvivesRoundTrip) {
        MetricStream metric("valid_cer");
        ConsecutiveNonDecreasing original(metric, 3);
        drive(metric, original, {4.0, 5.0, 6.0});
        ASSERT_EQ(original.streak(), 2u);

        std::stringstream ss;
        original.serialize(ss);

        ConsecutiveNonDecreasing restored(metric, 3);
        restored.deserialize(ss);
        EXPECT_EQ(restored.streak(), 2u);

        metric.append(4.0);
        EXPECT_TRUE(restored.evaluate());
    }

    TEST(ConditionsTest, Serialization_CompositeRoundTripAndArityCheck) {
        MetricStream metric("m");
        auto inner = std::make_shared<Lowest>(metric);
        All original({std::make_shared<Always>(), inner});
        metric.append(1.0);
        original.evaluate();

        std::stringstream ss;
        original.serialize(ss);

        auto restored_inner = std::make_shared<Lowest>(metric);
        All restored({std::make_shared<Always>(), restored_inner});
        restored.deserialize(ss);
        EXPECT_EQ(restored_inner->best(), inner->best());

        std::stringstream again;
        original.serialize(again);
        All wrong_arity({std::make_shared<Always>()});
        EXPECT_THROW(wrong_arity.deserialize(again), std::runtime_error);
    }

    TEST(ConditionsTest, Serialization_RejectsCorruptState) {
        MetricStream metric("m");
        Lowest lowest(metric);
        std::stringstream garbage("not a condition");
        EXPECT_THROW(lowest.deserialize(garbage), std::runtime_error);
    }

} // namespace
