/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "metrics/meters.hpp"
#include <gtest/gtest.h>
#include <random>

using namespace laia::training;

namespace {

    TEST(MetersTest, EditDistance_Basics) {
        EXPECT_EQ(edit_distance({}, {}), 0u);
        EXPECT_EQ(edit_distance({1, 2, 3}, {}), 3u);
        EXPECT_EQ(edit_distance({}, {4, 5}), 2u);
        EXPECT_EQ(edit_distance({1, 2, 3}, {1, 2, 3}), 0u);
        EXPECT_EQ(edit_distance({1, 2, 3}, {1, 3}), 1u);
        EXPECT_EQ(edit_distance({1, 2, 3}, {3, 2, 1}), 2u);
        EXPECT_EQ(edit_distance({5, 6, 7, 8}, {6, 7, 8, 9}), 2u);
    }

    TEST(MetersTest, SplitWords_DropsEmptyWords) {
        const std::set<int> delim{1};
        EXPECT_EQ(split_words({2, 3, 1, 4}, delim), (std::vector<std::vector<int>>{{2, 3}, {4}}));
        EXPECT_EQ(split_words({1, 1, 2, 1}, delim), (std::vector<std::vector<int>>{{2}}));
        EXPECT_TRUE(split_words({1, 1}, delim).empty());
        EXPECT_EQ(split_words({2, 3}, {}), (std::vector<std::vector<int>>{{2, 3}}));
    }

    TEST(MetersTest, ErrorRate_CharacterAndWord) {
        ErrorRateMeter meter({1});
        meter.add({{2, 3, 1, 4}}, {{2, 1, 4}});
        EXPECT_DOUBLE_EQ(meter.cer(), 0.25);
        EXPECT_DOUBLE_EQ(meter.wer(), 0.5);

        meter.add({{5, 6}}, {{5, 6}});
        EXPECT_EQ(meter.char_errors(), 1u);
        EXPECT_EQ(meter.char_total(), 6u);
        EXPECT_EQ(meter.word_total(), 3u);
        EXPECT_DOUBLE_EQ(meter.wer(), 1.0 / 3.0);

        meter.reset();
        EXPECT_DOUBLE_EQ(meter.cer(), 0.0);
        EXPECT_EQ(meter.char_total(), 0u);
    }

    TEST(MetersTest, ErrorRate_RejectsMismatchedCounts) {
        ErrorRateMeter meter;
        EXPECT_THROW(meter.add({{1}, {2}}, {{1}}), std::invalid_argument);
    }

    TEST(MetersTest, ErrorRate_ParallelMatchesSerialSum) {
        std::mt19937 rng(99);
        std::uniform_int_distribution<int> sym(1, 6);
        std::uniform_int_distribution<size_t> len(0, 12);

        std::vector<std::vector<int>> refs(500), hyps(500);
        uint64_t errors = 0, total = 0;
        for (size_t i = 0; i < refs.size(); ++i) {
            refs[i].resize(len(rng));
            hyps[i].resize(len(rng));
            for (auto& s : refs[i]) s = sym(rng);
            for (auto& s : hyps[i]) s = sym(rng);
            errors += edit_distance(refs[i], hyps[i]);
            total += refs[i].size();
        }

        ErrorRateMeter meter({1});
        meter.add(refs, hyps);
        EXPECT_EQ(meter.char_errors(), errors);
        EXPECT_EQ(meter.char_total(), total);
    }

    TEST(MetersTest, Average_WeightedBySamples) {
        AverageMeter meter;
        EXPECT_DOUBLE_EQ(meter.value(), 0.0);
        meter.add(1.0, 3);
        meter.add(5.0, 1);
        EXPECT_DOUBLE_EQ(meter.value(), 2.0);
        EXPECT_EQ(meter.count(), 4u);
        meter.reset();
        EXPECT_EQ(meter.count(), 0u);
    }

} // namespace
