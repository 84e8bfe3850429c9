/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "checkpoint/resolver.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using namespace laia::training;
using laia::test::set_mtime;
using laia::test::TempDir;
using laia::test::touch;

namespace fs = std::filesystem;

namespace {

    // ===================================================================================
    // Glob matching
    // ===================================================================================

    TEST(ResolverTest, Glob_Wildcards) {
        EXPECT_TRUE(glob_match("exp.ckpt-*", "exp.ckpt-12"));
        EXPECT_TRUE(glob_match("exp.ckpt-*", "exp.ckpt-"));
        EXPECT_FALSE(glob_match("exp.ckpt-*", "exp.ckpt"));
        EXPECT_FALSE(glob_match("exp.ckpt-*", "xexp.ckpt-1"));
        EXPECT_TRUE(glob_match("*-lowest-*", "model-lowest-valid_cer"));
        EXPECT_TRUE(glob_match("ep??", "ep01"));
        EXPECT_FALSE(glob_match("ep??", "ep1"));
        EXPECT_TRUE(glob_match("*", ""));
        EXPECT_TRUE(glob_match("a*b*c", "aXXbYYc"));
        EXPECT_FALSE(glob_match("a*b*c", "aXXbYY"));
    }

    TEST(ResolverTest, Glob_BracketsAndEscapes) {
        EXPECT_TRUE(glob_match("ckpt-[0-9]", "ckpt-7"));
        EXPECT_FALSE(glob_match("ckpt-[0-9]", "ckpt-x"));
        EXPECT_TRUE(glob_match("ckpt-[!0-9]", "ckpt-x"));
        EXPECT_TRUE(glob_match("ckpt-[ab]", "ckpt-b"));
        EXPECT_TRUE(glob_match("what\\?", "what?"));
        EXPECT_FALSE(glob_match("what\\?", "whats"));

        const std::string odd = "run[1]*";
        EXPECT_TRUE(glob_match(glob_escape(odd) + "-*", "run[1]*-3"));
        EXPECT_FALSE(glob_match(glob_escape(odd) + "-*", "run1x-3"));
    }

    TEST(ResolverTest, NaturalOrder_ComparesNumbersByValue) {
        EXPECT_TRUE(natural_less("exp-2", "exp-10"));
        EXPECT_FALSE(natural_less("exp-10", "exp-2"));
        EXPECT_TRUE(natural_less("exp-9", "exp-09a"));
        EXPECT_TRUE(natural_less("a", "b"));
        EXPECT_TRUE(natural_less("exp", "exp-1"));
        EXPECT_FALSE(natural_less("exp-1", "exp-1"));

        std::vector<std::string> names{"ckpt-10", "ckpt-9", "ckpt-100", "ckpt-1"};
        std::sort(names.begin(), names.end(), [](const auto& a, const auto& b) { return natural_less(a, b); });
        EXPECT_EQ(names, (std::vector<std::string>{"ckpt-1", "ckpt-9", "ckpt-10", "ckpt-100"}));
    }

    // ===================================================================================
    // Resolution
    // ===================================================================================

    TEST(ResolverTest, Resolve_NoMatch) {
        TempDir dir("resolve_none");
        touch(dir / "other-1");

        auto r = CheckpointResolver::resolve("exp.ckpt-*", dir.path());
        EXPECT_EQ(r.outcome, ResolveOutcome::NoMatch);
        EXPECT_FALSE(r.selected);
        EXPECT_TRUE(r.candidates.empty());

        r = CheckpointResolver::resolve("exp.ckpt-*", dir / "missing");
        EXPECT_EQ(r.outcome, ResolveOutcome::NoMatch);
    }

    TEST(ResolverTest, Resolve_Unique) {
        TempDir dir("resolve_unique");
        touch(dir / "exp.ckpt-4");
        touch(dir / "exp.last-4");

        const auto r = CheckpointResolver::resolve("exp.ckpt-*", dir.path());
        EXPECT_EQ(r.outcome, ResolveOutcome::Unique);
        ASSERT_TRUE(r.selected);
        EXPECT_EQ(*r.selected, dir / "exp.ckpt-4");
    }

    TEST(ResolverTest, Resolve_MultiplePicksMostRecent) {
        TempDir dir("resolve_recent");
        touch(dir / "exp.ckpt-3");
        touch(dir / "exp.ckpt-1");
        touch(dir / "exp.ckpt-2");
        set_mtime(dir / "exp.ckpt-3", -300);
        set_mtime(dir / "exp.ckpt-1", -10);
        set_mtime(dir / "exp.ckpt-2", -200);

        const auto r = CheckpointResolver::resolve("exp.ckpt-*", dir.path());
        EXPECT_EQ(r.outcome, ResolveOutcome::Multiple);
        EXPECT_EQ(*r.selected, dir / "exp.ckpt-1");
        EXPECT_EQ(r.candidates, (std::vector<fs::path>{dir / "exp.ckpt-3", dir / "exp.ckpt-2", dir / "exp.ckpt-1"}));
    }

    TEST(ResolverTest, Resolve_EqualTimesFallBackToNumericSuffix) {
        TempDir dir("resolve_ties");
        for (const char* name : {"exp.ckpt-9", "exp.ckpt-10", "exp.ckpt-2"}) {
            touch(dir / name);
        }
        const auto when = fs::file_time_type::clock::now() - std::chrono::seconds(60);
        for (const char* name : {"exp.ckpt-9", "exp.ckpt-10", "exp.ckpt-2"}) {
            fs::last_write_time(dir / name, when);
        }

        const auto r = CheckpointResolver::resolve("exp.ckpt-*", dir.path());
        EXPECT_EQ(*r.selected, dir / "exp.ckpt-10");
        EXPECT_EQ(r.candidates.front(), dir / "exp.ckpt-2");
    }

    TEST(ResolverTest, Resolve_IgnoresStagingFilesAndDirectories) {
        TempDir dir("resolve_tmp");
        touch(dir / "exp.ckpt-1");
        set_mtime(dir / "exp.ckpt-1", -100);
        touch(dir / "exp.ckpt-2.tmp");
        fs::create_directories(dir / "exp.ckpt-3");

        const auto r = CheckpointResolver::resolve("exp.ckpt-*", dir.path());
        EXPECT_EQ(r.outcome, ResolveOutcome::Unique);
        EXPECT_EQ(*r.selected, dir / "exp.ckpt-1");
    }

    TEST(ResolverTest, Resolve_PatternWithDirectory) {
        TempDir dir("resolve_subdir");
        fs::create_directories(dir / "runs" / "a");
        touch(dir / "runs" / "a" / "exp.last-5");

        auto r = CheckpointResolver::resolve("runs/a/exp.last-*", dir.path());
        ASSERT_EQ(r.outcome, ResolveOutcome::Unique);
        EXPECT_EQ(*r.selected, dir / "runs" / "a" / "exp.last-5");

        r = CheckpointResolver::resolve((dir / "runs" / "a" / "exp.last-*").string(), "/nonexistent");
        ASSERT_EQ(r.outcome, ResolveOutcome::Unique);
        EXPECT_EQ(*r.selected, dir / "runs" / "a" / "exp.last-5");
    }

    TEST(ResolverTest, Resolve_IsDeterministic) {
        TempDir dir("resolve_repeat");
        for (int i = 0; i < 6; ++i) {
            touch(dir / ("exp.ckpt-" + std::to_string(i)));
        }
        const auto first = CheckpointResolver::resolve("exp.ckpt-*", dir.path());
        for (int i = 0; i < 5; ++i) {
            const auto again = CheckpointResolver::resolve("exp.ckpt-*", dir.path());
            EXPECT_EQ(again.selected, first.selected);
            EXPECT_EQ(again.candidates, first.candidates);
        }
    }

} // namespace
