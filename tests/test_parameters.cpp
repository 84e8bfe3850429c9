/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/parameters.hpp"
#include "test_helpers.hpp"
#include <functional>
#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

using namespace laia::core;
using laia::test::TempDir;
using laia::test::touch;

namespace {

    param::TrainingParameters with(std::function<void(param::TrainingParameters&)> edit) {
        param::TrainingParameters p;
        edit(p);
        return p;
    }

    // argv helper that keeps the strings alive
    struct Argv {
        explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
            for (const auto& s : storage) {
                pointers.push_back(s.c_str());
            }
        }
        int argc() const { return static_cast<int>(pointers.size()); }
        const char* const* argv() const { return pointers.data(); }

        std::vector<std::string> storage;
        std::vector<const char*> pointers;
    };

    // ===================================================================================
    // Validation
    // ===================================================================================

    TEST(ParametersTest, Validate_DefaultsAreValid) {
        const param::TrainingParameters defaults;
        EXPECT_TRUE(defaults.validate());
        EXPECT_FALSE(defaults.optimization.max_epochs);
        EXPECT_FALSE(defaults.checkpoint.save_every);
        EXPECT_FALSE(defaults.checkpoint.resume_pattern);
    }

    TEST(ParametersTest, Validate_RejectsValuesThatDisableBehavior) {
        EXPECT_FALSE(with([](auto& p) { p.checkpoint.checkpoint_keep = 0; }).validate());
        EXPECT_FALSE(with([](auto& p) { p.checkpoint.save_every = 0; }).validate());
        EXPECT_FALSE(with([](auto& p) { p.optimization.max_epochs = -1; }).validate());
        EXPECT_FALSE(with([](auto& p) { p.optimization.early_stop_epochs = 0; }).validate());
        EXPECT_FALSE(with([](auto& p) { p.optimization.iterations_per_update = 0; }).validate());
        EXPECT_FALSE(with([](auto& p) { p.optimization.valid_every = 0; }).validate());
        EXPECT_FALSE(with([](auto& p) { p.data.num_symbols = 1; }).validate());
        EXPECT_FALSE(with([](auto& p) { p.data.word_delimiters = {0}; }).validate());
        EXPECT_FALSE(with([](auto& p) { p.checkpoint.experiment_name.clear(); }).validate());

        const auto bad_metric = with([](auto& p) { p.checkpoint.best_metric = "train_loss"; }).validate();
        ASSERT_FALSE(bad_metric);
        EXPECT_NE(bad_metric.error().find("train_loss"), std::string::npos);

        EXPECT_TRUE(with([](auto& p) { p.checkpoint.best_metric = "valid_wer"; }).validate());
    }

    // ===================================================================================
    // JSON
    // ===================================================================================

    TEST(ParametersTest, Json_RoundTrip) {
        param::TrainingParameters p;
        p.optimization.max_epochs = 12;
        p.optimization.learning_rate = 0.125f;
        p.checkpoint.save_every = 3;
        p.checkpoint.resume_pattern = "exp.last-*";
        p.data.samples_per_epoch = 100;
        p.data.word_delimiters = {1, 2};

        const auto back = param::TrainingParameters::from_json(p.to_json());
        EXPECT_EQ(back.optimization.max_epochs, 12);
        EXPECT_FLOAT_EQ(back.optimization.learning_rate, 0.125f);
        EXPECT_EQ(back.checkpoint.save_every, 3);
        EXPECT_EQ(back.checkpoint.resume_pattern, "exp.last-*");
        EXPECT_EQ(back.data.samples_per_epoch, 100u);
        EXPECT_EQ(back.data.word_delimiters, (std::vector<int>{1, 2}));
        EXPECT_EQ(back.to_json(), p.to_json());
    }

    TEST(ParametersTest, Json_NullDisablesOptionalBehavior) {
        const auto j = nlohmann::json::parse(R"({
            "optimization": {"max_epochs": null, "early_stop_epochs": 4},
            "checkpoint": {"save_every": null}
        })");
        const auto p = param::TrainingParameters::from_json(j);
        EXPECT_FALSE(p.optimization.max_epochs);
        EXPECT_EQ(p.optimization.early_stop_epochs, 4);
        EXPECT_FALSE(p.checkpoint.save_every);
        EXPECT_EQ(p.checkpoint.checkpoint_keep, param::CheckpointParameters{}.checkpoint_keep);
    }

    TEST(ParametersTest, Load_RejectsNegativeCountsAndBadFiles) {
        TempDir dir("params_load");
        touch(dir / "negative.json", R"({"checkpoint": {"checkpoint_keep": -1}})");
        touch(dir / "broken.json", "{ not json");
        touch(dir / "ok.json", R"({"optimization": {"max_epochs": 7}})");

        EXPECT_FALSE(param::load_parameters(dir / "negative.json"));
        EXPECT_FALSE(param::load_parameters(dir / "broken.json"));
        EXPECT_FALSE(param::load_parameters(dir / "absent.json"));

        const auto ok = param::load_parameters(dir / "ok.json");
        ASSERT_TRUE(ok) << ok.error();
        EXPECT_EQ(ok->optimization.max_epochs, 7);
    }

    // ===================================================================================
    // Command line
    // ===================================================================================

    TEST(ParametersTest, Args_RequireConfig) {
        const Argv args({"laia_train"});
        const auto parsed = args::parse_args(args.argc(), args.argv());
        ASSERT_FALSE(parsed);
        EXPECT_NE(parsed.error().find("--config"), std::string::npos);
    }

    TEST(ParametersTest, Args_Help) {
        const Argv args({"laia_train", "--help"});
        const auto parsed = args::parse_args(args.argc(), args.argv());
        ASSERT_TRUE(parsed);
        EXPECT_TRUE(std::holds_alternative<args::HelpMode>(*parsed));
    }

    TEST(ParametersTest, Args_ResumeOverridesConfig) {
        TempDir dir("params_args");
        touch(dir / "config.json", R"({"checkpoint": {"resume_pattern": "from-file-*"}})");
        const auto config = (dir / "config.json").string();

        const Argv args({"laia_train", "-c", config, "--resume", "exp.ckpt-*", "--log-level", "debug"});
        auto parsed = args::parse_args(args.argc(), args.argv());
        ASSERT_TRUE(parsed) << parsed.error();
        auto* mode = std::get_if<args::TrainingMode>(&*parsed);
        ASSERT_NE(mode, nullptr);
        EXPECT_EQ(mode->params->checkpoint.resume_pattern, "exp.ckpt-*");
        EXPECT_EQ(mode->log_level, LogLevel::Debug);
        EXPECT_FALSE(mode->log_file);
        EXPECT_TRUE(mode->module_levels.empty());
    }

    TEST(ParametersTest, Args_ModuleLevels) {
        TempDir dir("params_modules");
        touch(dir / "config.json", "{}");
        const auto config = (dir / "config.json").string();

        const Argv args({"laia_train", "-c", config, "--log-module", "data=debug", "--log-module", "checkpoint=off"});
        auto parsed = args::parse_args(args.argc(), args.argv());
        ASSERT_TRUE(parsed) << parsed.error();
        auto* mode = std::get_if<args::TrainingMode>(&*parsed);
        ASSERT_NE(mode, nullptr);
        ASSERT_EQ(mode->module_levels.size(), 2u);
        EXPECT_EQ(mode->module_levels[0], std::make_pair(LogModule::Data, LogLevel::Debug));
        EXPECT_EQ(mode->module_levels[1], std::make_pair(LogModule::Checkpoint, LogLevel::Off));

        for (const char* bad : {"data", "network=debug", "data=loud"}) {
            const Argv rejected({"laia_train", "-c", config, "--log-module", bad});
            EXPECT_FALSE(args::parse_args(rejected.argc(), rejected.argv())) << bad;
        }
    }

    TEST(ParametersTest, Args_RejectsBadInput) {
        TempDir dir("params_bad_args");
        touch(dir / "config.json", "{}");
        touch(dir / "invalid.json", R"({"checkpoint": {"save_every": 0}})");
        const auto config = (dir / "config.json").string();
        const auto invalid = (dir / "invalid.json").string();

        const Argv unknown({"laia_train", "-c", config, "--frobnicate"});
        EXPECT_FALSE(args::parse_args(unknown.argc(), unknown.argv()));

        const Argv bad_level({"laia_train", "-c", config, "--log-level", "loud"});
        EXPECT_FALSE(args::parse_args(bad_level.argc(), bad_level.argv()));

        const Argv missing_value({"laia_train", "-c"});
        EXPECT_FALSE(args::parse_args(missing_value.argc(), missing_value.argv()));

        const Argv invalid_config({"laia_train", "--config", invalid});
        const auto parsed = args::parse_args(invalid_config.argc(), invalid_config.argv());
        ASSERT_FALSE(parsed);
        EXPECT_NE(parsed.error().find("save_every"), std::string::npos);
    }

} // namespace
