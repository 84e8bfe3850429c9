/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <vector>

namespace laia::core::args {

    std::string usage(std::string_view program) {
        return fmt::format(
            "Usage: {} --config <file> [options]\n"
            "\n"
            "Options:\n"
            "  -c, --config <file>      Training configuration (JSON)\n"
            "  -r, --resume <pattern>   Resume from the latest checkpoint matching <pattern>\n"
            "      --log-level <level>  trace, debug, info, perf, warn, error, critical, off\n"
            "      --log-module <module>=<level>\n"
            "                           Level for one of core, engine, checkpoint, data, experiment\n"
            "      --log-file <path>    Also write the log to <path>\n"
            "  -h, --help               Show this help\n",
            program);
    }

    namespace {
        std::expected<std::pair<LogModule, LogLevel>, std::string> parse_module_level(const std::string_view spec) {
            const auto eq = spec.find('=');
            if (eq == std::string_view::npos) {
                return std::unexpected(fmt::format("Expected <module>=<level>, got '{}'", spec));
            }
            const auto module = parse_log_module(spec.substr(0, eq));
            if (!module) {
                return std::unexpected(fmt::format("Unknown log module '{}'", spec.substr(0, eq)));
            }
            const auto level = parse_log_level(spec.substr(eq + 1));
            if (!level) {
                return std::unexpected(fmt::format("Unknown log level '{}'", spec.substr(eq + 1)));
            }
            return std::make_pair(*module, *level);
        }
    } // namespace

    std::expected<ParsedArgs, std::string> parse_args(const int argc, const char* const argv[]) {
        const std::string_view program = argc > 0 ? argv[0] : "laia_train";
        const std::vector<std::string_view> args(argv + std::min(argc, 1), argv + argc);

        std::optional<std::filesystem::path> config_path;
        std::optional<std::string> resume;
        std::optional<std::filesystem::path> log_file;
        LogLevel log_level = LogLevel::Info;
        std::vector<std::pair<LogModule, LogLevel>> module_levels;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto arg = args[i];
            const auto value = [&]() -> std::expected<std::string_view, std::string> {
                if (i + 1 >= args.size()) {
                    return std::unexpected(fmt::format("Missing value for {}", arg));
                }
                return args[++i];
            };

            if (arg == "-h" || arg == "--help") {
                fmt::print("{}", usage(program));
                return HelpMode{};
            } else if (arg == "-c" || arg == "--config") {
                auto v = value();
                if (!v) return std::unexpected(v.error());
                config_path = std::filesystem::path(*v);
            } else if (arg == "-r" || arg == "--resume") {
                auto v = value();
                if (!v) return std::unexpected(v.error());
                resume = std::string(*v);
            } else if (arg == "--log-level") {
                auto v = value();
                if (!v) return std::unexpected(v.error());
                const auto level = parse_log_level(*v);
                if (!level) {
                    return std::unexpected(fmt::format("Unknown log level '{}'", *v));
                }
                log_level = *level;
            } else if (arg == "--log-module") {
                auto v = value();
                if (!v) return std::unexpected(v.error());
                auto module_level = parse_module_level(*v);
                if (!module_level) return std::unexpected(module_level.error());
                module_levels.push_back(*module_level);
            } else if (arg == "--log-file") {
                auto v = value();
                if (!v) return std::unexpected(v.error());
                log_file = std::filesystem::path(*v);
            } else {
                return std::unexpected(fmt::format("Unknown argument '{}'\n{}", arg, usage(program)));
            }
        }

        if (!config_path) {
            return std::unexpected(fmt::format("--config is required\n{}", usage(program)));
        }

        auto params = param::load_parameters(*config_path);
        if (!params) {
            return std::unexpected(params.error());
        }
        if (resume) {
            params->checkpoint.resume_pattern = *resume;
        }
        if (auto valid = params->validate(); !valid) {
            return std::unexpected("Invalid configuration: " + valid.error());
        }

        TrainingMode mode;
        mode.params = std::make_unique<param::TrainingParameters>(std::move(*params));
        mode.log_level = log_level;
        mode.module_levels = std::move(module_levels);
        mode.log_file = std::move(log_file);
        return mode;
    }

} // namespace laia::core::args
