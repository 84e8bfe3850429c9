/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"
#include "core/parameters.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace laia::core::args {

    // Parsed argument modes
    struct TrainingMode {
        std::unique_ptr<param::TrainingParameters> params;
        LogLevel log_level = LogLevel::Info;
        std::vector<std::pair<LogModule, LogLevel>> module_levels; // in command line order
        std::optional<std::filesystem::path> log_file;
    };
    struct HelpMode {};

    using ParsedArgs = std::variant<TrainingMode, HelpMode>;

    /**
     * laia_train --config <file> [--resume <pattern>] [--log-level <level>]
     *            [--log-module <module>=<level>]... [--log-file <path>] [--help]
     *
     * The configuration file is loaded and validated here; command line flags
     * override the file.
     */
    std::expected<ParsedArgs, std::string> parse_args(int argc, const char* const argv[]);

    std::string usage(std::string_view program);

} // namespace laia::core::args
