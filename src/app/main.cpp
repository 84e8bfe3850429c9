/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"

#include <fmt/format.h>

int main(int argc, char* argv[]) {
    auto result = laia::core::args::parse_args(argc, argv);
    if (!result) {
        fmt::print(stderr, "Error: {}\n", result.error());
        return 1;
    }

    return std::visit([](auto&& mode) -> int {
        using T = std::decay_t<decltype(mode)>;

        if constexpr (std::is_same_v<T, laia::core::args::HelpMode>) {
            return 0;
        } else if constexpr (std::is_same_v<T, laia::core::args::TrainingMode>) {
            auto& logger = laia::core::Logger::get();
            logger.init(mode.log_level, mode.log_file ? laia::core::path_to_utf8(*mode.log_file) : "");
            for (const auto& [module, level] : mode.module_levels) {
                logger.set_module_level(module, level);
            }
            LOG_INFO("LAIA trainer");
            laia::app::Application app;
            const int code = app.run(std::move(mode.params));
            logger.flush();
            return code;
        }
    },
                      std::move(*result));
}
