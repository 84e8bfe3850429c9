/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <array>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace laia::core {

    namespace {
        constexpr const char* ANSI_RESET = "\033[0m";
        constexpr const char* ANSI_PERF = "\033[95m";

        class ColorSink final : public spdlog::sinks::base_sink<std::mutex> {
        public:
            ColorSink() {
                colors_[spdlog::level::trace] = "\033[37m";
                colors_[spdlog::level::debug] = "\033[36m";
                colors_[spdlog::level::info] = "\033[32m";
                colors_[spdlog::level::warn] = "\033[33m";
                colors_[spdlog::level::err] = "\033[31m";
                colors_[spdlog::level::critical] = "\033[1;31m";
                colors_[spdlog::level::off] = ANSI_RESET;
            }

        protected:
            void sink_it_(const spdlog::details::log_msg& msg) override {
                const auto time_t_val = std::chrono::system_clock::to_time_t(msg.time);
                std::tm tm{};
                localtime_r(&time_t_val, &tm);
                const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    msg.time.time_since_epoch()).count() % 1000;

                std::string_view filename;
                if (msg.source.filename) {
                    const std::string_view full_path(msg.source.filename);
                    const auto pos = full_path.find_last_of("/\\");
                    filename = (pos != std::string_view::npos) ? full_path.substr(pos + 1) : full_path;
                }

                const std::string_view msg_view(msg.payload.data(), msg.payload.size());
                const bool is_perf = msg_view.find("[PERF]") != std::string_view::npos;

                const char* color;
                const char* level_str;

                if (is_perf) {
                    color = ANSI_PERF;
                    level_str = "perf";
                } else {
                    switch (msg.level) {
                    case spdlog::level::trace:    color = colors_[0].c_str(); level_str = "trace"; break;
                    case spdlog::level::debug:    color = colors_[1].c_str(); level_str = "debug"; break;
                    case spdlog::level::info:     color = colors_[2].c_str(); level_str = "info"; break;
                    case spdlog::level::warn:     color = colors_[3].c_str(); level_str = "warn"; break;
                    case spdlog::level::err:      color = colors_[4].c_str(); level_str = "error"; break;
                    case spdlog::level::critical: color = colors_[5].c_str(); level_str = "critical"; break;
                    default:                      color = colors_[2].c_str(); level_str = "info"; break;
                    }
                }

                std::string output_msg(msg_view);
                if (is_perf) {
                    if (const auto pos = output_msg.find("[PERF] "); pos != std::string::npos) {
                        output_msg.erase(pos, 7);
                    }
                }

                std::printf("[%02d:%02d:%02d.%03d] %s[%s]%s %.*s:%d  %s\n",
                            tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis),
                            color, level_str, ANSI_RESET,
                            static_cast<int>(filename.size()), filename.data(), msg.source.line,
                            output_msg.c_str());
                std::fflush(stdout);
            }

            void flush_() override { std::fflush(stdout); }

        private:
            std::array<std::string, 7> colors_;
        };

        constexpr spdlog::level::level_enum to_spdlog_level(const LogLevel level) {
            switch (level) {
            case LogLevel::Trace:       return spdlog::level::trace;
            case LogLevel::Debug:       return spdlog::level::debug;
            case LogLevel::Info:        return spdlog::level::info;
            case LogLevel::Performance: return spdlog::level::info;
            case LogLevel::Warn:        return spdlog::level::warn;
            case LogLevel::Error:       return spdlog::level::err;
            case LogLevel::Critical:    return spdlog::level::critical;
            case LogLevel::Off:         return spdlog::level::off;
            default:                    return spdlog::level::info;
            }
        }
    } // anonymous namespace

    std::optional<LogLevel> parse_log_level(const std::string_view name) {
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "info") return LogLevel::Info;
        if (name == "perf") return LogLevel::Performance;
        if (name == "warn") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off") return LogLevel::Off;
        return std::nullopt;
    }

    std::optional<LogModule> parse_log_module(const std::string_view name) {
        if (name == "core") return LogModule::Core;
        if (name == "engine") return LogModule::Engine;
        if (name == "checkpoint") return LogModule::Checkpoint;
        if (name == "data") return LogModule::Data;
        if (name == "experiment") return LogModule::Experiment;
        return std::nullopt;
    }

    const char* to_string(const LogModule module) {
        switch (module) {
        case LogModule::Core: return "core";
        case LogModule::Engine: return "engine";
        case LogModule::Checkpoint: return "checkpoint";
        case LogModule::Data: return "data";
        case LogModule::Experiment: return "experiment";
        default: return "unknown";
        }
    }

    LogModule module_of(const std::string_view path) {
        const auto has = [path](const std::string_view part) { return path.find(part) != std::string_view::npos; };
        if (has("/checkpoint/"))
            return LogModule::Checkpoint;
        if (has("/engine/") || has("/control/") || has("/conditions/"))
            return LogModule::Engine;
        if (has("/data/"))
            return LogModule::Data;
        if (has("/experiment/") || has("/app/"))
            return LogModule::Experiment;
        if (has("/core/") || has("/model/") || has("/optimizer/") || has("/metrics/"))
            return LogModule::Core;
        return LogModule::Unknown;
    }

    struct Logger::Impl {
        std::shared_ptr<spdlog::logger> logger;
        std::mutex mutex;
    };

    Logger::Logger() : impl_(std::make_unique<Impl>()) {
        for (size_t i = 0; i < static_cast<size_t>(LogModule::Count); ++i) {
            module_enabled_[i] = true;
            module_level_[i] = INHERIT_LEVEL;
        }
    }

    Logger::~Logger() = default;

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    void Logger::init(const LogLevel console_level, const std::string& log_file) {
        std::lock_guard lock(impl_->mutex);

        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<ColorSink>();
        // Filtering happens in should_log so module levels can go below the console level
        console_sink->set_level(spdlog::level::trace);
        sinks.push_back(console_sink);

        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %s:%# %v");
            sinks.push_back(file_sink);
        }

        impl_->logger = std::make_shared<spdlog::logger>("laia", sinks.begin(), sinks.end());
        impl_->logger->set_level(spdlog::level::trace);
        spdlog::set_default_logger(impl_->logger);

        global_level_ = static_cast<uint8_t>(console_level);
    }

    bool Logger::should_log(const LogLevel level, const LogModule module) const {
        const auto module_idx = static_cast<size_t>(module);
        if (!module_enabled_[module_idx]) {
            return false;
        }
        const uint8_t module_lvl = module_level_[module_idx];
        const auto threshold = static_cast<LogLevel>(module_lvl == INHERIT_LEVEL ? global_level_.load() : module_lvl);
        // Performance threshold shows timings only
        if (threshold == LogLevel::Performance) {
            return level == LogLevel::Performance;
        }
        return level != LogLevel::Performance && level >= threshold;
    }

    void Logger::log(const LogLevel level, const std::source_location& loc, const std::string_view msg) {
        if (!impl_->logger || !should_log(level, module_of(loc.file_name()))) {
            return;
        }

        std::string final_msg(msg);
        if (level == LogLevel::Performance) {
            final_msg = "[PERF] " + final_msg;
        }

        impl_->logger->log(
            spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
            to_spdlog_level(level),
            final_msg);
    }

    void Logger::enable_module(const LogModule module, const bool enabled) {
        module_enabled_[static_cast<size_t>(module)] = enabled;
    }

    void Logger::set_module_level(const LogModule module, const LogLevel level) {
        if (level == LogLevel::Off) {
            enable_module(module, false);
            return;
        }
        enable_module(module, true);
        module_level_[static_cast<size_t>(module)] = static_cast<uint8_t>(level);
    }

    void Logger::reset_module(const LogModule module) {
        enable_module(module, true);
        module_level_[static_cast<size_t>(module)] = INHERIT_LEVEL;
    }

    void Logger::set_level(const LogLevel level) {
        global_level_ = static_cast<uint8_t>(level);
    }

    void Logger::flush() {
        if (impl_->logger) impl_->logger->flush();
    }

    ScopedTimer::ScopedTimer(std::string name, const LogLevel level, const std::source_location loc)
        : start_(std::chrono::steady_clock::now()),
          name_(std::move(name)),
          level_(level),
          loc_(loc) {}

    ScopedTimer::~ScopedTimer() {
        const auto duration = std::chrono::steady_clock::now() - start_;
        const auto ms = std::chrono::duration<double, std::milli>(duration).count();
        Logger::get().log(level_, loc_, fmt::format("{} took {:.2f}ms", name_, ms));
    }

} // namespace laia::core
