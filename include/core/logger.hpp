/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fmt/format.h>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace laia::core {

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Performance = 3,
        Warn = 4,
        Error = 5,
        Critical = 6,
        Off = 7
    };

    enum class LogModule : uint8_t {
        Core = 0,
        Engine = 1,
        Checkpoint = 2,
        Data = 3,
        Experiment = 4,
        Unknown = 5,
        Count = 6
    };

    // Parses "trace", "debug", "info", "perf", "warn", "error", "critical", "off"
    std::optional<LogLevel> parse_log_level(std::string_view name);

    // Parses "core", "engine", "checkpoint", "data", "experiment"
    std::optional<LogModule> parse_log_module(std::string_view name);
    const char* to_string(LogModule module);

    // Module a source file logs under, from its path
    LogModule module_of(std::string_view source_path);

    class Logger {
    public:
        static Logger& get();

        void init(LogLevel console_level = LogLevel::Info, const std::string& log_file = "");

        // Log a pre-formatted message (called by macros)
        void log(LogLevel level, const std::source_location& loc, std::string_view msg);

        // Module control. A module level replaces the global level for that
        // module; Off disables it. reset_module returns it to the global level.
        void enable_module(LogModule module, bool enabled = true);
        void set_module_level(LogModule module, LogLevel level);
        void reset_module(LogModule module);
        void set_level(LogLevel level);
        void flush();

        // Level and module filtering, independent of whether init() was called
        [[nodiscard]] bool should_log(LogLevel level, LogModule module) const;

        template <typename... Args>
        void log_internal(LogLevel level, const std::source_location& loc,
                          fmt::format_string<Args...> fmt, Args&&... args) {
            log(level, loc, fmt::format(fmt, std::forward<Args>(args)...));
        }

    private:
        Logger();
        ~Logger();
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        static constexpr uint8_t INHERIT_LEVEL = 0xFF;

        struct Impl;
        std::unique_ptr<Impl> impl_;

        std::atomic<uint8_t> global_level_{static_cast<uint8_t>(LogLevel::Info)};
        std::array<std::atomic<bool>, static_cast<size_t>(LogModule::Count)> module_enabled_{};
        std::array<std::atomic<uint8_t>, static_cast<size_t>(LogModule::Count)> module_level_{};
    };

    // Scoped timer for performance measurement
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string name, LogLevel level = LogLevel::Performance,
                             std::source_location loc = std::source_location::current());
        ~ScopedTimer();

    private:
        std::chrono::steady_clock::time_point start_;
        std::string name_;
        LogLevel level_;
        std::source_location loc_;
    };

} // namespace laia::core

// Global macros
#define LOG_TRACE(...) \
    ::laia::core::Logger::get().log_internal(::laia::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(...) \
    ::laia::core::Logger::get().log_internal(::laia::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(...) \
    ::laia::core::Logger::get().log_internal(::laia::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)

#define LOG_PERF(...) \
    ::laia::core::Logger::get().log_internal(::laia::core::LogLevel::Performance, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...) \
    ::laia::core::Logger::get().log_internal(::laia::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(...) \
    ::laia::core::Logger::get().log_internal(::laia::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)

#define LOG_CRITICAL(...) \
    ::laia::core::Logger::get().log_internal(::laia::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)

#define LAIA_LOG_CONCAT_IMPL(a, b) a##b
#define LAIA_LOG_CONCAT(a, b)      LAIA_LOG_CONCAT_IMPL(a, b)

#define LOG_TIMER(name)       ::laia::core::ScopedTimer LAIA_LOG_CONCAT(laia_timer_, __LINE__)(name)
#define LOG_TIMER_DEBUG(name) ::laia::core::ScopedTimer LAIA_LOG_CONCAT(laia_timer_, __LINE__)(name, ::laia::core::LogLevel::Debug)
