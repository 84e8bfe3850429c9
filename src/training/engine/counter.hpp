/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace laia::training {

    // Monotonic counter owned by an engine (epochs, iterations) and read by conditions
    class Counter {
    public:
        explicit Counter(std::string name) : name_(std::move(name)) {}

        [[nodiscard]] uint64_t value() const { return value_; }
        [[nodiscard]] const std::string& name() const { return name_; }

        void increment() { ++value_; }
        void restore(uint64_t value) { value_ = value; }

    private:
        std::string name_;
        uint64_t value_ = 0;
    };

} // namespace laia::training
