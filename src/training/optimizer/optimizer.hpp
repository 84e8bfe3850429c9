/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <istream>
#include <ostream>

namespace laia::training {

    // Update rule applied to a module's accumulated gradients
    class IOptimizer {
    public:
        virtual ~IOptimizer() = default;

        virtual void zero_grad() = 0;
        virtual void step() = 0;

        [[nodiscard]] virtual double get_lr() const = 0;
        virtual void set_lr(double lr) = 0;

        virtual void serialize(std::ostream& os) const = 0;
        virtual void deserialize(std::istream& is) = 0;
    };

} // namespace laia::training
