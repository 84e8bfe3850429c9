/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <istream>
#include <ostream>

namespace laia::training {

    class IOptimizer; // Forward declaration

    /**
     * Per-epoch exponential learning rate decay: lr = initial_lr * gamma^step
     *
     * The LR is recomputed from initial_lr on every step, so a restored
     * scheduler does not drift. gamma == 1 keeps the LR constant.
     *
     * Example:
     *   Sgd optimizer(model, {.lr = 0.1});
     *   ExponentialLR scheduler(optimizer, 0.95);
     *
     *   for (int epoch = 0; epoch < 10; epoch++) {
     *       train_one_epoch();
     *       scheduler.step();  // Update learning rate
     *   }
     */
    class ExponentialLR {
    public:
        ExponentialLR(IOptimizer& optimizer, double gamma);

        void step();

        // Get current step count
        int get_step() const { return current_step_; }

        // Serialization for checkpoints
        void serialize(std::ostream& os) const;
        void deserialize(std::istream& is);

        double get_gamma() const { return gamma_; }
        double get_initial_lr() const { return initial_lr_; }

    private:
        IOptimizer& optimizer_;
        double gamma_;
        int current_step_ = 0;
        double initial_lr_;
    };

} // namespace laia::training
