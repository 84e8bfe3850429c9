/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "model/module.hpp"
#include "optimizer/optimizer.hpp"

#include <map>
#include <string>

namespace laia::training {

    struct SgdConfig {
        double lr = 0.1;
        double momentum = 0.0;
        double weight_decay = 0.0;
    };

    /**
     * SGD with optional classical momentum:
     *   v = momentum * v + (g + weight_decay * p)
     *   p = p - lr * v
     *
     * Momentum buffers are keyed by parameter name and restored non-strictly:
     * buffers whose name or shape no longer matches the module are dropped.
     */
    class Sgd final : public IOptimizer {
    public:
        Sgd(Module& module, SgdConfig config);

        void zero_grad() override;
        void step() override;

        [[nodiscard]] double get_lr() const override { return config_.lr; }
        void set_lr(double lr) override { config_.lr = lr; }

        [[nodiscard]] const SgdConfig& config() const { return config_; }
        [[nodiscard]] uint64_t step_count() const { return step_count_; }

        void serialize(std::ostream& os) const override;
        void deserialize(std::istream& is) override;

    private:
        Module& module_;
        SgdConfig config_;
        std::map<std::string, Tensor> velocity_;
        uint64_t step_count_ = 0;
    };

} // namespace laia::training
