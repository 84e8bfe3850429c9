/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "engine/engine.hpp"
#include "metrics/meters.hpp"

#include <functional>
#include <set>
#include <vector>

namespace laia::training {

    // What the eval step reports for one batch
    struct EvalOutput {
        double loss = 0.0;
        std::vector<std::vector<int>> references;
        std::vector<std::vector<int>> hypotheses;
    };

    /**
     * @brief Engine running a forward-only pass and accumulating loss and error rates.
     *
     * Each run() is a single pass over the batch source; meters are reset at the
     * start of every pass.
     */
    class Evaluator final : public Engine {
    public:
        using EvalStep = std::function<EvalOutput(const Batch&)>;

        Evaluator(BatchSource& source, EvalStep step, std::set<int> word_delimiters = {},
                  std::string name = "valid");

        EngineState run();

        [[nodiscard]] const AverageMeter& loss_meter() const { return loss_; }
        [[nodiscard]] const ErrorRateMeter& error_meter() const { return errors_; }

    protected:
        void begin_epoch() override;
        void process_batch(const Batch& batch) override;

    private:
        EvalStep step_;
        AverageMeter loss_;
        ErrorRateMeter errors_;
    };

} // namespace laia::training
