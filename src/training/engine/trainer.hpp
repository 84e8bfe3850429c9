/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "engine/engine.hpp"
#include "metrics/meters.hpp"
#include "optimizer/optimizer.hpp"

#include <functional>
#include <optional>

namespace laia::training {

    struct TrainerOptions {
        // Optimizer update after every N-th iteration of the run, counted across epochs
        uint64_t iterations_per_update = 1;
        std::optional<uint64_t> max_epochs;
    };

    /**
     * @brief Engine running the training compute step.
     *
     * The train step runs forward, loss and backward for one batch, accumulating
     * into the gradients, and returns the batch loss. Gradients are cleared at
     * the start of every update window and applied at its end. Windows follow
     * the iteration counter, so a window left open at the end of an epoch is
     * completed by the first batches of the next one. Whoever checkpoints the
     * trainer mid-window must also keep the accumulated gradients.
     */
    class Trainer final : public Engine {
    public:
        using TrainStep = std::function<double(const Batch&)>;

        Trainer(BatchSource& source, TrainStep step, IOptimizer& optimizer,
                TrainerOptions options = {}, std::string name = "train");

        EngineState run();

        [[nodiscard]] const AverageMeter& loss_meter() const { return loss_; }
        [[nodiscard]] const TimeMeter& timer() const { return timer_; }
        [[nodiscard]] const TrainerOptions& options() const { return options_; }
        [[nodiscard]] uint64_t updates() const { return iterations().value() / options_.iterations_per_update; }
        // True when gradients of a partial window are pending
        [[nodiscard]] bool window_open() const { return iterations().value() % options_.iterations_per_update != 0; }

    protected:
        void begin_epoch() override;
        void process_batch(const Batch& batch) override;
        void end_epoch() override;

    private:
        TrainStep step_;
        IOptimizer& optimizer_;
        TrainerOptions options_;
        AverageMeter loss_;
        TimeMeter timer_;
    };

} // namespace laia::training
