/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/trainer.hpp"
#include "core/logger.hpp"

#include <cmath>

namespace laia::training {

    Trainer::Trainer(BatchSource& source, TrainStep step, IOptimizer& optimizer,
                     TrainerOptions options, std::string name)
        : Engine(std::move(name), source),
          step_(std::move(step)),
          optimizer_(optimizer),
          options_(options) {
        if (!step_) {
            throw std::invalid_argument("Trainer requires a train step");
        }
        if (options_.iterations_per_update == 0) {
            throw std::invalid_argument("iterations_per_update must be positive");
        }
    }

    EngineState Trainer::run() {
        LOG_INFO("[{}] Training from epoch {} (iterations_per_update={}, max_epochs={})",
                 name(), epochs().value(), options_.iterations_per_update,
                 options_.max_epochs ? std::to_string(*options_.max_epochs) : "none");
        return run_epochs(options_.max_epochs, std::nullopt);
    }

    void Trainer::begin_epoch() {
        loss_.reset();
        timer_.reset();
    }

    void Trainer::process_batch(const Batch& batch) {
        // Windows are aligned to the global iteration count, so one may span an epoch boundary
        const uint64_t position = iterations().value() % options_.iterations_per_update;
        if (position == 0) {
            optimizer_.zero_grad();
        }
        const double loss = step_(batch);
        if (!std::isfinite(loss)) {
            throw std::runtime_error("Non-finite loss: " + std::to_string(loss));
        }
        loss_.add(loss, batch.size());

        if (position + 1 == options_.iterations_per_update) {
            optimizer_.step();
        }
    }

    void Trainer::end_epoch() {
        const uint64_t done = iterations().value() % options_.iterations_per_update;
        if (done != 0) {
            LOG_DEBUG("[{}] Epoch {} done: loss {:.5f}, {} updates so far, window open with {}/{} batches",
                      name(), epochs().value() + 1, loss_.value(), updates(), done,
                      options_.iterations_per_update);
        } else {
            LOG_DEBUG("[{}] Epoch {} done: loss {:.5f}, {} updates so far", name(), epochs().value() + 1,
                      loss_.value(), updates());
        }
    }

} // namespace laia::training
