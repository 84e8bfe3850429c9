/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/evaluator.hpp"
#include "core/logger.hpp"

namespace laia::training {

    Evaluator::Evaluator(BatchSource& source, EvalStep step, std::set<int> word_delimiters, std::string name)
        : Engine(std::move(name), source),
          step_(std::move(step)),
          errors_(std::move(word_delimiters)) {
        if (!step_) {
            throw std::invalid_argument("Evaluator requires an eval step");
        }
    }

    EngineState Evaluator::run() {
        LOG_TIMER_DEBUG(name() + " pass");
        const auto state = run_epochs(std::nullopt, 1);
        LOG_DEBUG("[{}] Pass {}: loss {:.5f}, CER {:.4f}, WER {:.4f}", name(), epochs().value(),
                  loss_.value(), errors_.cer(), errors_.wer());
        return state;
    }

    void Evaluator::begin_epoch() {
        loss_.reset();
        errors_.reset();
    }

    void Evaluator::process_batch(const Batch& batch) {
        auto out = step_(batch);
        loss_.add(out.loss, batch.size());
        errors_.add(out.references, out.hypotheses);
    }

} // namespace laia::training
