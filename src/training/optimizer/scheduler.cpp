/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scheduler.hpp"
#include "core/binary_io.hpp"
#include "core/logger.hpp"
#include "optimizer.hpp"

#include <cmath>
#include <stdexcept>

namespace laia::training {

    ExponentialLR::ExponentialLR(IOptimizer& optimizer, double gamma)
        : optimizer_(optimizer),
          gamma_(gamma),
          initial_lr_(optimizer.get_lr()) {
        if (gamma <= 0.0 || gamma > 1.0) {
            throw std::invalid_argument("ExponentialLR gamma must be in (0, 1]");
        }
    }

    void ExponentialLR::step() {
        current_step_++;

        const double old_lr = optimizer_.get_lr();
        const double new_lr = initial_lr_ * std::pow(gamma_, current_step_);
        LOG_DEBUG("ExponentialLR step {}: LR {:.6e} -> {:.6e}", current_step_, old_lr, new_lr);
        optimizer_.set_lr(new_lr);
    }

    // ===== Serialization =====

    namespace {
        constexpr uint32_t SCHED_EXPONENTIAL_MAGIC = 0x4C415345; // "LASE"
        constexpr uint32_t SCHED_VERSION = 1;
    } // namespace

    void ExponentialLR::serialize(std::ostream& os) const {
        core::write_pod(os, SCHED_EXPONENTIAL_MAGIC);
        core::write_pod(os, SCHED_VERSION);
        core::write_pod(os, gamma_);
        core::write_pod(os, current_step_);
        core::write_pod(os, initial_lr_);

        LOG_DEBUG("Serialized ExponentialLR: step={}, gamma={}", current_step_, gamma_);
    }

    void ExponentialLR::deserialize(std::istream& is) {
        core::expect_header(is, SCHED_EXPONENTIAL_MAGIC, SCHED_VERSION, "ExponentialLR");

        gamma_ = core::read_pod<double>(is);
        current_step_ = core::read_pod<int>(is);
        initial_lr_ = core::read_pod<double>(is);

        LOG_DEBUG("Deserialized ExponentialLR: step={}, gamma={}", current_step_, gamma_);
    }

} // namespace laia::training
