/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/engine.hpp"
#include "core/binary_io.hpp"
#include "core/logger.hpp"

#include <exception>

namespace laia::training {

    namespace {
        constexpr uint32_t ENGINE_MAGIC = 0x4C41454E; // "LAEN"
        constexpr uint32_t ENGINE_VERSION = 1;

        std::string join_ids(const std::vector<std::string>& ids) {
            std::string out;
            for (const auto& id : ids) {
                if (!out.empty()) out += ", ";
                out += id;
            }
            return out;
        }
    } // namespace

    std::string describe_nested(const std::exception& e) {
        std::string out = e.what();
        try {
            std::rethrow_if_nested(e);
        } catch (const std::exception& inner) {
            out += ": " + describe_nested(inner);
        } catch (...) {
            out += ": non-standard exception";
        }
        return out;
    }

    const char* to_string(const EngineState state) {
        switch (state) {
        case EngineState::Idle: return "idle";
        case EngineState::Running: return "running";
        case EngineState::Stopped: return "stopped";
        case EngineState::Exhausted: return "exhausted";
        }
        return "unknown";
    }

    BatchFailure::BatchFailure(const std::string& engine, const uint64_t epoch, const size_t batch_index,
                               std::vector<std::string> ids)
        : std::runtime_error("[" + engine + "] batch " + std::to_string(batch_index) + " of epoch " +
                             std::to_string(epoch) + " failed (ids: " + join_ids(ids) + ")"),
          ids_(std::move(ids)),
          epoch_(epoch),
          batch_index_(batch_index) {}

    Engine::Engine(std::string name, BatchSource& source)
        : name_(std::move(name)),
          source_(source),
          epochs_(name_ + ".epochs"),
          iterations_(name_ + ".iterations") {}

    HookTable::Handle Engine::add_hook(const EngineEvent event, ConditionPtr condition, Action action) {
        LOG_DEBUG("[{}] Hook '{}' on {} when {}", name_, action.name(), to_string(event),
                  condition ? condition->describe() : "<null>");
        return hooks_.add(event, Hook(std::move(condition), std::move(action)));
    }

    void Engine::remove_hook(const HookTable::Handle& handle) {
        hooks_.remove(handle);
    }

    void Engine::stop() {
        if (!stop_requested_) {
            LOG_INFO("[{}] Stop requested at epoch {}", name_, epochs_.value());
        }
        stop_requested_ = true;
    }

    void Engine::add_epoch_callback(EpochCallback callback) {
        epoch_callbacks_.push_back(std::move(callback));
    }

    void Engine::fire(const EngineEvent event) {
        HookContext ctx;
        ctx.event = event;
        ctx.epoch = epochs_.value();
        ctx.iteration = iterations_.value();
        ctx.engine = this;
        hooks_.fire(event, ctx);
    }

    EngineState Engine::run_epochs(const std::optional<uint64_t> max_epochs, const std::optional<uint64_t> max_passes) {
        state_ = EngineState::Running;
        stop_requested_ = false;
        uint64_t passes = 0;

        while (true) {
            if (max_epochs && epochs_.value() >= *max_epochs) {
                LOG_INFO("[{}] Reached {} epochs", name_, *max_epochs);
                state_ = EngineState::Exhausted;
                break;
            }
            if (max_passes && passes >= *max_passes) {
                state_ = EngineState::Exhausted;
                break;
            }

            fire(EngineEvent::EpochStart);
            if (stop_requested_) {
                state_ = EngineState::Stopped;
                break;
            }

            if (!run_epoch()) {
                LOG_INFO("[{}] Batch source exhausted at epoch {}", name_, epochs_.value());
                state_ = EngineState::Exhausted;
                break;
            }
            ++passes;

            if (stop_requested_) {
                state_ = EngineState::Stopped;
                break;
            }
        }

        LOG_DEBUG("[{}] Loop finished: {} after {} epochs, {} iterations",
                  name_, to_string(state_), epochs_.value(), iterations_.value());
        return state_;
    }

    bool Engine::run_epoch() {
        const uint64_t epoch = epochs_.value();
        source_.start_epoch(epoch);
        begin_epoch();

        size_t batches = 0;
        while (auto batch = source_.next()) {
            fire(EngineEvent::IterStart);
            try {
                process_batch(*batch);
            } catch (...) {
                LOG_ERROR("[{}] Compute step failed on batch {} of epoch {}, ids: {}",
                          name_, batch->index, epoch, join_ids(batch->ids));
                std::throw_with_nested(BatchFailure(name_, epoch, batch->index, batch->ids));
            }
            iterations_.increment();
            ++batches;
            fire(EngineEvent::IterEnd);
        }

        if (batches == 0) {
            return false;
        }

        end_epoch();
        epochs_.increment();
        for (const auto& callback : epoch_callbacks_) {
            callback(*this);
        }
        fire(EngineEvent::EpochEnd);
        return true;
    }

    void Engine::serialize(std::ostream& os) const {
        core::write_pod(os, ENGINE_MAGIC);
        core::write_pod(os, ENGINE_VERSION);
        core::write_string(os, name_);
        core::write_pod(os, epochs_.value());
        core::write_pod(os, iterations_.value());
        hooks_.serialize(os);
    }

    void Engine::deserialize(std::istream& is) {
        core::expect_header(is, ENGINE_MAGIC, ENGINE_VERSION, "Engine");
        const auto saved_name = core::read_string(is);
        if (saved_name != name_) {
            LOG_WARN("[{}] Restoring state saved by engine '{}'", name_, saved_name);
        }
        epochs_.restore(core::read_pod<uint64_t>(is));
        iterations_.restore(core::read_pod<uint64_t>(is));
        hooks_.deserialize(is);
        state_ = EngineState::Idle;
        stop_requested_ = false;
        LOG_DEBUG("[{}] Restored at epoch {}, iteration {}", name_, epochs_.value(), iterations_.value());
    }

} // namespace laia::training
