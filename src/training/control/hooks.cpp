/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "control/hooks.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace laia::training {

    const char* to_string(const EngineEvent event) {
        switch (event) {
        case EngineEvent::EpochStart: return "epoch_start";
        case EngineEvent::IterStart:  return "iter_start";
        case EngineEvent::IterEnd:    return "iter_end";
        case EngineEvent::EpochEnd:   return "epoch_end";
        }
        return "unknown";
    }

    Action::Action(std::string name, Callback cb)
        : name_(std::move(name)),
          cb_(std::move(cb)) {}

    void Action::operator()(const HookContext& ctx) const {
        if (cb_) {
            cb_(ctx);
        }
    }

    Hook::Hook(ConditionPtr condition, Action action)
        : condition_(std::move(condition)),
          action_(std::move(action)) {
        if (!condition_) {
            throw std::invalid_argument("Hook requires a condition");
        }
        if (!action_) {
            throw std::invalid_argument("Hook requires an action");
        }
    }

    bool Hook::fire(const HookContext& ctx) {
        if (!condition_->evaluate()) {
            return false;
        }
        LOG_DEBUG("Hook {} -> {} at {} (epoch {}, iteration {})",
                  condition_->describe(), action_.name(), to_string(ctx.event), ctx.epoch, ctx.iteration);
        action_(ctx);
        return true;
    }

    std::size_t HookList::add(Hook hook) {
        const auto id = next_id_++;
        hooks_.push_back(Registration{.id = id, .hook = std::move(hook)});
        return id;
    }

    bool HookList::remove(const std::size_t id) {
        const auto it = std::find_if(hooks_.begin(), hooks_.end(),
                                     [&](const Registration& r) { return r.id == id; });
        if (it == hooks_.end()) {
            return false;
        }
        hooks_.erase(it);
        return true;
    }

    std::size_t HookList::fire(const HookContext& ctx) {
        std::size_t fired = 0;
        std::exception_ptr first_error;

        for (auto& reg : hooks_) {
            try {
                if (reg.hook.fire(ctx)) {
                    ++fired;
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Hook action '{}' failed at {}: {}", reg.hook.action().name(), to_string(ctx.event), e.what());
                if (!first_error) {
                    first_error = std::current_exception();
                }
            } catch (...) {
                LOG_ERROR("Hook action '{}' failed at {}: non-standard exception", reg.hook.action().name(),
                          to_string(ctx.event));
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }

        if (first_error) {
            std::rethrow_exception(first_error);
        }
        return fired;
    }

} // namespace laia::training
