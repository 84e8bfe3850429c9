/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "conditions/conditions.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace laia::training {

    class Engine; // forward declaration (non-owning in hooks)

    enum class EngineEvent {
        EpochStart,
        IterStart,
        IterEnd,
        EpochEnd
    };

    const char* to_string(EngineEvent event);

    struct EngineEventHash {
        std::size_t operator()(EngineEvent event) const noexcept {
            return static_cast<std::size_t>(event);
        }
    };

    // Firing-time context handed to actions
    struct HookContext {
        EngineEvent event = EngineEvent::EpochEnd;
        uint64_t epoch = 0;
        uint64_t iteration = 0;
        Engine* engine = nullptr; // non-owning
    };

    /**
     * @brief Deferred call: configuration arguments bound at setup, firing context supplied at call time.
     */
    class Action {
    public:
        using Callback = std::function<void(const HookContext&)>;

        Action() = default;
        Action(std::string name, Callback cb);

        void operator()(const HookContext& ctx) const;

        [[nodiscard]] const std::string& name() const { return name_; }
        [[nodiscard]] explicit operator bool() const { return static_cast<bool>(cb_); }

    private:
        std::string name_;
        Callback cb_;
    };

    /**
     * @brief Build an Action from a callable and early-bound arguments.
     *
     * The callable is invoked as fn(bound..., ctx).
     *
     * Example:
     *   auto save = make_action("save", [](RollingSaver& s, const Experiment& e, const HookContext& ctx) {
     *       s.save(e.state(), std::to_string(ctx.epoch));
     *   }, std::ref(saver), std::cref(experiment));
     */
    template <typename F, typename... Bound>
    Action make_action(std::string name, F&& fn, Bound&&... bound) {
        return Action(std::move(name),
                      [fn = std::forward<F>(fn),
                       args = std::make_tuple(std::forward<Bound>(bound)...)](const HookContext& ctx) {
                          std::apply([&](auto&... b) { std::invoke(fn, b..., ctx); }, args);
                      });
    }

    // Exactly one condition bound to exactly one action
    class Hook {
    public:
        Hook(ConditionPtr condition, Action action);

        // Evaluates the condition once and runs the action when it holds; returns whether it ran
        bool fire(const HookContext& ctx);

        [[nodiscard]] Condition& condition() { return *condition_; }
        [[nodiscard]] const Condition& condition() const { return *condition_; }
        [[nodiscard]] const Action& action() const { return action_; }

    private:
        ConditionPtr condition_;
        Action action_;
    };

    /**
     * @brief Hooks registered against one event, fired in registration order.
     *
     * Every hook is evaluated on every firing. A failing action does not prevent
     * the remaining hooks from firing; the first failure is rethrown once the
     * whole list has been processed.
     */
    class HookList {
    public:
        std::size_t add(Hook hook);
        bool remove(std::size_t id);

        // Returns the number of hooks whose action ran
        std::size_t fire(const HookContext& ctx);

        [[nodiscard]] std::size_t size() const { return hooks_.size(); }
        [[nodiscard]] bool empty() const { return hooks_.empty(); }

        template <typename Fn>
        void for_each(Fn&& fn) const {
            for (const auto& reg : hooks_) {
                fn(reg.id, reg.hook);
            }
        }

        template <typename Fn>
        void for_each(Fn&& fn) {
            for (auto& reg : hooks_) {
                fn(reg.id, reg.hook);
            }
        }

    private:
        struct Registration {
            std::size_t id;
            Hook hook;
        };

        std::vector<Registration> hooks_;
        std::size_t next_id_ = 1;
    };

} // namespace laia::training
