/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "control/hook_table.hpp"
#include "data/data_loader.hpp"
#include "engine/counter.hpp"

#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace laia::training {

    enum class EngineState {
        Idle,
        Running,
        Stopped,  // stop() was honoured at an epoch boundary
        Exhausted // batch source ran dry or the epoch horizon was reached
    };

    const char* to_string(EngineState state);

    /**
     * @brief Raised when a compute step throws; carries the ids of the failing batch.
     *
     * The original exception is attached with std::throw_with_nested.
     */
    class BatchFailure : public std::runtime_error {
    public:
        BatchFailure(const std::string& engine, uint64_t epoch, size_t batch_index, std::vector<std::string> ids);

        [[nodiscard]] const std::vector<std::string>& ids() const { return ids_; }
        [[nodiscard]] uint64_t epoch() const { return epoch_; }
        [[nodiscard]] size_t batch_index() const { return batch_index_; }

    private:
        std::vector<std::string> ids_;
        uint64_t epoch_;
        size_t batch_index_;
    };

    // what() of e followed by the what() of every nested exception, joined with ": "
    std::string describe_nested(const std::exception& e);

    /**
     * @brief Epoch/batch loop shared by the trainer and the evaluator.
     *
     * The engine owns its counters and its event table and is the only firer of
     * its hooks. Everything runs on the calling thread; only batch production
     * (inside the BatchSource) is concurrent.
     *
     * Per epoch:
     *   EpochStart hooks -> (stop honoured here) -> for each batch
     *   { IterStart hooks, compute step, iteration++, IterEnd hooks }
     *   -> epoch++ -> epoch-complete callbacks -> EpochEnd hooks.
     */
    class Engine {
    public:
        using EpochCallback = std::function<void(Engine&)>;

        Engine(std::string name, BatchSource& source);
        virtual ~Engine() = default;

        Engine(const Engine&) = delete;
        Engine& operator=(const Engine&) = delete;

        [[nodiscard]] const std::string& name() const { return name_; }
        [[nodiscard]] EngineState state() const { return state_; }

        [[nodiscard]] const Counter& epochs() const { return epochs_; }
        [[nodiscard]] const Counter& iterations() const { return iterations_; }

        HookTable::Handle add_hook(EngineEvent event, ConditionPtr condition, Action action);
        void remove_hook(const HookTable::Handle& handle);
        [[nodiscard]] HookTable& hooks() { return hooks_; }
        [[nodiscard]] const HookTable& hooks() const { return hooks_; }

        // Cooperative: takes effect at the next epoch boundary, never inside an epoch
        void stop();
        [[nodiscard]] bool stop_requested() const { return stop_requested_; }

        // Runs after the epoch counter advanced and before the EpochEnd hooks
        void add_epoch_callback(EpochCallback callback);

        // Counters plus the state of every registered condition
        void serialize(std::ostream& os) const;
        void deserialize(std::istream& is);

    protected:
        // Drives epochs until stopped, the source is empty, or one of the limits is reached
        EngineState run_epochs(std::optional<uint64_t> max_epochs, std::optional<uint64_t> max_passes);

        virtual void begin_epoch() {}
        virtual void process_batch(const Batch& batch) = 0;
        virtual void end_epoch() {}

    private:
        // Returns false when the source produced no batch at all
        bool run_epoch();
        void fire(EngineEvent event);

        std::string name_;
        BatchSource& source_;
        Counter epochs_;
        Counter iterations_;
        HookTable hooks_;
        std::vector<EpochCallback> epoch_callbacks_;
        EngineState state_ = EngineState::Idle;
        bool stop_requested_ = false;
    };

} // namespace laia::training
