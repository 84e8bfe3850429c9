/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace laia::training {

    class Counter;
    class MetricStream;

    /**
     * @brief Stateful predicate deciding whether a hook fires.
     *
     * evaluate() is called exactly once per event firing. Conditions never throw for
     * missing data: with nothing to observe they evaluate to false. Any memory a
     * condition keeps (best value, streak) is updated only inside evaluate() and is
     * persisted through serialize()/deserialize() so resumed runs make the same
     * decisions as uninterrupted ones.
     */
    class Condition {
    public:
        virtual ~Condition() = default;

        virtual bool evaluate() = 0;

        // Stable identifier used to match serialized state on resume
        virtual const char* kind() const = 0;

        virtual std::string describe() const { return kind(); }

        // Stateless conditions serialize nothing
        virtual void serialize(std::ostream&) const {}
        virtual void deserialize(std::istream&) {}
    };

    using ConditionPtr = std::shared_ptr<Condition>;

    class Always final : public Condition {
    public:
        bool evaluate() override { return true; }
        const char* kind() const override { return "always"; }
    };

    class Never final : public Condition {
    public:
        bool evaluate() override { return false; }
        const char* kind() const override { return "never"; }
    };

    class Not final : public Condition {
    public:
        explicit Not(ConditionPtr condition);

        bool evaluate() override;
        const char* kind() const override { return "not"; }
        std::string describe() const override;
        void serialize(std::ostream& os) const override;
        void deserialize(std::istream& is) override;

    private:
        ConditionPtr condition_;
    };

    // All/Any evaluate every child on each call so that stateful children never miss an observation
    class All final : public Condition {
    public:
        explicit All(std::vector<ConditionPtr> conditions);

        bool evaluate() override;
        const char* kind() const override { return "all"; }
        std::string describe() const override;
        void serialize(std::ostream& os) const override;
        void deserialize(std::istream& is) override;

    private:
        std::vector<ConditionPtr> conditions_;
    };

    class Any final : public Condition {
    public:
        explicit Any(std::vector<ConditionPtr> conditions);

        bool evaluate() override;
        const char* kind() const override { return "any"; }
        std::string describe() const override;
        void serialize(std::ostream& os) const override;
        void deserialize(std::istream& is) override;

    private:
        std::vector<ConditionPtr> conditions_;
    };

    // true iff counter % n == 0; n must be positive
    class MultipleOf final : public Condition {
    public:
        MultipleOf(const Counter& counter, int64_t n);

        bool evaluate() override;
        const char* kind() const override { return "multiple_of"; }
        std::string describe() const override;

    private:
        const Counter& counter_;
        uint64_t n_;
    };

    // true iff counter >= n
    class GEqThan final : public Condition {
    public:
        GEqThan(const Counter& counter, uint64_t n);

        bool evaluate() override;
        const char* kind() const override { return "geq_than"; }
        std::string describe() const override;

    private:
        const Counter& counter_;
        uint64_t n_;
    };

    /**
     * @brief Base for conditions that consume a metric stream one observation at a time.
     *
     * Observations already consumed are never revisited. When the stream has no
     * observation newer than the last one consumed, evaluate() returns false and
     * the condition state is left untouched.
     */
    class MetricCondition : public Condition {
    public:
        bool evaluate() final;
        std::string describe() const override;
        void serialize(std::ostream& os) const override;
        void deserialize(std::istream& is) override;

        [[nodiscard]] uint64_t consumed() const { return consumed_; }

    protected:
        explicit MetricCondition(const MetricStream& metric);

        virtual bool observe(double value) = 0;
        virtual void serialize_state(std::ostream& os) const = 0;
        virtual void deserialize_state(std::istream& is) = 0;

        const MetricStream& metric_;

    private:
        uint64_t consumed_ = 0;
    };

    /**
     * @brief True when the newest observation is strictly lower than every earlier one.
     *
     * The first observation is vacuously a new lowest. Ties are not improvements.
     */
    class Lowest final : public MetricCondition {
    public:
        explicit Lowest(const MetricStream& metric);

        const char* kind() const override { return "lowest"; }
        [[nodiscard]] std::optional<double> best() const { return best_; }

    protected:
        bool observe(double value) override;
        void serialize_state(std::ostream& os) const override;
        void deserialize_state(std::istream& is) override;

    private:
        std::optional<double> best_;
    };

    class Highest final : public MetricCondition {
    public:
        explicit Highest(const MetricStream& metric);

        const char* kind() const override { return "highest"; }
        [[nodiscard]] std::optional<double> best() const { return best_; }

    protected:
        bool observe(double value) override;
        void serialize_state(std::ostream& os) const override;
        void deserialize_state(std::istream& is) override;

    private:
        std::optional<double> best_;
    };

    /**
     * @brief True once the metric has gone n consecutive observations without a new minimum.
     *
     * The streak resets to 0 on every new minimum (the first observation is one)
     * and grows by 1 otherwise; the condition holds while streak >= n.
     */
    class ConsecutiveNonDecreasing final : public MetricCondition {
    public:
        ConsecutiveNonDecreasing(const MetricStream& metric, int64_t n);

        const char* kind() const override { return "consecutive_non_decreasing"; }
        std::string describe() const override;
        [[nodiscard]] uint64_t streak() const { return streak_; }
        [[nodiscard]] std::optional<double> best() const { return best_; }

    protected:
        bool observe(double value) override;
        void serialize_state(std::ostream& os) const override;
        void deserialize_state(std::istream& is) override;

    private:
        uint64_t n_;
        uint64_t streak_ = 0;
        std::optional<double> best_;
    };

    // Mirror of ConsecutiveNonDecreasing for metrics that should grow
    class ConsecutiveNonIncreasing final : public MetricCondition {
    public:
        ConsecutiveNonIncreasing(const MetricStream& metric, int64_t n);

        const char* kind() const override { return "consecutive_non_increasing"; }
        std::string describe() const override;
        [[nodiscard]] uint64_t streak() const { return streak_; }

    protected:
        bool observe(double value) override;
        void serialize_state(std::ostream& os) const override;
        void deserialize_state(std::istream& is) override;

    private:
        uint64_t n_;
        uint64_t streak_ = 0;
        std::optional<double> best_;
    };

} // namespace laia::training
