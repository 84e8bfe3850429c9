/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "conditions/conditions.hpp"
#include "core/binary_io.hpp"
#include "core/logger.hpp"
#include "engine/counter.hpp"
#include "metrics/metric_stream.hpp"
#include <stdexcept>

namespace laia::training {

    namespace {
        constexpr uint32_t COND_COMPOSITE_MAGIC = 0x4C41434D; // "LACM"
        constexpr uint32_t COND_METRIC_MAGIC = 0x4C41434E;    // "LACN"
        constexpr uint32_t COND_VERSION = 1;

        void write_optional_double(std::ostream& os, const std::optional<double>& v) {
            core::write_pod(os, static_cast<uint8_t>(v.has_value()));
            core::write_pod(os, v.value_or(0.0));
        }

        std::optional<double> read_optional_double(std::istream& is) {
            const auto present = core::read_pod<uint8_t>(is);
            const auto value = core::read_pod<double>(is);
            if (!present) {
                return std::nullopt;
            }
            return value;
        }

        uint64_t positive_or_throw(const int64_t n, const char* what) {
            if (n <= 0) {
                throw std::invalid_argument(std::string(what) + " requires n > 0, got " + std::to_string(n));
            }
            return static_cast<uint64_t>(n);
        }

        void serialize_children(std::ostream& os, const std::vector<ConditionPtr>& children) {
            core::write_pod(os, COND_COMPOSITE_MAGIC);
            core::write_pod(os, COND_VERSION);
            core::write_pod(os, static_cast<uint32_t>(children.size()));
            for (const auto& child : children) {
                core::write_string(os, child->kind());
                child->serialize(os);
            }
        }

        void deserialize_children(std::istream& is, const std::vector<ConditionPtr>& children) {
            core::expect_header(is, COND_COMPOSITE_MAGIC, COND_VERSION, "composite condition");
            const auto count = core::read_pod<uint32_t>(is);
            if (count != children.size()) {
                throw std::runtime_error("Composite condition arity mismatch: saved " + std::to_string(count) +
                                         ", current " + std::to_string(children.size()));
            }
            for (const auto& child : children) {
                const auto kind = core::read_string(is);
                if (kind != child->kind()) {
                    throw std::runtime_error("Composite condition child mismatch: '" + kind + "' vs '" +
                                             child->kind() + "'");
                }
                child->deserialize(is);
            }
        }

        std::string describe_children(const char* op, const std::vector<ConditionPtr>& children) {
            std::string out = std::string(op) + "(";
            for (size_t i = 0; i < children.size(); ++i) {
                if (i > 0) out += ", ";
                out += children[i]->describe();
            }
            return out + ")";
        }
    } // namespace

    // ===== Composites =====

    Not::Not(ConditionPtr condition) : condition_(std::move(condition)) {
        if (!condition_) {
            throw std::invalid_argument("Not requires a condition");
        }
    }

    bool Not::evaluate() { return !condition_->evaluate(); }

    std::string Not::describe() const { return "not(" + condition_->describe() + ")"; }

    void Not::serialize(std::ostream& os) const { serialize_children(os, {condition_}); }

    void Not::deserialize(std::istream& is) { deserialize_children(is, {condition_}); }

    All::All(std::vector<ConditionPtr> conditions) : conditions_(std::move(conditions)) {
        for (const auto& c : conditions_) {
            if (!c) throw std::invalid_argument("All requires non-null conditions");
        }
    }

    bool All::evaluate() {
        bool result = true;
        for (const auto& c : conditions_) {
            result = c->evaluate() && result;
        }
        return result;
    }

    std::string All::describe() const { return describe_children("all", conditions_); }

    void All::serialize(std::ostream& os) const { serialize_children(os, conditions_); }

    void All::deserialize(std::istream& is) { deserialize_children(is, conditions_); }

    Any::Any(std::vector<ConditionPtr> conditions) : conditions_(std::move(conditions)) {
        for (const auto& c : conditions_) {
            if (!c) throw std::invalid_argument("Any requires non-null conditions");
        }
    }

    bool Any::evaluate() {
        bool result = false;
        for (const auto& c : conditions_) {
            result = c->evaluate() || result;
        }
        return result;
    }

    std::string Any::describe() const { return describe_children("any", conditions_); }

    void Any::serialize(std::ostream& os) const { serialize_children(os, conditions_); }

    void Any::deserialize(std::istream& is) { deserialize_children(is, conditions_); }

    // ===== Counter conditions =====

    MultipleOf::MultipleOf(const Counter& counter, const int64_t n)
        : counter_(counter),
          n_(positive_or_throw(n, "MultipleOf")) {}

    bool MultipleOf::evaluate() { return counter_.value() % n_ == 0; }

    std::string MultipleOf::describe() const {
        return "multiple_of(" + counter_.name() + ", " + std::to_string(n_) + ")";
    }

    GEqThan::GEqThan(const Counter& counter, const uint64_t n)
        : counter_(counter),
          n_(n) {}

    bool GEqThan::evaluate() { return counter_.value() >= n_; }

    std::string GEqThan::describe() const {
        return "geq_than(" + counter_.name() + ", " + std::to_string(n_) + ")";
    }

    // ===== Metric conditions =====

    MetricCondition::MetricCondition(const MetricStream& metric) : metric_(metric) {}

    bool MetricCondition::evaluate() {
        if (metric_.size() <= consumed_) {
            return false;
        }
        // One decision per firing: catch up on any observations appended since the
        // last firing, the result is the decision for the newest one
        bool result = false;
        while (consumed_ < metric_.size()) {
            result = observe(metric_.at(static_cast<size_t>(consumed_)));
            ++consumed_;
        }
        return result;
    }

    std::string MetricCondition::describe() const {
        return std::string(kind()) + "(" + metric_.name() + ")";
    }

    void MetricCondition::serialize(std::ostream& os) const {
        core::write_pod(os, COND_METRIC_MAGIC);
        core::write_pod(os, COND_VERSION);
        core::write_pod(os, consumed_);
        serialize_state(os);
    }

    void MetricCondition::deserialize(std::istream& is) {
        core::expect_header(is, COND_METRIC_MAGIC, COND_VERSION, kind());
        consumed_ = core::read_pod<uint64_t>(is);
        deserialize_state(is);
    }

    Lowest::Lowest(const MetricStream& metric) : MetricCondition(metric) {}

    bool Lowest::observe(const double value) {
        if (!best_ || value < *best_) {
            LOG_INFO("New lowest {}: {:.6g}", metric_.name(), value);
            best_ = value;
            return true;
        }
        return false;
    }

    void Lowest::serialize_state(std::ostream& os) const { write_optional_double(os, best_); }

    void Lowest::deserialize_state(std::istream& is) { best_ = read_optional_double(is); }

    Highest::Highest(const MetricStream& metric) : MetricCondition(metric) {}

    bool Highest::observe(const double value) {
        if (!best_ || value > *best_) {
            LOG_INFO("New highest {}: {:.6g}", metric_.name(), value);
            best_ = value;
            return true;
        }
        return false;
    }

    void Highest::serialize_state(std::ostream& os) const { write_optional_double(os, best_); }

    void Highest::deserialize_state(std::istream& is) { best_ = read_optional_double(is); }

    ConsecutiveNonDecreasing::ConsecutiveNonDecreasing(const MetricStream& metric, const int64_t n)
        : MetricCondition(metric),
          n_(positive_or_throw(n, "ConsecutiveNonDecreasing")) {}

    bool ConsecutiveNonDecreasing::observe(const double value) {
        if (!best_ || value < *best_) {
            best_ = value;
            streak_ = 0;
        } else {
            ++streak_;
        }
        if (streak_ >= n_) {
            LOG_INFO("{} has not improved for {} consecutive observations", metric_.name(), streak_);
            return true;
        }
        return false;
    }

    std::string ConsecutiveNonDecreasing::describe() const {
        return "consecutive_non_decreasing(" + metric_.name() + ", " + std::to_string(n_) + ")";
    }

    void ConsecutiveNonDecreasing::serialize_state(std::ostream& os) const {
        core::write_pod(os, streak_);
        write_optional_double(os, best_);
    }

    void ConsecutiveNonDecreasing::deserialize_state(std::istream& is) {
        streak_ = core::read_pod<uint64_t>(is);
        best_ = read_optional_double(is);
    }

    ConsecutiveNonIncreasing::ConsecutiveNonIncreasing(const MetricStream& metric, const int64_t n)
        : MetricCondition(metric),
          n_(positive_or_throw(n, "ConsecutiveNonIncreasing")) {}

    bool ConsecutiveNonIncreasing::observe(const double value) {
        if (!best_ || value > *best_) {
            best_ = value;
            streak_ = 0;
        } else {
            ++streak_;
        }
        return streak_ >= n_;
    }

    std::string ConsecutiveNonIncreasing::describe() const {
        return "consecutive_non_increasing(" + metric_.name() + ", " + std::to_string(n_) + ")";
    }

    void ConsecutiveNonIncreasing::serialize_state(std::ostream& os) const {
        core::write_pod(os, streak_);
        write_optional_double(os, best_);
    }

    void ConsecutiveNonIncreasing::deserialize_state(std::istream& is) {
        streak_ = core::read_pod<uint64_t>(is);
        best_ = read_optional_double(is);
    }

} // namespace laia::training
