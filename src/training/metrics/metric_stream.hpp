/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace laia::training {

    /**
     * @brief Append-only sequence of scalar observations of one named metric.
     *
     * Produced once per evaluated epoch by the Experiment and read by conditions.
     * Conditions keep their own history (best value, streaks); the stream only
     * records what was observed.
     */
    class MetricStream {
    public:
        explicit MetricStream(std::string name);

        void append(double value);

        [[nodiscard]] std::optional<double> latest() const;
        [[nodiscard]] size_t size() const { return values_.size(); }
        [[nodiscard]] bool empty() const { return values_.empty(); }
        [[nodiscard]] double at(size_t index) const { return values_.at(index); }
        [[nodiscard]] const std::vector<double>& values() const { return values_; }
        [[nodiscard]] const std::string& name() const { return name_; }

        void serialize(std::ostream& os) const;
        void deserialize(std::istream& is);

    private:
        std::string name_;
        std::vector<double> values_;
    };

} // namespace laia::training
