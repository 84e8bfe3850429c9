/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "metrics/metric_stream.hpp"
#include "core/binary_io.hpp"
#include <utility>

namespace laia::training {

    namespace {
        constexpr uint32_t METRIC_STREAM_MAGIC = 0x4C414D53; // "LAMS"
        constexpr uint32_t METRIC_STREAM_VERSION = 1;
    } // namespace

    MetricStream::MetricStream(std::string name) : name_(std::move(name)) {}

    void MetricStream::append(const double value) {
        values_.push_back(value);
    }

    std::optional<double> MetricStream::latest() const {
        if (values_.empty()) {
            return std::nullopt;
        }
        return values_.back();
    }

    void MetricStream::serialize(std::ostream& os) const {
        core::write_pod(os, METRIC_STREAM_MAGIC);
        core::write_pod(os, METRIC_STREAM_VERSION);
        core::write_pod(os, static_cast<uint64_t>(values_.size()));
        for (const double v : values_) {
            core::write_pod(os, v);
        }
    }

    void MetricStream::deserialize(std::istream& is) {
        core::expect_header(is, METRIC_STREAM_MAGIC, METRIC_STREAM_VERSION, "MetricStream");
        const auto count = core::read_pod<uint64_t>(is);
        std::vector<double> values;
        values.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            values.push_back(core::read_pod<double>(is));
        }
        values_ = std::move(values);
    }

} // namespace laia::training
