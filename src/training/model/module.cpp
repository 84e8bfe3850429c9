/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "model/module.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <map>

namespace laia::training {

    namespace {
        constexpr uint32_t MODULE_MAGIC = 0x4C414D44; // "LAMD"
        constexpr uint32_t MODULE_VERSION = 1;
        constexpr uint32_t GRADIENTS_MAGIC = 0x4C414744; // "LAGD"
        constexpr uint32_t GRADIENTS_VERSION = 1;
    } // namespace

    size_t Module::index_of(const std::string& name) const {
        const auto it = std::find(names_.begin(), names_.end(), name);
        if (it == names_.end()) {
            throw std::out_of_range("Unknown parameter: " + name);
        }
        return static_cast<size_t>(it - names_.begin());
    }

    bool Module::has_parameter(const std::string& name) const {
        return std::find(names_.begin(), names_.end(), name) != names_.end();
    }

    Tensor& Module::parameter(const std::string& name) { return values_[index_of(name)]; }
    const Tensor& Module::parameter(const std::string& name) const { return values_[index_of(name)]; }
    Tensor& Module::grad(const std::string& name) { return grads_[index_of(name)]; }
    const Tensor& Module::grad(const std::string& name) const { return grads_[index_of(name)]; }

    Tensor& Module::register_parameter(const std::string& name, Tensor init) {
        if (has_parameter(name)) {
            throw std::invalid_argument("Duplicate parameter: " + name);
        }
        names_.push_back(name);
        grads_.push_back(Tensor::zeros(init.shape));
        values_.push_back(std::move(init));
        return values_.back();
    }

    void Module::zero_grad() {
        for (auto& g : grads_) {
            g.fill(0.0f);
        }
    }

    void Module::serialize(std::ostream& os) const {
        core::write_pod(os, MODULE_MAGIC);
        core::write_pod(os, MODULE_VERSION);
        core::write_pod(os, static_cast<uint32_t>(names_.size()));
        for (size_t i = 0; i < names_.size(); ++i) {
            core::write_string(os, names_[i]);
            os << values_[i];
        }
    }

    LoadReport Module::deserialize(std::istream& is, const bool strict) {
        core::expect_header(is, MODULE_MAGIC, MODULE_VERSION, "Module");
        const auto count = core::read_pod<uint32_t>(is);

        std::map<std::string, Tensor> saved;
        for (uint32_t i = 0; i < count; ++i) {
            auto name = core::read_string(is);
            Tensor t;
            is >> t;
            saved.emplace(std::move(name), std::move(t));
        }

        LoadReport report;
        for (const auto& [name, tensor] : saved) {
            if (!has_parameter(name)) {
                report.dropped.push_back(name);
                LOG_WARN("Dropped parameter '{}': not present in the model", name);
                continue;
            }
            const auto& current = parameter(name);
            if (current.shape != tensor.shape) {
                report.dropped.push_back(name);
                LOG_WARN("Dropped parameter '{}': checkpoint shape {} vs model shape {}",
                         name, tensor.shape_str(), current.shape_str());
            }
        }
        for (const auto& name : names_) {
            if (!saved.contains(name)) {
                report.missing.push_back(name);
                LOG_WARN("Parameter '{}' not found in checkpoint, keeping current values", name);
            }
        }

        if (strict && !report.complete()) {
            throw std::runtime_error("Strict load failed: " + std::to_string(report.dropped.size()) +
                                     " dropped, " + std::to_string(report.missing.size()) + " missing parameters");
        }

        for (auto& [name, tensor] : saved) {
            if (std::find(report.dropped.begin(), report.dropped.end(), name) != report.dropped.end()) {
                continue;
            }
            values_[index_of(name)] = std::move(tensor);
            report.loaded.push_back(name);
        }
        return report;
    }

    void Module::serialize_gradients(std::ostream& os) const {
        core::write_pod(os, GRADIENTS_MAGIC);
        core::write_pod(os, GRADIENTS_VERSION);
        core::write_pod(os, static_cast<uint32_t>(names_.size()));
        for (size_t i = 0; i < names_.size(); ++i) {
            core::write_string(os, names_[i]);
            os << grads_[i];
        }
    }

    void Module::deserialize_gradients(std::istream& is) {
        core::expect_header(is, GRADIENTS_MAGIC, GRADIENTS_VERSION, "Module gradients");
        const auto count = core::read_pod<uint32_t>(is);

        zero_grad();
        for (uint32_t i = 0; i < count; ++i) {
            const auto name = core::read_string(is);
            Tensor t;
            is >> t;
            if (!has_parameter(name) || grad(name).shape != t.shape) {
                LOG_WARN("Dropped accumulated gradient of '{}'", name);
                continue;
            }
            grad(name) = std::move(t);
        }
    }

} // namespace laia::training
