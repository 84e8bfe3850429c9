/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "optimizer/sgd.hpp"
#include "core/logger.hpp"

namespace laia::training {

    namespace {
        constexpr uint32_t SGD_MAGIC = 0x4C415347; // "LASG"
        constexpr uint32_t SGD_VERSION = 1;
    } // namespace

    Sgd::Sgd(Module& module, SgdConfig config)
        : module_(module),
          config_(config) {
        if (config_.lr <= 0.0) {
            throw std::invalid_argument("Learning rate must be positive");
        }
        if (config_.momentum < 0.0 || config_.momentum >= 1.0) {
            throw std::invalid_argument("Momentum must be in [0, 1)");
        }
    }

    void Sgd::zero_grad() {
        module_.zero_grad();
    }

    void Sgd::step() {
        for (const auto& name : module_.parameter_names()) {
            auto& param = module_.parameter(name).data;
            const auto& grad = module_.grad(name).data;

            if (config_.momentum > 0.0) {
                auto [it, inserted] = velocity_.try_emplace(name, Tensor::zeros(module_.parameter(name).shape));
                auto& v = it->second.data;
                for (size_t i = 0; i < param.size(); ++i) {
                    const float g = grad[i] + static_cast<float>(config_.weight_decay) * param[i];
                    v[i] = static_cast<float>(config_.momentum) * v[i] + g;
                    param[i] -= static_cast<float>(config_.lr) * v[i];
                }
            } else {
                for (size_t i = 0; i < param.size(); ++i) {
                    const float g = grad[i] + static_cast<float>(config_.weight_decay) * param[i];
                    param[i] -= static_cast<float>(config_.lr) * g;
                }
            }
        }
        ++step_count_;
    }

    void Sgd::serialize(std::ostream& os) const {
        core::write_pod(os, SGD_MAGIC);
        core::write_pod(os, SGD_VERSION);
        core::write_pod(os, config_.lr);
        core::write_pod(os, config_.momentum);
        core::write_pod(os, config_.weight_decay);
        core::write_pod(os, step_count_);
        core::write_pod(os, static_cast<uint32_t>(velocity_.size()));
        for (const auto& [name, v] : velocity_) {
            core::write_string(os, name);
            os << v;
        }
        LOG_DEBUG("Serialized Sgd: lr={}, step={}, {} momentum buffers", config_.lr, step_count_, velocity_.size());
    }

    void Sgd::deserialize(std::istream& is) {
        core::expect_header(is, SGD_MAGIC, SGD_VERSION, "Sgd");
        config_.lr = core::read_pod<double>(is);
        config_.momentum = core::read_pod<double>(is);
        config_.weight_decay = core::read_pod<double>(is);
        step_count_ = core::read_pod<uint64_t>(is);

        velocity_.clear();
        const auto count = core::read_pod<uint32_t>(is);
        for (uint32_t i = 0; i < count; ++i) {
            auto name = core::read_string(is);
            Tensor v;
            is >> v;
            if (!module_.has_parameter(name)) {
                LOG_WARN("Dropped momentum buffer '{}': no such parameter", name);
                continue;
            }
            if (module_.parameter(name).shape != v.shape) {
                LOG_WARN("Dropped momentum buffer '{}': shape {} vs parameter shape {}",
                         name, v.shape_str(), module_.parameter(name).shape_str());
                continue;
            }
            velocity_.emplace(std::move(name), std::move(v));
        }
        LOG_DEBUG("Deserialized Sgd: lr={}, step={}", config_.lr, step_count_);
    }

} // namespace laia::training
