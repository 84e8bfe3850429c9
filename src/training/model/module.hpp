/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "model/tensor.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace laia::training {

    // Outcome of a parameter load: what was restored and what had to be dropped
    struct LoadReport {
        std::vector<std::string> loaded;
        std::vector<std::string> dropped; // in the checkpoint but missing or shape-mismatched in the model
        std::vector<std::string> missing; // in the model but absent from the checkpoint

        [[nodiscard]] bool complete() const { return dropped.empty() && missing.empty(); }
    };

    /**
     * @brief Owner of named parameters and their gradients.
     *
     * Parameters keep their registration order, which is also the order they are
     * serialized in. Gradients are accumulated by forward/backward code and
     * cleared by the optimizer.
     */
    class Module {
    public:
        virtual ~Module() = default;

        [[nodiscard]] const std::vector<std::string>& parameter_names() const { return names_; }
        [[nodiscard]] bool has_parameter(const std::string& name) const;

        Tensor& parameter(const std::string& name);
        const Tensor& parameter(const std::string& name) const;
        Tensor& grad(const std::string& name);
        const Tensor& grad(const std::string& name) const;

        void zero_grad();

        void serialize(std::ostream& os) const;

        /**
         * @brief Restore parameters from a serialized state.
         *
         * strict: any unknown, missing or shape-mismatched parameter is an error.
         * non-strict: such parameters are dropped (logged individually) and the
         * rest is loaded.
         */
        LoadReport deserialize(std::istream& is, bool strict = false);

        // Accumulated gradients, for checkpoints taken inside an update window.
        // Restoring drops unknown or shape-mismatched entries and zeroes the rest.
        void serialize_gradients(std::ostream& os) const;
        void deserialize_gradients(std::istream& is);

    protected:
        Tensor& register_parameter(const std::string& name, Tensor init);

    private:
        size_t index_of(const std::string& name) const;

        std::vector<std::string> names_;
        std::vector<Tensor> values_;
        std::vector<Tensor> grads_;
    };

} // namespace laia::training
