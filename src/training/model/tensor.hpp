/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/binary_io.hpp"

#include <cstdint>
#include <functional>
#include <istream>
#include <numeric>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace laia::training {

    // Dense CPU float tensor: shape plus contiguous row-major storage
    struct Tensor {
        std::vector<size_t> shape;
        std::vector<float> data;

        static Tensor zeros(std::vector<size_t> shape) {
            Tensor t;
            t.shape = std::move(shape);
            t.data.assign(numel_of(t.shape), 0.0f);
            return t;
        }

        static size_t numel_of(const std::vector<size_t>& shape) {
            return std::accumulate(shape.begin(), shape.end(), size_t{1}, std::multiplies<>());
        }

        [[nodiscard]] size_t numel() const { return data.size(); }

        void fill(float value) { std::fill(data.begin(), data.end(), value); }

        [[nodiscard]] std::string shape_str() const {
            std::string s = "[";
            for (size_t i = 0; i < shape.size(); ++i) {
                if (i > 0) s += ", ";
                s += std::to_string(shape[i]);
            }
            return s + "]";
        }
    };

    constexpr uint32_t TENSOR_MAGIC = 0x4C415453; // "LATS"
    constexpr uint32_t TENSOR_VERSION = 1;

    inline std::ostream& operator<<(std::ostream& os, const Tensor& tensor) {
        core::write_pod(os, TENSOR_MAGIC);
        core::write_pod(os, TENSOR_VERSION);
        core::write_pod(os, static_cast<uint16_t>(tensor.shape.size()));
        core::write_pod(os, static_cast<uint64_t>(tensor.numel()));
        for (const size_t dim : tensor.shape) {
            core::write_pod(os, static_cast<uint64_t>(dim));
        }
        os.write(reinterpret_cast<const char*>(tensor.data.data()),
                 static_cast<std::streamsize>(tensor.data.size() * sizeof(float)));
        if (!os) {
            throw std::runtime_error("Failed to write tensor");
        }
        return os;
    }

    inline std::istream& operator>>(std::istream& is, Tensor& tensor) {
        core::expect_header(is, TENSOR_MAGIC, TENSOR_VERSION, "tensor");
        const auto rank = core::read_pod<uint16_t>(is);
        const auto numel = core::read_pod<uint64_t>(is);

        std::vector<size_t> dims(rank);
        for (uint16_t i = 0; i < rank; ++i) {
            dims[i] = static_cast<size_t>(core::read_pod<uint64_t>(is));
        }
        if (Tensor::numel_of(dims) != numel) {
            throw std::runtime_error("Shape elements mismatch");
        }

        Tensor t;
        t.shape = std::move(dims);
        t.data.resize(static_cast<size_t>(numel));
        is.read(reinterpret_cast<char*>(t.data.data()), static_cast<std::streamsize>(numel * sizeof(float)));
        if (!is) {
            throw std::runtime_error("Failed to read tensor");
        }
        tensor = std::move(t);
        return is;
    }

} // namespace laia::training
