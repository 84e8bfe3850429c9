/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace laia::core {

    template <typename T>
    void write_pod(std::ostream& os, const T& value) {
        static_assert(std::is_trivially_copyable_v<T>);
        os.write(reinterpret_cast<const char*>(&value), sizeof(value));
    }

    template <typename T>
    T read_pod(std::istream& is) {
        static_assert(std::is_trivially_copyable_v<T>);
        T value{};
        is.read(reinterpret_cast<char*>(&value), sizeof(value));
        if (!is) {
            throw std::runtime_error("Unexpected end of stream");
        }
        return value;
    }

    inline void write_string(std::ostream& os, const std::string& s) {
        const uint32_t len = static_cast<uint32_t>(s.size());
        write_pod(os, len);
        os.write(s.data(), static_cast<std::streamsize>(len));
    }

    inline std::string read_string(std::istream& is) {
        const auto len = read_pod<uint32_t>(is);
        std::string s(len, '\0');
        is.read(s.data(), static_cast<std::streamsize>(len));
        if (!is) {
            throw std::runtime_error("Unexpected end of stream");
        }
        return s;
    }

    // Reads and checks the magic/version pair every serialized component starts with
    inline void expect_header(std::istream& is, const uint32_t magic, const uint32_t version, const char* what) {
        const auto got_magic = read_pod<uint32_t>(is);
        const auto got_version = read_pod<uint32_t>(is);
        if (got_magic != magic) {
            throw std::runtime_error(std::string("Invalid ") + what + " state: wrong magic");
        }
        if (got_version != version) {
            throw std::runtime_error(std::string("Unsupported ") + what + " state version: " +
                                     std::to_string(got_version));
        }
    }

} // namespace laia::core
