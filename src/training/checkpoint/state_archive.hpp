/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace laia::training {

    /**
     * @brief Resumable state as an ordered list of named binary sections.
     *
     * Each component serializes itself into its own section, so a record can be
     * partially consumed (a model-only load reads just "model").
     */
    class StateArchive {
    public:
        uint64_t epoch = 0;
        uint64_t iteration = 0;

        // Replaces an existing section of the same name
        void put(const std::string& name, std::string blob) {
            const auto it = find(name);
            if (it != sections_.end()) {
                it->second = std::move(blob);
            } else {
                sections_.emplace_back(name, std::move(blob));
            }
        }

        template <typename Fn>
        void write(const std::string& name, Fn&& fn) {
            std::ostringstream os(std::ios::binary);
            fn(os);
            put(name, os.str());
        }

        template <typename Fn>
        void read(const std::string& name, Fn&& fn) const {
            std::istringstream is(get(name), std::ios::binary);
            fn(is);
        }

        [[nodiscard]] bool contains(const std::string& name) const {
            return find(name) != sections_.end();
        }

        [[nodiscard]] const std::string& get(const std::string& name) const {
            const auto it = find(name);
            if (it == sections_.end()) {
                throw std::out_of_range("Missing state section: " + name);
            }
            return it->second;
        }

        [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& sections() const { return sections_; }

        bool operator==(const StateArchive&) const = default;

    private:
        std::vector<std::pair<std::string, std::string>>::iterator find(const std::string& name) {
            return std::find_if(sections_.begin(), sections_.end(),
                                [&](const auto& s) { return s.first == name; });
        }
        std::vector<std::pair<std::string, std::string>>::const_iterator find(const std::string& name) const {
            return std::find_if(sections_.begin(), sections_.end(),
                                [&](const auto& s) { return s.first == name; });
        }

        std::vector<std::pair<std::string, std::string>> sections_;
    };

} // namespace laia::training
