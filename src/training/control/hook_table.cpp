/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "control/hook_table.hpp"
#include "core/binary_io.hpp"
#include "core/logger.hpp"

#include <array>
#include <map>
#include <sstream>

namespace laia::training {

    namespace {
        constexpr uint32_t HOOK_TABLE_MAGIC = 0x4C414854; // "LAHT"
        constexpr uint32_t HOOK_TABLE_VERSION = 1;

        constexpr std::array<EngineEvent, 4> ALL_EVENTS = {
            EngineEvent::EpochStart, EngineEvent::IterStart, EngineEvent::IterEnd, EngineEvent::EpochEnd};

        std::string hook_key(const EngineEvent event, const std::size_t position, const Condition& condition) {
            return std::string(to_string(event)) + "/" + std::to_string(position) + "/" + condition.kind();
        }
    } // namespace

    HookTable::Handle HookTable::add(const EngineEvent event, Hook hook) {
        const auto id = lists_[event].add(std::move(hook));
        return Handle{.event = event, .id = id};
    }

    void HookTable::remove(const Handle& handle) {
        if (handle.id == 0) {
            return;
        }
        const auto it = lists_.find(handle.event);
        if (it == lists_.end()) {
            return;
        }
        it->second.remove(handle.id);
        if (it->second.empty()) {
            lists_.erase(it);
        }
    }

    std::size_t HookTable::fire(const EngineEvent event, const HookContext& ctx) {
        const auto it = lists_.find(event);
        if (it == lists_.end()) {
            return 0;
        }
        return it->second.fire(ctx);
    }

    std::size_t HookTable::size(const EngineEvent event) const {
        const auto it = lists_.find(event);
        return it == lists_.end() ? 0 : it->second.size();
    }

    void HookTable::clear_all() {
        lists_.clear();
    }

    void HookTable::serialize(std::ostream& os) const {
        std::vector<std::pair<std::string, std::string>> entries;
        for (const auto event : ALL_EVENTS) {
            const auto it = lists_.find(event);
            if (it == lists_.end()) {
                continue;
            }
            std::size_t position = 0;
            it->second.for_each([&](std::size_t, const Hook& hook) {
                std::ostringstream blob(std::ios::binary);
                hook.condition().serialize(blob);
                entries.emplace_back(hook_key(event, position++, hook.condition()), blob.str());
            });
        }

        core::write_pod(os, HOOK_TABLE_MAGIC);
        core::write_pod(os, HOOK_TABLE_VERSION);
        core::write_pod(os, static_cast<uint32_t>(entries.size()));
        for (const auto& [key, blob] : entries) {
            core::write_string(os, key);
            core::write_string(os, blob);
        }
    }

    void HookTable::deserialize(std::istream& is) {
        core::expect_header(is, HOOK_TABLE_MAGIC, HOOK_TABLE_VERSION, "HookTable");
        const auto count = core::read_pod<uint32_t>(is);

        std::map<std::string, std::string> saved;
        for (uint32_t i = 0; i < count; ++i) {
            auto key = core::read_string(is);
            saved.emplace(std::move(key), core::read_string(is));
        }

        for (const auto event : ALL_EVENTS) {
            const auto it = lists_.find(event);
            if (it == lists_.end()) {
                continue;
            }
            std::size_t position = 0;
            it->second.for_each([&](std::size_t, Hook& hook) {
                const auto key = hook_key(event, position++, hook.condition());
                const auto found = saved.find(key);
                if (found == saved.end()) {
                    LOG_WARN("No saved state for hook {} ({}), keeping fresh state", key, hook.condition().describe());
                    return;
                }
                std::istringstream blob(found->second, std::ios::binary);
                hook.condition().deserialize(blob);
                saved.erase(found);
            });
        }

        for (const auto& [key, blob] : saved) {
            LOG_WARN("Saved hook state {} has no registered counterpart, dropped", key);
        }
    }

} // namespace laia::training
