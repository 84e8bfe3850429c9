/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "control/hooks.hpp"

#include <istream>
#include <ostream>
#include <unordered_map>

namespace laia::training {

    /**
     * @brief Event table owned by an engine: maps each lifecycle event to its HookList.
     *
     * Populated at setup time; fired only by the owning engine from its control
     * thread. Hook handles are unique per table.
     */
    class HookTable {
    public:
        struct Handle {
            EngineEvent event = EngineEvent::EpochEnd;
            std::size_t id = 0;
        };

        Handle add(EngineEvent event, Hook hook);

        // No-op if not found
        void remove(const Handle& handle);

        std::size_t fire(EngineEvent event, const HookContext& ctx);

        [[nodiscard]] std::size_t size(EngineEvent event) const;

        void clear_all();

        // Condition state of every registered hook, keyed by "<event>/<position>/<kind>"
        void serialize(std::ostream& os) const;

        // Restores matching entries; entries without a registered counterpart are skipped with a warning
        void deserialize(std::istream& is);

    private:
        std::unordered_map<EngineEvent, HookList, EngineEventHash> lists_;
    };

} // namespace laia::training
