#pragma once

#include <optional>
#include <string>
#include <vector>
#include "combat_state.hpp"
#include "inventory.hpp"

namespace fablecore {

/**
 * Everything derived from a session's timeline: the active encounter,
 * concluded encounters and the inventory.
 *
 * Never persisted as ground truth; always rebuilt by replaying events.
 */
struct SessionState {
    std::string session_id;
    std::optional<CombatState> combat;
    std::vector<CombatState> archived_combats;
    InventoryState inventory;

    bool in_combat() const { return combat.has_value(); }

    static SessionState replay(const std::string& session_id,
                               const std::vector<v1::TimelineEvent>& events);

    static void apply_event(SessionState& state, const v1::TimelineEvent& event);
};

} // namespace fablecore
