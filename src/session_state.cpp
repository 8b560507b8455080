#include "fablecore/session_state.hpp"

namespace fablecore {

SessionState SessionState::replay(const std::string& session_id,
                                  const std::vector<v1::TimelineEvent>& events) {
    SessionState state;
    state.session_id = session_id;
    for (const auto& event : events) {
        apply_event(state, event);
    }
    return state;
}

void SessionState::apply_event(SessionState& state, const v1::TimelineEvent& event) {
    switch (event.kind()) {
        case v1::COMBAT_TURN:
            if (event.payload().Is<v1::CombatStarted>()) {
                state.combat = CombatState{};
                state.combat->session_id = state.session_id;
            }
            [[fallthrough]];
        case v1::COMBAT_ATTACK:
        case v1::COMBAT_DAMAGE:
            if (state.combat) {
                CombatState::apply_event(*state.combat, event);
                if (state.combat->is_concluded()) {
                    state.archived_combats.push_back(std::move(*state.combat));
                    state.combat.reset();
                }
            }
            break;

        case v1::ITEM_ADDED:
        case v1::ITEM_REMOVED:
        case v1::CURRENCY_CHANGE:
            InventoryState::apply_event(state.inventory, event);
            break;

        case v1::USER_INPUT:
        case v1::SYSTEM_LOG:
        case v1::NARRATIVE_CHUNK:
        case v1::SKILL_CHECK:
        case v1::CHOICE_OFFERED:
        case v1::EVENT_KIND_UNSPECIFIED:
        default:
            break;
    }
}

} // namespace fablecore
