#include "fablecore/combat_state.hpp"

namespace fablecore {

Combatant Combatant::from_proto(const v1::Combatant& proto) {
    Combatant c;
    c.id = proto.id();
    c.display_name = proto.display_name().empty() ? proto.id() : proto.display_name();
    c.side = proto.side();
    c.current_hp = proto.current_hp();
    c.max_hp = proto.max_hp();
    c.current_mp = proto.current_mp();
    c.max_mp = proto.max_mp();
    c.armor_class = proto.armor_class();
    c.attack_bonus = proto.attack_bonus();
    c.strength_modifier = proto.strength_modifier();
    c.dexterity_modifier = proto.dexterity_modifier();
    c.wisdom_modifier = proto.wisdom_modifier();
    c.initiative_score = proto.initiative_score();
    c.status = proto.status() == v1::COMBATANT_STATUS_UNSPECIFIED ? v1::ALIVE : proto.status();
    return c;
}

v1::Combatant Combatant::to_proto() const {
    v1::Combatant proto;
    proto.set_id(id);
    proto.set_display_name(display_name);
    proto.set_side(side);
    proto.set_current_hp(current_hp);
    proto.set_max_hp(max_hp);
    proto.set_current_mp(current_mp);
    proto.set_max_mp(max_mp);
    proto.set_armor_class(armor_class);
    proto.set_attack_bonus(attack_bonus);
    proto.set_strength_modifier(strength_modifier);
    proto.set_dexterity_modifier(dexterity_modifier);
    proto.set_wisdom_modifier(wisdom_modifier);
    proto.set_initiative_score(initiative_score);
    proto.set_status(status);
    return proto;
}

const Combatant* CombatState::get(const std::string& combatant_id) const {
    auto it = combatants.find(combatant_id);
    return it != combatants.end() ? &it->second : nullptr;
}

Combatant* CombatState::get_mut(const std::string& combatant_id) {
    auto it = combatants.find(combatant_id);
    return it != combatants.end() ? &it->second : nullptr;
}

const Combatant* CombatState::active_combatant() const {
    if (active_index < 0 || active_index >= static_cast<int>(turn_order.size())) {
        return nullptr;
    }
    return get(turn_order[active_index]);
}

bool CombatState::side_has_alive(bool player_side) const {
    for (const auto& [id, combatant] : combatants) {
        if (combatant.is_player_side() == player_side && combatant.is_alive()) {
            return true;
        }
    }
    return false;
}

bool CombatState::player_side_fled() const {
    for (const auto& [id, combatant] : combatants) {
        if (combatant.is_player_side() && combatant.status == v1::FLED) {
            return true;
        }
    }
    return false;
}

v1::CombatSnapshot CombatState::to_snapshot() const {
    v1::CombatSnapshot snapshot;
    snapshot.set_combat_id(combat_id);
    snapshot.set_session_id(session_id);
    snapshot.set_round_number(round_number);
    for (const auto& id : turn_order) {
        snapshot.add_turn_order(id);
        if (const Combatant* c = get(id)) {
            *snapshot.add_combatants() = c->to_proto();
        }
    }
    snapshot.set_active_index(active_index);
    snapshot.set_phase(phase);
    snapshot.set_outcome(outcome);
    return snapshot;
}

void CombatState::apply_event(CombatState& state, const v1::TimelineEvent& event) {
    const auto& payload = event.payload();

    switch (event.kind()) {
        case v1::COMBAT_TURN: {
            if (payload.Is<v1::CombatStarted>()) {
                v1::CombatStarted started;
                payload.UnpackTo(&started);
                std::string session_id = state.session_id;
                state = CombatState{};
                state.session_id = session_id;
                state.combat_id = started.combat_id();
                for (const auto& proto : started.combatants()) {
                    state.combatants[proto.id()] = Combatant::from_proto(proto);
                }
                state.turn_order.assign(started.turn_order().begin(), started.turn_order().end());
                state.round_number = 1;
                state.active_index = 0;
                for (int i = 0; i < static_cast<int>(state.turn_order.size()); ++i) {
                    const Combatant* c = state.get(state.turn_order[i]);
                    if (c && c->is_alive()) {
                        state.active_index = i;
                        break;
                    }
                }
                state.phase = v1::AWAITING_ACTION;
            } else if (payload.Is<v1::TurnAdvanced>()) {
                v1::TurnAdvanced advanced;
                payload.UnpackTo(&advanced);
                state.round_number = advanced.round_number();
                state.active_index = advanced.active_index();
                state.phase = v1::AWAITING_ACTION;
            } else if (payload.Is<v1::CombatantFled>()) {
                v1::CombatantFled fled;
                payload.UnpackTo(&fled);
                if (Combatant* c = state.get_mut(fled.combatant_id())) {
                    c->status = v1::FLED;
                }
            } else if (payload.Is<v1::CombatConcluded>()) {
                v1::CombatConcluded concluded;
                payload.UnpackTo(&concluded);
                state.outcome = concluded.outcome();
                state.phase = v1::CONCLUDED;
            }
            break;
        }
        case v1::COMBAT_DAMAGE: {
            v1::DamageApplied damage;
            if (payload.UnpackTo(&damage)) {
                if (Combatant* c = state.get_mut(damage.target_id())) {
                    c->current_hp = damage.hp_after();
                    c->status = damage.status_after();
                }
            }
            break;
        }
        case v1::COMBAT_ATTACK:
            // Attack rolls carry no state of their own; damage follows separately.
            break;
        default:
            break;
    }
}

} // namespace fablecore
