#include "fablecore/action_intent_resolver.hpp"
#include "fablecore/errors.hpp"

namespace fablecore {

void ActionIntentResolver::resolve(const v1::PlayerInput& input, Session& session, Mechanics& mechanics) {
    for (const auto& action : input.actions()) {
        execute(action, session, mechanics);
    }
}

void ActionIntentResolver::execute(const v1::Action& action, Session& session, Mechanics& mechanics) {
    switch (action.action_case()) {
        case v1::Action::kBeginCombat: {
            const auto& roster = action.begin_combat().roster();
            mechanics.begin_combat(session, std::vector<v1::Combatant>(roster.begin(), roster.end()));
            break;
        }
        case v1::Action::kAttack: {
            const auto& attack = action.attack();
            AttackOptions options;
            options.situational_modifier = attack.attack_modifier();
            options.advantage = attack.advantage();
            mechanics.perform_attack(session, attack.actor_id(), attack.target_id(), attack.weapon(), options);
            break;
        }
        case v1::Action::kSkillCheck:
            mechanics.perform_skill_check(session, SkillCheckRequest::from_proto(action.skill_check()));
            break;
        case v1::Action::kInventory: {
            const auto& delta = action.inventory();
            mechanics.apply_inventory_delta(session, delta.item_id(), delta.quantity_delta(),
                                            delta.currency_delta());
            break;
        }
        case v1::Action::kFlee:
            mechanics.flee(session, action.flee().actor_id());
            break;
        case v1::Action::kEndTurn:
            mechanics.end_turn(session, action.end_turn().actor_id());
            break;
        case v1::Action::kDirectDamage: {
            const auto& damage = action.direct_damage();
            mechanics.apply_direct_damage(session, damage.target_id(), damage.amount(), damage.source());
            break;
        }
        case v1::Action::kEndCombat:
            mechanics.end_combat(session, action.end_combat().reason());
            break;
        case v1::Action::ACTION_NOT_SET:
            throw ValidationError("Action has no content");
    }
}

} // namespace fablecore
