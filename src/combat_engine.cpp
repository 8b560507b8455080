#include "fablecore/combat_engine.hpp"
#include "fablecore/errors.hpp"
#include "fablecore/helpers.hpp"
#include "fablecore/validation.hpp"
#include <algorithm>
#include <numeric>
#include <unordered_set>

namespace fablecore {

namespace {

int floor_half(int value) {
    return value >= 0 ? value / 2 : -((-value + 1) / 2);
}

} // anonymous namespace

int CombatEngine::initiative_for(const Combatant& combatant) {
    return combatant.dexterity_modifier + floor_half(combatant.wisdom_modifier);
}

std::vector<std::string> CombatEngine::compute_turn_order(const std::vector<Combatant>& roster) {
    std::vector<std::size_t> positions(roster.size());
    std::iota(positions.begin(), positions.end(), 0);

    std::stable_sort(positions.begin(), positions.end(), [&](std::size_t a, std::size_t b) {
        int init_a = initiative_for(roster[a]);
        int init_b = initiative_for(roster[b]);
        if (init_a != init_b) return init_a > init_b;
        return roster[a].dexterity_modifier > roster[b].dexterity_modifier;
    });

    std::vector<std::string> order;
    order.reserve(roster.size());
    for (std::size_t pos : positions) {
        order.push_back(roster[pos].id);
    }
    return order;
}

int CombatEngine::attack_modifier(const Combatant& attacker, v1::WeaponKind kind) {
    int ability = kind == v1::RANGED ? attacker.dexterity_modifier : attacker.strength_modifier;
    return ability + attacker.attack_bonus;
}

AttackRoll CombatEngine::resolve_attack_roll(int natural, int modifier, int armor_class) {
    AttackRoll roll;
    roll.natural = natural;
    roll.modifier = modifier;
    roll.total = natural + modifier;

    if (natural == kCriticalRoll) {
        roll.hit = true;
        roll.critical = true;
    } else if (natural == kFumbleRoll) {
        roll.hit = false;
    } else {
        roll.hit = roll.total >= armor_class;
    }
    return roll;
}

int CombatEngine::compute_damage(const Combatant& attacker, const v1::Weapon& weapon, bool critical) {
    int damage = weapon.base_damage();
    if (weapon.kind() != v1::RANGED) {
        damage += attacker.strength_modifier;
    }
    damage = std::max(1, damage);
    return critical ? damage * 2 : damage;
}

// ============================================================================
// Guards
// ============================================================================

const CombatState& CombatEngine::require_active(const std::optional<CombatState>& current) {
    validation::require_state(current && current->exists(), "No combat in progress");
    validation::require_state(!current->is_concluded(),
                              "Combat " + current->combat_id + " has already concluded");
    validation::require_state(current->phase == v1::AWAITING_ACTION,
                              "Combat " + current->combat_id + " is not awaiting an action");
    return *current;
}

const Combatant& CombatEngine::require_turn(const CombatState& state, const std::string& actor_id) {
    validation::require_not_empty(actor_id, "actor_id");

    const Combatant* actor = state.get(actor_id);
    if (!actor) {
        throw NotFoundError("Combatant " + actor_id + " is not part of this combat");
    }
    const Combatant* active = state.active_combatant();
    if (!active || active->id != actor_id) {
        throw StateConflictError("It is not " + actor->display_name + "'s turn");
    }
    if (!actor->is_alive()) {
        throw StateConflictError(actor->display_name + " cannot act");
    }
    return *actor;
}

void CombatEngine::validate_roster(const std::vector<v1::Combatant>& roster) {
    if (roster.empty()) {
        throw ValidationError("Combat roster must not be empty");
    }

    std::unordered_set<std::string> ids;
    bool player_side_standing = false;
    bool enemy_side_standing = false;

    for (const auto& c : roster) {
        validation::require_not_empty(c.id(), "combatant id");
        if (!ids.insert(c.id()).second) {
            throw ValidationError("Duplicate combatant id " + c.id());
        }
        if (c.side() != v1::PLAYER && c.side() != v1::ALLY && c.side() != v1::ENEMY) {
            throw ValidationError("Combatant " + c.id() + " has no side");
        }
        validation::require_positive(c.max_hp(), c.id() + " max_hp");
        validation::require_non_negative(c.current_hp(), c.id() + " current_hp");
        if (c.current_hp() > c.max_hp()) {
            throw ValidationError(c.id() + " current_hp exceeds max_hp");
        }
        validation::require_non_negative(c.max_mp(), c.id() + " max_mp");
        validation::require_non_negative(c.current_mp(), c.id() + " current_mp");
        if (c.current_mp() > c.max_mp()) {
            throw ValidationError(c.id() + " current_mp exceeds max_mp");
        }
        validation::require_non_negative(c.armor_class(), c.id() + " armor_class");

        if (c.current_hp() > 0) {
            if (c.side() == v1::ENEMY) {
                enemy_side_standing = true;
            } else {
                player_side_standing = true;
            }
        }
    }

    if (!player_side_standing || !enemy_side_standing) {
        throw ValidationError("Combat needs at least one able combatant on each side");
    }
}

// ============================================================================
// Handlers
// ============================================================================

void CombatEngine::emit(CombatState& working, std::vector<v1::TimelineEvent>& events,
                        v1::TimelineEvent event) {
    CombatState::apply_event(working, event);
    events.push_back(std::move(event));
}

std::vector<v1::TimelineEvent> CombatEngine::handle_begin(
    const std::optional<CombatState>& current,
    const std::string& combat_id,
    const std::vector<v1::Combatant>& roster) {

    // Guard
    if (current && current->exists() && !current->is_concluded()) {
        throw StateConflictError("Combat " + current->combat_id + " is already in progress");
    }

    // Validate
    validation::require_not_empty(combat_id, "combat_id");
    validate_roster(roster);

    // Compute
    std::vector<Combatant> combatants;
    combatants.reserve(roster.size());
    for (const auto& proto : roster) {
        Combatant c = Combatant::from_proto(proto);
        c.initiative_score = initiative_for(c);
        c.status = c.current_hp > 0 ? v1::ALIVE : v1::DOWN;
        combatants.push_back(std::move(c));
    }

    v1::CombatStarted started;
    started.set_combat_id(combat_id);
    for (const auto& c : combatants) {
        *started.add_combatants() = c.to_proto();
    }
    for (const auto& id : compute_turn_order(combatants)) {
        started.add_turn_order(id);
    }

    std::vector<v1::TimelineEvent> events;
    events.push_back(helpers::make_event(v1::COMBAT_TURN, started));
    return events;
}

std::vector<v1::TimelineEvent> CombatEngine::handle_attack(
    const std::optional<CombatState>& current,
    const std::string& actor_id,
    const std::string& target_id,
    const v1::Weapon& weapon,
    DiceRoller& dice,
    const AttackOptions& options) {

    // Guard
    const CombatState& state = require_active(current);
    const Combatant& attacker = require_turn(state, actor_id);

    // Validate
    validation::require_not_empty(target_id, "target_id");
    if (target_id == actor_id) {
        throw ValidationError(attacker.display_name + " cannot attack themselves");
    }
    const Combatant* target = state.get(target_id);
    if (!target) {
        throw NotFoundError("Combatant " + target_id + " is not part of this combat");
    }
    if (!target->is_alive()) {
        throw StateConflictError(target->display_name + " is no longer in the fight");
    }
    validation::require_non_negative(weapon.base_damage(), "weapon base_damage");
    if (weapon.kind() != v1::WEAPON_KIND_UNSPECIFIED &&
        weapon.kind() != v1::MELEE && weapon.kind() != v1::RANGED) {
        throw ValidationError("Unknown weapon kind " + std::to_string(weapon.kind()));
    }

    v1::Weapon used = weapon;
    if (used.kind() == v1::WEAPON_KIND_UNSPECIFIED) {
        used.set_kind(v1::MELEE);
    }
    if (used.name().empty()) {
        used.set_name("unarmed strike");
    }

    // Compute
    CombatState working = state;
    working.phase = v1::RESOLVING_ACTION;
    std::vector<v1::TimelineEvent> events;

    int natural = dice.d20();
    int discarded = 0;
    if (options.advantage) {
        int second = dice.d20();
        discarded = std::min(natural, second);
        natural = std::max(natural, second);
    }
    AttackRoll roll = resolve_attack_roll(
        natural, attack_modifier(attacker, used.kind()) + options.situational_modifier,
        target->armor_class);

    v1::AttackResolved attack;
    attack.set_attacker_id(actor_id);
    attack.set_target_id(target_id);
    *attack.mutable_weapon() = used;
    attack.set_natural_roll(roll.natural);
    attack.set_modifier(roll.modifier);
    attack.set_total(roll.total);
    attack.set_target_armor_class(target->armor_class);
    attack.set_hit(roll.hit);
    attack.set_critical(roll.critical);
    attack.set_situational_modifier(options.situational_modifier);
    attack.set_advantage(options.advantage);
    attack.set_discarded_roll(discarded);
    emit(working, events, helpers::make_event(v1::COMBAT_ATTACK, attack));

    if (roll.hit) {
        int amount = compute_damage(attacker, used, roll.critical);
        emit(working, events, damage_event(*target, amount, roll.critical, ""));
    }

    close_action(working, events);
    return events;
}

std::vector<v1::TimelineEvent> CombatEngine::handle_direct_damage(
    const std::optional<CombatState>& current,
    const std::string& target_id,
    int amount,
    const std::string& source) {

    // Guard
    const CombatState& state = require_active(current);

    // Validate
    validation::require_not_empty(target_id, "target_id");
    validation::require_positive(amount, "damage amount");
    const Combatant* target = state.get(target_id);
    if (!target) {
        throw NotFoundError("Combatant " + target_id + " is not part of this combat");
    }
    if (!target->is_alive()) {
        throw StateConflictError(target->display_name + " is no longer in the fight");
    }

    // Compute
    CombatState working = state;
    working.phase = v1::RESOLVING_ACTION;
    std::vector<v1::TimelineEvent> events;
    emit(working, events, damage_event(*target, amount, false, source.empty() ? "effect" : source));

    if (!conclude_if_decided(working, events)) {
        const Combatant* active = working.active_combatant();
        if (!active || !active->is_alive()) {
            advance_turn(working, events);
        }
    }
    return events;
}

std::vector<v1::TimelineEvent> CombatEngine::handle_end_combat(
    const std::optional<CombatState>& current,
    const std::string& reason) {

    // Guard
    const CombatState& state = require_active(current);

    // Compute
    v1::CombatConcluded concluded;
    concluded.set_outcome(v1::OUTCOME_ENDED);
    concluded.set_round_number(state.round_number);
    concluded.set_reason(reason.empty() ? "ended" : reason);

    std::vector<v1::TimelineEvent> events;
    events.push_back(helpers::make_event(v1::COMBAT_TURN, concluded));
    return events;
}

std::vector<v1::TimelineEvent> CombatEngine::handle_flee(
    const std::optional<CombatState>& current,
    const std::string& actor_id) {

    // Guard
    const CombatState& state = require_active(current);
    require_turn(state, actor_id);

    // Compute
    CombatState working = state;
    working.phase = v1::RESOLVING_ACTION;
    std::vector<v1::TimelineEvent> events;

    v1::CombatantFled fled;
    fled.set_combatant_id(actor_id);
    emit(working, events, helpers::make_event(v1::COMBAT_TURN, fled));

    close_action(working, events);
    return events;
}

std::vector<v1::TimelineEvent> CombatEngine::handle_end_turn(
    const std::optional<CombatState>& current,
    const std::string& actor_id) {

    // Guard
    const CombatState& state = require_active(current);
    require_turn(state, actor_id);

    // Compute
    CombatState working = state;
    working.phase = v1::RESOLVING_ACTION;
    std::vector<v1::TimelineEvent> events;
    close_action(working, events);
    return events;
}

v1::TimelineEvent CombatEngine::damage_event(const Combatant& target, int amount, bool critical,
                                             const std::string& source) {
    int hp_after = std::max(0, target.current_hp - amount);

    v1::DamageApplied damage;
    damage.set_target_id(target.id);
    damage.set_amount(amount);
    damage.set_hp_before(target.current_hp);
    damage.set_hp_after(hp_after);
    damage.set_status_after(hp_after == 0 ? v1::DOWN : v1::ALIVE);
    damage.set_critical(critical);
    damage.set_source(source);
    return helpers::make_event(v1::COMBAT_DAMAGE, damage);
}

bool CombatEngine::conclude_if_decided(CombatState& working, std::vector<v1::TimelineEvent>& events) {
    v1::CombatOutcome outcome = v1::COMBAT_OUTCOME_UNSPECIFIED;
    if (!working.side_has_alive(false)) {
        outcome = v1::OUTCOME_VICTORY;
    } else if (!working.side_has_alive(true)) {
        outcome = working.player_side_fled() ? v1::OUTCOME_FLED : v1::OUTCOME_DEFEAT;
    }
    if (outcome == v1::COMBAT_OUTCOME_UNSPECIFIED) {
        return false;
    }

    v1::CombatConcluded concluded;
    concluded.set_outcome(outcome);
    concluded.set_round_number(working.round_number);
    emit(working, events, helpers::make_event(v1::COMBAT_TURN, concluded));
    return true;
}

void CombatEngine::close_action(CombatState& working, std::vector<v1::TimelineEvent>& events) {
    if (!conclude_if_decided(working, events)) {
        advance_turn(working, events);
    }
}

void CombatEngine::advance_turn(CombatState& working, std::vector<v1::TimelineEvent>& events) {
    // Both sides still have someone standing, so the scan always finds an
    // alive combatant other than the current one.
    int size = static_cast<int>(working.turn_order.size());
    int index = working.active_index;
    int round = working.round_number;
    bool new_round = false;
    for (int step = 0; step < size; ++step) {
        index = (index + 1) % size;
        if (index == 0) {
            ++round;
            new_round = true;
            working.phase = v1::ROUND_ADVANCE;
        }
        const Combatant* next = working.get(working.turn_order[index]);
        if (next && next->is_alive()) {
            break;
        }
    }

    v1::TurnAdvanced advanced;
    advanced.set_round_number(round);
    advanced.set_active_index(index);
    advanced.set_active_combatant_id(working.turn_order[index]);
    advanced.set_new_round(new_round);
    emit(working, events, helpers::make_event(v1::COMBAT_TURN, advanced));
}

} // namespace fablecore
