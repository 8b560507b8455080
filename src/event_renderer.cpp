#include "fablecore/event_renderer.hpp"
#include <sstream>

namespace fablecore {

void EventRenderer::set_combatant_name(const std::string& combatant_id, const std::string& name) {
    combatant_names_[combatant_id] = name;
}

std::string EventRenderer::combatant_name(const std::string& combatant_id) const {
    auto it = combatant_names_.find(combatant_id);
    if (it != combatant_names_.end()) {
        return it->second;
    }
    return combatant_id;
}

void EventRenderer::learn(const v1::TimelineEvent& event) {
    if (event.kind() != v1::COMBAT_TURN) return;

    v1::CombatStarted started;
    if (event.payload().UnpackTo(&started)) {
        for (const auto& combatant : started.combatants()) {
            set_combatant_name(combatant.id(), combatant.display_name());
        }
    }
}

const char* EventRenderer::icon_for(v1::EventKind kind) {
    switch (kind) {
        case v1::USER_INPUT: return "👤";
        case v1::SYSTEM_LOG: return "⚙️";
        case v1::NARRATIVE_CHUNK: return "📜";
        case v1::SKILL_CHECK: return "🎲";
        case v1::COMBAT_ATTACK: return "⚔️";
        case v1::COMBAT_DAMAGE: return "🩸";
        case v1::COMBAT_TURN: return "⏳";
        case v1::ITEM_ADDED: return "🎒";
        case v1::ITEM_REMOVED: return "📤";
        case v1::CURRENCY_CHANGE: return "💰";
        case v1::CHOICE_OFFERED: return "🤔";
        case v1::EVENT_KIND_UNSPECIFIED:
        default: return "";
    }
}

const char* EventRenderer::kind_name(v1::EventKind kind) {
    switch (kind) {
        case v1::USER_INPUT: return "user-input";
        case v1::SYSTEM_LOG: return "system-log";
        case v1::NARRATIVE_CHUNK: return "narrative-chunk";
        case v1::SKILL_CHECK: return "skill-check";
        case v1::COMBAT_ATTACK: return "combat-attack";
        case v1::COMBAT_DAMAGE: return "combat-damage";
        case v1::COMBAT_TURN: return "combat-turn";
        case v1::ITEM_ADDED: return "item-added";
        case v1::ITEM_REMOVED: return "item-removed";
        case v1::CURRENCY_CHANGE: return "currency-change";
        case v1::CHOICE_OFFERED: return "choice-offered";
        case v1::EVENT_KIND_UNSPECIFIED:
        default: return "unknown";
    }
}

std::string EventRenderer::render_difficulty(v1::Difficulty difficulty) {
    switch (difficulty) {
        case v1::FAVORABLE: return "favorable";
        case v1::NORMAL: return "normal";
        case v1::UNFAVORABLE: return "unfavorable";
        default: return "unknown";
    }
}

std::string EventRenderer::render_outcome(v1::CombatOutcome outcome) {
    switch (outcome) {
        case v1::OUTCOME_VICTORY: return "victory";
        case v1::OUTCOME_DEFEAT: return "defeat";
        case v1::OUTCOME_FLED: return "fled";
        case v1::OUTCOME_ENDED: return "ended";
        default: return "unknown";
    }
}

std::string EventRenderer::preview(const std::string& text, std::size_t max_chars) {
    if (text.size() <= max_chars) {
        return text;
    }
    // Do not cut through a UTF-8 sequence.
    std::size_t cut = max_chars;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "...";
}

std::string EventRenderer::render(const v1::TimelineEvent& event) const {
    const auto& payload = event.payload();

    switch (event.kind()) {
        case v1::USER_INPUT: {
            v1::UserInput input;
            payload.UnpackTo(&input);
            return input.text();
        }
        case v1::SYSTEM_LOG: {
            v1::SystemLog log;
            payload.UnpackTo(&log);
            return log.message();
        }
        case v1::NARRATIVE_CHUNK: {
            v1::NarrativeChunk chunk;
            payload.UnpackTo(&chunk);
            return chunk.text();
        }
        case v1::SKILL_CHECK: {
            v1::SkillCheckRecorded check;
            payload.UnpackTo(&check);
            return render_skill_check(check);
        }
        case v1::COMBAT_ATTACK: {
            v1::AttackResolved attack;
            payload.UnpackTo(&attack);
            return render_attack(attack);
        }
        case v1::COMBAT_DAMAGE: {
            v1::DamageApplied damage;
            payload.UnpackTo(&damage);
            return render_damage(damage);
        }
        case v1::COMBAT_TURN:
            return render_combat_turn(event);
        case v1::ITEM_ADDED: {
            v1::ItemAdded added;
            payload.UnpackTo(&added);
            return render_item_added(added);
        }
        case v1::ITEM_REMOVED: {
            v1::ItemRemoved removed;
            payload.UnpackTo(&removed);
            return render_item_removed(removed);
        }
        case v1::CURRENCY_CHANGE: {
            v1::CurrencyChanged changed;
            payload.UnpackTo(&changed);
            return render_currency_changed(changed);
        }
        case v1::CHOICE_OFFERED: {
            v1::ChoicesOffered offered;
            payload.UnpackTo(&offered);
            return render_choices(offered);
        }
        case v1::EVENT_KIND_UNSPECIFIED:
        default:
            return "";
    }
}

std::string EventRenderer::render_combat_turn(const v1::TimelineEvent& event) const {
    const auto& payload = event.payload();

    v1::CombatStarted started;
    if (payload.UnpackTo(&started)) return render_combat_started(started);
    v1::TurnAdvanced advanced;
    if (payload.UnpackTo(&advanced)) return render_turn_advanced(advanced);
    v1::CombatantFled fled;
    if (payload.UnpackTo(&fled)) return render_fled(fled);
    v1::CombatConcluded concluded;
    if (payload.UnpackTo(&concluded)) return render_concluded(concluded);
    return "";
}

std::string EventRenderer::render_skill_check(const v1::SkillCheckRecorded& payload) const {
    std::stringstream ss;
    ss << "Skill check";
    if (!payload.skill_name().empty()) {
        ss << " '" << payload.skill_name() << "'";
    } else if (!payload.stat_name().empty()) {
        ss << " '" << payload.stat_name() << "'";
    }
    ss << " (" << render_difficulty(payload.difficulty()) << "): "
       << (payload.success() ? "SUCCESS" : "FAILURE")
       << " (Roll: " << payload.roll() << " vs " << payload.target() << ")";
    return ss.str();
}

std::string EventRenderer::render_combat_started(const v1::CombatStarted& payload) const {
    std::stringstream ss;
    ss << "Combat started. Turn order:";
    bool first = true;
    for (const auto& id : payload.turn_order()) {
        ss << (first ? " " : ", ");
        first = false;
        bool listed = false;
        for (const auto& combatant : payload.combatants()) {
            if (combatant.id() == id) {
                ss << combatant.display_name() << " (" << combatant.initiative_score() << ")";
                listed = true;
                break;
            }
        }
        if (!listed) ss << combatant_name(id);
    }
    return ss.str();
}

std::string EventRenderer::render_attack(const v1::AttackResolved& payload) const {
    std::stringstream ss;
    if (payload.critical()) {
        ss << "Critical Hit! ";
    } else if (payload.hit()) {
        ss << "Hit! ";
    } else {
        ss << "Miss! ";
    }
    ss << combatant_name(payload.attacker_id()) << " attacks "
       << combatant_name(payload.target_id()) << " with " << payload.weapon().name()
       << " (Roll: " << payload.natural_roll() << "+" << payload.modifier()
       << " = " << payload.total() << " vs AC " << payload.target_armor_class();
    if (payload.advantage()) {
        ss << ", advantage over " << payload.discarded_roll();
    }
    ss << ")";
    return ss.str();
}

std::string EventRenderer::render_damage(const v1::DamageApplied& payload) const {
    std::stringstream ss;
    ss << combatant_name(payload.target_id()) << " took " << payload.amount() << " damage";
    if (!payload.source().empty()) {
        ss << " from " << payload.source();
    }
    ss << ". HP: " << payload.hp_before() << " -> " << payload.hp_after();
    if (payload.status_after() == v1::DOWN) {
        ss << ". " << combatant_name(payload.target_id()) << " has been defeated!";
    }
    return ss.str();
}

std::string EventRenderer::render_turn_advanced(const v1::TurnAdvanced& payload) const {
    std::stringstream ss;
    if (payload.new_round()) {
        ss << "Round " << payload.round_number() << " started. ";
    }
    ss << "It is now " << combatant_name(payload.active_combatant_id()) << "'s turn.";
    return ss.str();
}

std::string EventRenderer::render_fled(const v1::CombatantFled& payload) const {
    return combatant_name(payload.combatant_id()) + " fled the fight.";
}

std::string EventRenderer::render_concluded(const v1::CombatConcluded& payload) const {
    std::stringstream ss;
    ss << "Combat ended: " << render_outcome(payload.outcome());
    if (!payload.reason().empty()) {
        ss << " (" << payload.reason() << ")";
    }
    ss << " after " << payload.round_number() << " round"
       << (payload.round_number() == 1 ? "" : "s") << ".";
    return ss.str();
}

std::string EventRenderer::render_item_added(const v1::ItemAdded& payload) const {
    std::stringstream ss;
    ss << "Gained " << payload.quantity() << " x " << payload.item_id()
       << " (now " << payload.new_quantity() << ")";
    return ss.str();
}

std::string EventRenderer::render_item_removed(const v1::ItemRemoved& payload) const {
    std::stringstream ss;
    ss << "Lost " << payload.quantity() << " x " << payload.item_id()
       << " (now " << payload.new_quantity() << ")";
    return ss.str();
}

std::string EventRenderer::render_currency_changed(const v1::CurrencyChanged& payload) const {
    std::stringstream ss;
    ss << (payload.delta() >= 0 ? "Received " : "Spent ")
       << (payload.delta() >= 0 ? payload.delta() : -payload.delta())
       << " coins (balance: " << payload.new_balance() << ")";
    return ss.str();
}

std::string EventRenderer::render_choices(const v1::ChoicesOffered& payload) const {
    std::stringstream ss;
    ss << "Choices:";
    int index = 1;
    for (const auto& choice : payload.choices()) {
        ss << " [" << index++ << "] " << choice.label();
    }
    return ss.str();
}

} // namespace fablecore
