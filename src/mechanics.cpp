#include "fablecore/mechanics.hpp"
#include "fablecore/errors.hpp"
#include "fablecore/event_renderer.hpp"
#include "fablecore/helpers.hpp"
#include "fablecore/inventory.hpp"
#include "fablecore/logging.hpp"
#include "fablecore/validation.hpp"
#include <deque>
#include <sstream>

namespace fablecore {

Mechanics::Mechanics(DiceRoller& dice) : dice_(dice) {}

CombatResult Mechanics::run_combat_action(Session& session, const std::string& action,
                                          const Session::Producer& produce) {
    CombatResult result;
    result.events = session.execute(produce);

    SessionState state = session.state();
    if (state.combat) {
        result.combat_state = state.combat;
    } else if (!state.archived_combats.empty()) {
        result.combat_state = state.archived_combats.back();
    }

    nlohmann::json fields = {
        {"session_id", session.id()},
        {"action", action},
        {"events", result.events.size()}
    };
    if (result.combat_state) {
        fields["combat_id"] = result.combat_state->combat_id;
        fields["round"] = result.combat_state->round_number;
        if (result.combat_state->is_concluded()) {
            fields["outcome"] = EventRenderer::render_outcome(result.combat_state->outcome);
        }
    }
    log_info("mechanics", "combat_action", fields);
    return result;
}

CombatResult Mechanics::begin_combat(Session& session, const std::vector<v1::Combatant>& roster) {
    return run_combat_action(session, "begin_combat", [&](const SessionState& state) {
        std::string combat_id = session.id() + "-combat-" +
                                std::to_string(state.archived_combats.size() + 1);
        return CombatEngine::handle_begin(state.combat, combat_id, roster);
    });
}

CombatResult Mechanics::perform_attack(Session& session, const std::string& actor_id,
                                       const std::string& target_id, const v1::Weapon& weapon,
                                       const AttackOptions& options) {
    return run_combat_action(session, "attack", [&](const SessionState& state) {
        return CombatEngine::handle_attack(state.combat, actor_id, target_id, weapon, dice_, options);
    });
}

CombatResult Mechanics::apply_direct_damage(Session& session, const std::string& target_id, int amount,
                                            const std::string& source) {
    return run_combat_action(session, "direct_damage", [&](const SessionState& state) {
        return CombatEngine::handle_direct_damage(state.combat, target_id, amount, source);
    });
}

CombatResult Mechanics::end_combat(Session& session, const std::string& reason) {
    return run_combat_action(session, "end_combat", [&](const SessionState& state) {
        return CombatEngine::handle_end_combat(state.combat, reason);
    });
}

CombatResult Mechanics::flee(Session& session, const std::string& actor_id) {
    return run_combat_action(session, "flee", [&](const SessionState& state) {
        return CombatEngine::handle_flee(state.combat, actor_id);
    });
}

CombatResult Mechanics::end_turn(Session& session, const std::string& actor_id) {
    return run_combat_action(session, "end_turn", [&](const SessionState& state) {
        return CombatEngine::handle_end_turn(state.combat, actor_id);
    });
}

SkillCheckOutcome Mechanics::perform_skill_check(Session& session, const SkillCheckRequest& request) {
    SkillCheckOutcome outcome;
    auto events = session.execute([&](const SessionState&) {
        outcome.result = SkillCheckResolver::resolve(request, dice_);
        auto event = helpers::make_event(v1::SKILL_CHECK,
                                         SkillCheckResolver::to_event(request, outcome.result));
        event.set_display_icon(outcome.result.success ? "✅" : "❌");
        return std::vector<v1::TimelineEvent>{event};
    });
    outcome.event = events.front();

    log_info("mechanics", "skill_check", {
        {"session_id", session.id()},
        {"skill", request.skill_name.empty() ? request.stat_name : request.skill_name},
        {"target", outcome.result.target},
        {"roll", outcome.result.roll},
        {"success", outcome.result.success},
        {"sequence", outcome.event.sequence()}
    });
    return outcome;
}

std::vector<v1::TimelineEvent> Mechanics::apply_inventory_delta(Session& session, const std::string& item_id,
                                                                int64_t quantity_delta, int64_t currency_delta) {
    auto events = session.execute([&](const SessionState& state) {
        return InventoryLogic::handle_delta(state.inventory, item_id, quantity_delta, currency_delta);
    });

    log_info("mechanics", "inventory_delta", {
        {"session_id", session.id()},
        {"item_id", item_id},
        {"quantity_delta", quantity_delta},
        {"currency_delta", currency_delta},
        {"events", events.size()}
    });
    return events;
}

v1::TimelineEvent Mechanics::offer_choices(Session& session, const std::vector<v1::Choice>& choices) {
    if (choices.empty()) {
        throw ValidationError("At least one choice is required");
    }
    v1::ChoicesOffered offered;
    for (const auto& choice : choices) {
        validation::require_not_empty(choice.label(), "choice label");
        if (!choice.skill_check().empty()) {
            v1::Choice copy = choice;
            if (copy.difficulty() == v1::DIFFICULTY_UNSPECIFIED) {
                copy.set_difficulty(v1::NORMAL);
            }
            SkillCheckResolver::difficulty_offset(copy.difficulty());
            *offered.add_choices() = copy;
        } else {
            *offered.add_choices() = choice;
        }
    }

    auto events = session.commit({helpers::make_event(v1::CHOICE_OFFERED, offered)});
    log_info("mechanics", "choices_offered", {
        {"session_id", session.id()},
        {"choices", choices.size()},
        {"sequence", events.front().sequence()}
    });
    return events.front();
}

v1::TimelineEvent Mechanics::record_user_input(Session& session, const std::string& text) {
    validation::require_not_empty(text, "player input");
    v1::UserInput input;
    input.set_text(text);
    return session.commit({helpers::make_event(v1::USER_INPUT, input)}).front();
}

v1::TimelineEvent Mechanics::record_system_log(Session& session, const std::string& message,
                                               const std::string& source) {
    validation::require_not_empty(message, "system log message");
    v1::SystemLog log;
    log.set_message(message);
    log.set_source(source);
    auto event = session.commit({helpers::make_event(v1::SYSTEM_LOG, log)}).front();

    log_info("mechanics", "system_log", {
        {"session_id", session.id()},
        {"source", source},
        {"sequence", event.sequence()}
    });
    return event;
}

v1::TimelineEvent Mechanics::record_narrative(Session& session, const std::string& text) {
    v1::NarrativeChunk chunk;
    chunk.set_text(text);
    return session.commit({helpers::make_event(v1::NARRATIVE_CHUNK, chunk)}).front();
}

CombatSummary Mechanics::combat_summary(const Session& session) const {
    SessionState state = session.state();

    const CombatState* combat = nullptr;
    if (state.combat) {
        combat = &*state.combat;
    } else if (!state.archived_combats.empty()) {
        combat = &state.archived_combats.back();
    }
    if (!combat) {
        throw NotFoundError("Session " + session.id() + " has no combat");
    }

    CombatSummary summary;
    summary.combat_id = combat->combat_id;
    summary.round_number = combat->round_number;
    if (const Combatant* active = combat->active_combatant(); active && !combat->is_concluded()) {
        summary.active_combatant = active->display_name;
    }
    for (const auto& id : combat->turn_order) {
        const Combatant* c = combat->get(id);
        if (!c) continue;
        std::stringstream ss;
        ss << c->display_name << " HP " << c->current_hp << "/" << c->max_hp;
        if (c->status == v1::DOWN) ss << " (down)";
        if (c->status == v1::FLED) ss << " (fled)";
        summary.combatant_lines.push_back(ss.str());
    }

    // Walk the log from this encounter's start and keep the newest lines.
    EventRenderer renderer;
    std::deque<std::string> recent;
    bool in_encounter = false;
    for (const auto& event : session.read()) {
        bool combat_kind = event.kind() == v1::COMBAT_TURN ||
                           event.kind() == v1::COMBAT_ATTACK ||
                           event.kind() == v1::COMBAT_DAMAGE;
        if (!combat_kind) continue;

        if (event.kind() == v1::COMBAT_TURN && helpers::holds<v1::CombatStarted>(event)) {
            in_encounter = helpers::unpack<v1::CombatStarted>(event).combat_id() == combat->combat_id;
            recent.clear();
        }
        if (!in_encounter) continue;

        renderer.learn(event);
        recent.push_back(std::string(event.display_icon()) + " " + renderer.render(event));
        if (recent.size() > kSummaryLogLines) {
            recent.pop_front();
        }
    }
    summary.recent_log.assign(recent.begin(), recent.end());
    return summary;
}

} // namespace fablecore
