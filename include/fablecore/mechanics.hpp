#pragma once

#include <optional>
#include <string>
#include <vector>
#include "combat_engine.hpp"
#include "dice.hpp"
#include "session.hpp"
#include "skill_check.hpp"

namespace fablecore {

struct CombatResult {
    std::vector<v1::TimelineEvent> events;
    /// Encounter after the action; concluded encounters are returned too.
    std::optional<CombatState> combat_state;
};

struct SkillCheckOutcome {
    SkillCheckResult result;
    v1::TimelineEvent event;
};

struct CombatSummary {
    std::string combat_id;
    int round_number = 0;
    std::string active_combatant;
    std::vector<std::string> combatant_lines;
    std::vector<std::string> recent_log;
};

/**
 * Mechanical operations on one session.
 *
 * Each operation validates against the session's current state, commits
 * the resulting events atomically and returns them with their sequence
 * numbers. Rejections throw before anything is committed.
 */
class Mechanics {
public:
    static constexpr std::size_t kSummaryLogLines = 5;

    explicit Mechanics(DiceRoller& dice);

    CombatResult begin_combat(Session& session, const std::vector<v1::Combatant>& roster);

    CombatResult perform_attack(Session& session, const std::string& actor_id,
                                const std::string& target_id, const v1::Weapon& weapon,
                                const AttackOptions& options = {});

    CombatResult apply_direct_damage(Session& session, const std::string& target_id, int amount,
                                     const std::string& source);

    CombatResult end_combat(Session& session, const std::string& reason);

    CombatResult flee(Session& session, const std::string& actor_id);

    CombatResult end_turn(Session& session, const std::string& actor_id);

    SkillCheckOutcome perform_skill_check(Session& session, const SkillCheckRequest& request);

    std::vector<v1::TimelineEvent> apply_inventory_delta(Session& session, const std::string& item_id,
                                                         int64_t quantity_delta, int64_t currency_delta);

    v1::TimelineEvent offer_choices(Session& session, const std::vector<v1::Choice>& choices);

    v1::TimelineEvent record_user_input(Session& session, const std::string& text);

    v1::TimelineEvent record_system_log(Session& session, const std::string& message,
                                        const std::string& source);

    v1::TimelineEvent record_narrative(Session& session, const std::string& text);

    /**
     * Combatant roll call and the last few combat log lines of the active
     * encounter, or of the most recent one when none is active.
     * Throws NotFoundError when the session never fought.
     */
    CombatSummary combat_summary(const Session& session) const;

private:
    CombatResult run_combat_action(Session& session, const std::string& action,
                                   const Session::Producer& produce);

    DiceRoller& dice_;
};

} // namespace fablecore
