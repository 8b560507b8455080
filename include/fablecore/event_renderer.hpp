#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include "fablecore/timeline.pb.h"
#include "fablecore/mechanics.pb.h"

namespace fablecore {

/// Human-readable rendering of timeline events.
///
/// Used for restore-point previews, combat summaries and the fallback
/// narrator. Combatant ids are shown by display name once the renderer has
/// seen the CombatStarted event that introduced them.
class EventRenderer {
public:
    EventRenderer() = default;

    /// Set display name for a combatant.
    void set_combatant_name(const std::string& combatant_id, const std::string& name);

    /// Get display name for a combatant (the id itself when unknown).
    std::string combatant_name(const std::string& combatant_id) const;

    /// Record names carried by an event (CombatStarted rosters).
    void learn(const v1::TimelineEvent& event);

    /// Default display icon for an event kind.
    static const char* icon_for(v1::EventKind kind);

    /// Stable dashed name of an event kind ("skill-check", "combat-turn", ...).
    static const char* kind_name(v1::EventKind kind);

    static std::string render_difficulty(v1::Difficulty difficulty);
    static std::string render_outcome(v1::CombatOutcome outcome);

    /// Shorten text to at most max_chars bytes, appending "..." when cut.
    static std::string preview(const std::string& text, std::size_t max_chars = 60);

    /// Render any event as one line of text.
    std::string render(const v1::TimelineEvent& event) const;

    // Payload renderers
    std::string render_skill_check(const v1::SkillCheckRecorded& payload) const;
    std::string render_combat_started(const v1::CombatStarted& payload) const;
    std::string render_attack(const v1::AttackResolved& payload) const;
    std::string render_damage(const v1::DamageApplied& payload) const;
    std::string render_turn_advanced(const v1::TurnAdvanced& payload) const;
    std::string render_fled(const v1::CombatantFled& payload) const;
    std::string render_concluded(const v1::CombatConcluded& payload) const;
    std::string render_item_added(const v1::ItemAdded& payload) const;
    std::string render_item_removed(const v1::ItemRemoved& payload) const;
    std::string render_currency_changed(const v1::CurrencyChanged& payload) const;
    std::string render_choices(const v1::ChoicesOffered& payload) const;

private:
    std::string render_combat_turn(const v1::TimelineEvent& event) const;

    std::unordered_map<std::string, std::string> combatant_names_;
};

} // namespace fablecore
