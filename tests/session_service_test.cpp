#include <gtest/gtest.h>
#include "fablecore/fablecore.hpp"
#include "test_support.hpp"

using namespace fablecore;
using fablecore::testing_support::CollectingSink;
using fablecore::testing_support::FailingSaveStore;
using fablecore::testing_support::ScriptedDice;
using fablecore::testing_support::make_combatant;
using fablecore::testing_support::make_weapon;

class SessionServiceTest : public ::testing::Test {
protected:
    SessionServiceTest() : service(store, dice, resolver, narrator) {}

    void SetUp() override {
        service.create_session("s1");
    }

    std::vector<v1::Combatant> duel_roster() {
        return {
            make_combatant("hero", v1::PLAYER, 20, 12, 3, 2, 0),
            make_combatant("goblin", v1::ENEMY, 20, 14, 0, 1, 0),
        };
    }

    v1::PlayerInput skill_input(const std::string& text, int stat_value) {
        v1::PlayerInput input;
        input.set_text(text);
        auto* check = input.add_actions()->mutable_skill_check();
        check->set_skill_name("stealth");
        check->set_stat_value(stat_value);
        check->set_difficulty(v1::NORMAL);
        return input;
    }

    InMemorySessionStore store;
    ScriptedDice dice;
    ActionIntentResolver resolver;
    RenderingNarrator narrator;
    SessionService service;
};

// =============================================================================
// Lifecycle Tests
// =============================================================================

TEST_F(SessionServiceTest, CreateListDelete_ShouldRoundTrip) {
    service.create_session("s2");
    EXPECT_EQ(service.list_sessions(), (std::vector<std::string>{"s1", "s2"}));

    service.delete_session("s2");
    EXPECT_EQ(service.list_sessions(), (std::vector<std::string>{"s1"}));
}

TEST_F(SessionServiceTest, CreateExisting_ShouldThrowStateConflict) {
    EXPECT_THROW(service.create_session("s1"), StateConflictError);
}

TEST_F(SessionServiceTest, UnknownSession_ShouldThrowNotFound) {
    EXPECT_THROW(service.get_history("nope"), NotFoundError);
    EXPECT_THROW(service.begin_combat("nope", duel_roster()), NotFoundError);
}

// =============================================================================
// Combat Tests
// =============================================================================

TEST_F(SessionServiceTest, AttackScenario_ShouldPersistAttackThenDamage) {
    // Given a duel where the hero acts first
    auto begun = service.begin_combat("s1", duel_roster());
    ASSERT_TRUE(begun.combat_state.has_value());
    EXPECT_EQ(begun.combat_state->combat_id, "s1-combat-1");
    dice.queue(15);

    // When the hero attacks
    auto result = service.perform_attack("s1", "hero", "goblin", make_weapon("sword", 6));

    // Then attack and damage are committed in order with fresh sequences
    ASSERT_GE(result.events.size(), 2u);
    EXPECT_EQ(result.events[0].kind(), v1::COMBAT_ATTACK);
    EXPECT_EQ(result.events[1].kind(), v1::COMBAT_DAMAGE);
    EXPECT_EQ(result.events[1].sequence(), result.events[0].sequence() + 1);
    EXPECT_EQ(result.combat_state->get("goblin")->current_hp, 11);

    // And the store holds the same history
    auto record = store.load("s1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->events_size(), 4);
}

TEST_F(SessionServiceTest, CombatSummary_ShouldListCombatantsAndRecentLog) {
    service.begin_combat("s1", duel_roster());
    dice.queue(15);
    service.perform_attack("s1", "hero", "goblin", make_weapon("sword", 6));

    auto summary = service.combat_summary("s1");

    EXPECT_EQ(summary.round_number, 1);
    EXPECT_EQ(summary.active_combatant, "goblin");
    EXPECT_EQ(summary.combatant_lines, (std::vector<std::string>{"hero HP 20/20", "goblin HP 11/20"}));
    ASSERT_EQ(summary.recent_log.size(), 4u);
    EXPECT_EQ(summary.recent_log[2], "🩸 goblin took 9 damage. HP: 20 -> 11");
}

TEST_F(SessionServiceTest, CombatSummary_WithoutCombat_ShouldThrowNotFound) {
    EXPECT_THROW(service.combat_summary("s1"), NotFoundError);
}

TEST_F(SessionServiceTest, Flee_ShouldConcludeAndAllowNewEncounter) {
    service.begin_combat("s1", duel_roster());

    auto fled = service.flee("s1", "hero");
    EXPECT_EQ(fled.combat_state->outcome, v1::OUTCOME_FLED);

    auto second = service.begin_combat("s1", duel_roster());
    EXPECT_EQ(second.combat_state->combat_id, "s1-combat-2");
}

TEST_F(SessionServiceTest, DirectDamageThenEndCombat_ShouldPersistBoth) {
    // Given a duel with the hero to act
    service.begin_combat("s1", duel_roster());

    // When a trap hurts the goblin and the encounter is called off
    auto hurt = service.apply_direct_damage("s1", "goblin", 6, "trap");
    auto summary = service.combat_summary("s1");
    auto ended = service.end_combat("s1", "the goblin surrenders");

    // Then the damage kept the turn with the hero and the end is archived
    EXPECT_EQ(hurt.events.size(), 1u);
    EXPECT_EQ(summary.active_combatant, "hero");
    EXPECT_EQ(summary.combatant_lines[1], "goblin HP 14/20");
    EXPECT_EQ(ended.combat_state->outcome, v1::OUTCOME_ENDED);
    EXPECT_THROW(service.combat_summary("s1"), NotFoundError);
    EXPECT_EQ(store.load("s1")->events_size(), static_cast<int>(service.get_history("s1").size()));
}

TEST_F(SessionServiceTest, StreamTurn_WithEndCombatAction_ShouldNarrateTheReason) {
    service.begin_combat("s1", duel_roster());
    v1::PlayerInput input;
    input.set_text("I lower my sword");
    input.add_actions()->mutable_end_combat()->set_reason("truce");
    CollectingSink sink;

    auto report = service.stream_turn("s1", input, sink);

    EXPECT_EQ(report.mechanical_events, 2u);
    EXPECT_NE(sink.narration().find("Combat ended: ended (truce) after 1 round."), std::string::npos);
}

TEST_F(SessionServiceTest, EndTurn_OutOfTurn_ShouldThrowAndCommitNothing) {
    service.begin_combat("s1", duel_roster());
    auto before = service.get_history("s1").size();

    EXPECT_THROW(service.end_turn("s1", "goblin"), StateConflictError);
    EXPECT_EQ(service.get_history("s1").size(), before);
}

// =============================================================================
// Skill Check, Inventory and Choice Tests
// =============================================================================

TEST_F(SessionServiceTest, SkillCheck_ShouldCommitEventWithOutcomeIcon) {
    dice.queue(90);
    SkillCheckRequest request;
    request.skill_name = "lockpicking";
    request.stat_value = 12;
    request.skill_rank = 1;

    auto outcome = service.perform_skill_check("s1", request);

    EXPECT_EQ(outcome.result.target, 46);
    EXPECT_FALSE(outcome.result.success);
    EXPECT_EQ(outcome.event.kind(), v1::SKILL_CHECK);
    EXPECT_EQ(outcome.event.display_icon(), "❌");
    EXPECT_EQ(outcome.event.sequence(), 1);
}

TEST_F(SessionServiceTest, InventoryDelta_ShouldTrackBalance) {
    service.apply_inventory_delta("s1", "", 0, 10);
    auto events = service.apply_inventory_delta("s1", "lantern", 1, -4);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(helpers::unpack<v1::CurrencyChanged>(events[1]).new_balance(), 6);
    EXPECT_THROW(service.apply_inventory_delta("s1", "", 0, -7), ValidationError);
}

TEST_F(SessionServiceTest, OfferChoices_ShouldRecordChoices) {
    v1::Choice choice;
    choice.set_label("Pick the lock");
    choice.set_skill_check("lockpicking");

    auto event = service.offer_choices("s1", {choice});

    EXPECT_EQ(event.kind(), v1::CHOICE_OFFERED);
    auto offered = helpers::unpack<v1::ChoicesOffered>(event);
    EXPECT_EQ(offered.choices(0).difficulty(), v1::NORMAL);
    EXPECT_THROW(service.offer_choices("s1", {}), ValidationError);
}

// =============================================================================
// History Tests
// =============================================================================

TEST_F(SessionServiceTest, GetHistory_FromSequence_ShouldSkipEarlierEvents) {
    service.record_system_log("s1", "one", "test");
    service.record_system_log("s1", "two", "test");
    service.record_system_log("s1", "three", "test");

    auto events = service.get_history("s1", 2);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events.front().sequence(), 2);
}

TEST_F(SessionServiceTest, RestoreHistory_ShouldRewindToBeforeChosenInput) {
    // Given two streamed turns
    CollectingSink first_sink;
    dice.queue(10);
    service.stream_turn("s1", skill_input("sneak past", 10), first_sink);
    CollectingSink second_sink;
    dice.queue(95);
    service.stream_turn("s1", skill_input("sneak again", 10), second_sink);
    int64_t highest = service.get_history("s1").back().sequence();

    // When restored to the point before the second input
    auto points = service.get_restore_points("s1");
    ASSERT_EQ(points.size(), 2u);
    EXPECT_EQ(points[1].human_preview(), "👤 sneak again");
    int64_t tail = service.restore_history("s1", points[1].sequence());

    // Then the first turn survives and the second is gone
    EXPECT_EQ(tail, points[1].sequence());
    auto history = service.get_history("s1");
    EXPECT_EQ(history.back().sequence(), tail);
    EXPECT_EQ(service.get_restore_points("s1").size(), 1u);

    // And new events never reuse a discarded sequence
    auto event = service.record_system_log("s1", "after rewind", "test");
    EXPECT_GT(event.sequence(), highest);

    // And the rewind is durable
    auto record = store.load("s1");
    EXPECT_EQ(record->events_size(), static_cast<int>(history.size()) + 1);
}

// =============================================================================
// Streaming Tests
// =============================================================================

TEST_F(SessionServiceTest, StreamTurn_ShouldNarrateCommittedMechanics) {
    dice.queue(10);
    CollectingSink sink;

    auto report = service.stream_turn("s1", skill_input("sneak past the guard", 10), sink);

    EXPECT_EQ(report.mechanical_events, 2u);
    EXPECT_EQ(sink.narration(), "Skill check 'stealth' (normal): SUCCESS (Roll: 10 vs 30)");
    EXPECT_EQ(sink.frames.back().end_of_turn().tail_sequence(), 3);
}

TEST_F(SessionServiceTest, StreamTurn_UnknownSession_ShouldSendErrorThenEnd) {
    CollectingSink sink;

    auto report = service.stream_turn("ghost", skill_input("boo", 10), sink);

    EXPECT_TRUE(report.rejected);
    ASSERT_EQ(sink.frames.size(), 2u);
    EXPECT_EQ(sink.frames[0].error().kind(), "NotFoundError");
    EXPECT_EQ(sink.frames[1].end_of_turn().tail_sequence(), 0);
}

TEST_F(SessionServiceTest, Sessions_ShouldSurviveServiceRestart) {
    service.begin_combat("s1", duel_roster());

    SessionService restarted(store, dice, resolver, narrator);

    auto summary = restarted.combat_summary("s1");
    EXPECT_EQ(summary.combat_id, "s1-combat-1");
    EXPECT_EQ(summary.active_combatant, "hero");
}

// =============================================================================
// Persistence Failure Tests
// =============================================================================

class SessionServicePersistenceTest : public ::testing::Test {
protected:
    SessionServicePersistenceTest() : service(store, dice, resolver, narrator) {}

    void SetUp() override {
        service.create_session("s1");
        service.record_system_log("s1", "campfire", "test");
        store.fail_saves = true;
    }

    FailingSaveStore store;
    ScriptedDice dice;
    ActionIntentResolver resolver;
    RenderingNarrator narrator;
    SessionService service;
};

TEST_F(SessionServicePersistenceTest, RefusedSave_ShouldLeaveHistoryUnchanged) {
    // Given a store that refuses writes
    dice.queue(10);
    SkillCheckRequest request;
    request.skill_name = "stealth";
    request.stat_value = 10;

    // When a skill check is performed
    EXPECT_THROW(service.perform_skill_check("s1", request), PersistenceError);

    // Then no event is visible, and a retry after recovery commits exactly once
    EXPECT_EQ(service.get_history("s1").size(), 1u);
    store.fail_saves = false;
    dice.queue(10);
    auto outcome = service.perform_skill_check("s1", request);
    EXPECT_EQ(outcome.event.sequence(), 2);
    EXPECT_EQ(store.load("s1")->events_size(), 2);
}

TEST_F(SessionServicePersistenceTest, RefusedSave_ShouldLeaveCombatUnchanged) {
    store.fail_saves = false;
    service.begin_combat("s1", {
        make_combatant("hero", v1::PLAYER, 20, 12, 3, 2, 0),
        make_combatant("goblin", v1::ENEMY, 20, 14, 0, 1, 0),
    });
    store.fail_saves = true;
    dice.queue(15);

    EXPECT_THROW(service.perform_attack("s1", "hero", "goblin", make_weapon("sword", 6)), PersistenceError);

    auto summary = service.combat_summary("s1");
    EXPECT_EQ(summary.active_combatant, "hero");
    EXPECT_EQ(summary.combatant_lines[1], "goblin HP 20/20");
}

TEST_F(SessionServicePersistenceTest, RefusedRestore_ShouldKeepTheDiscardedEvents) {
    store.fail_saves = false;
    service.record_system_log("s1", "dawn", "test");
    store.fail_saves = true;

    EXPECT_THROW(service.restore_history("s1", 1), PersistenceError);

    EXPECT_EQ(service.get_history("s1").size(), 2u);
    EXPECT_EQ(store.load("s1")->events_size(), 2);
}
