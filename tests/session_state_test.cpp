#include <gtest/gtest.h>
#include "fablecore/errors.hpp"
#include "fablecore/mechanics.hpp"
#include "fablecore/session.hpp"
#include "test_support.hpp"

using namespace fablecore;
using fablecore::testing_support::ScriptedDice;
using fablecore::testing_support::make_combatant;
using fablecore::testing_support::make_weapon;

class SessionStateTest : public ::testing::Test {
protected:
    SessionStateTest() : session("s1"), mechanics(dice) {}

    void begin_duel() {
        mechanics.begin_combat(session, {
            make_combatant("hero", v1::PLAYER, 20, 12, 3, 2, 0),
            make_combatant("goblin", v1::ENEMY, 20, 14, 0, 1, 0),
        });
    }

    ScriptedDice dice;
    Session session;
    Mechanics mechanics;
};

// =============================================================================
// Replay Tests
// =============================================================================

TEST_F(SessionStateTest, Replay_ShouldRebuildTheSameState) {
    // Given a session with combat and inventory history
    mechanics.apply_inventory_delta(session, "potion", 2, 15);
    begin_duel();
    dice.queue(15);
    mechanics.perform_attack(session, "hero", "goblin", make_weapon("sword", 6));

    // When the state is rebuilt from the log alone
    auto rebuilt = SessionState::replay("s1", session.read());

    // Then it matches the live state
    auto live = session.state();
    ASSERT_TRUE(rebuilt.combat.has_value());
    EXPECT_EQ(rebuilt.combat->get("goblin")->current_hp, live.combat->get("goblin")->current_hp);
    EXPECT_EQ(rebuilt.combat->active_index, live.combat->active_index);
    EXPECT_EQ(rebuilt.inventory.quantity_of("potion"), 2);
    EXPECT_EQ(rebuilt.inventory.currency, 15);
}

TEST_F(SessionStateTest, FromRecord_ShouldRestoreTimelineAndState) {
    mechanics.record_user_input(session, "buy rope");
    mechanics.apply_inventory_delta(session, "rope", 1, 0);

    auto restored = Session::from_record(session.to_record());

    EXPECT_EQ(restored->id(), "s1");
    EXPECT_EQ(restored->tail_sequence(), session.tail_sequence());
    EXPECT_EQ(restored->next_sequence(), session.next_sequence());
    EXPECT_EQ(restored->state().inventory.quantity_of("rope"), 1);
}

TEST_F(SessionStateTest, FailedCommand_ShouldLeaveLogAndStateUntouched) {
    mechanics.apply_inventory_delta(session, "", 0, 5);
    int64_t tail = session.tail_sequence();

    EXPECT_THROW(mechanics.apply_inventory_delta(session, "", 0, -10), ValidationError);

    EXPECT_EQ(session.tail_sequence(), tail);
    EXPECT_EQ(session.state().inventory.currency, 5);
}

// =============================================================================
// Rollback Tests
// =============================================================================

TEST_F(SessionStateTest, Rollback_BeforeCombat_ShouldClearEncounter) {
    // Given a restore point taken before combat started
    mechanics.record_user_input(session, "draw steel");
    int64_t before_combat = session.tail_sequence();
    begin_duel();
    ASSERT_TRUE(session.state().in_combat());

    // When rolled back
    int64_t tail = session.rollback_to(before_combat);

    // Then the encounter is gone and the log ends at the target
    EXPECT_EQ(tail, before_combat);
    EXPECT_FALSE(session.state().in_combat());
    EXPECT_TRUE(session.state().archived_combats.empty());
}

TEST_F(SessionStateTest, Rollback_MidCombat_ShouldRestoreHitPoints) {
    begin_duel();
    int64_t before_attack = session.tail_sequence();
    dice.queue(15);
    mechanics.perform_attack(session, "hero", "goblin", make_weapon("sword", 6));
    ASSERT_EQ(session.combat()->get("goblin")->current_hp, 11);

    session.rollback_to(before_attack);

    EXPECT_EQ(session.combat()->get("goblin")->current_hp, 20);
    EXPECT_EQ(session.combat()->active_combatant()->id, "hero");
}

TEST_F(SessionStateTest, Rollback_ThenAppend_ShouldIssueFreshSequence) {
    mechanics.record_system_log(session, "one", "test");
    mechanics.record_system_log(session, "two", "test");
    int64_t highest = session.tail_sequence();

    session.rollback_to(1);
    auto event = mechanics.record_system_log(session, "three", "test");

    EXPECT_GT(event.sequence(), highest);
}

TEST_F(SessionStateTest, Rollback_ToNegative_ShouldThrowValidationError) {
    EXPECT_THROW(session.rollback_to(-1), ValidationError);
}

TEST_F(SessionStateTest, Rollback_DuringTurn_ShouldThrowStateConflict) {
    mechanics.record_system_log(session, "one", "test");

    TurnGuard turn(session);

    EXPECT_THROW(session.rollback_to(0), StateConflictError);
    EXPECT_EQ(session.tail_sequence(), 1);
}

TEST_F(SessionStateTest, TurnGuard_ShouldReleaseOnScopeExit) {
    {
        TurnGuard turn(session);
        EXPECT_TRUE(session.turn_in_flight());
        EXPECT_THROW(TurnGuard second(session), StateConflictError);
    }
    EXPECT_FALSE(session.turn_in_flight());
}
