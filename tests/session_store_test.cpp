#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <random>
#include "fablecore/errors.hpp"
#include "fablecore/in_memory_session_store.hpp"
#include "fablecore/json_file_session_store.hpp"
#include "fablecore/mechanics.hpp"
#include "fablecore/session.hpp"
#include "fablecore/session_repository.hpp"
#include "test_support.hpp"

using namespace fablecore;
using fablecore::testing_support::ScriptedDice;
using fablecore::testing_support::make_combatant;

namespace fs = std::filesystem;

class JsonFileSessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir = fs::temp_directory_path() / ("fablecore-store-" + std::to_string(rd()));
        store = std::make_unique<JsonFileSessionStore>(dir);
    }

    void TearDown() override {
        store.reset();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
    std::unique_ptr<JsonFileSessionStore> store;
};

// =============================================================================
// JSON File Store Tests
// =============================================================================

TEST_F(JsonFileSessionStoreTest, SaveAndLoad_ShouldRestoreSessionExactly) {
    // Given a session with combat and inventory history
    ScriptedDice dice;
    Mechanics mechanics(dice);
    Session session("campaign-1");
    mechanics.record_user_input(session, "ambush!");
    mechanics.begin_combat(session, {
        make_combatant("hero", v1::PLAYER, 20, 12, 3, 2, 0),
        make_combatant("goblin", v1::ENEMY, 9, 14, 0, 1, 0),
    });
    mechanics.apply_inventory_delta(session, "potion", 1, 3);

    // When written and read back
    store->save(session.to_record());
    auto record = store->load("campaign-1");

    // Then the replayed session matches
    ASSERT_TRUE(record.has_value());
    auto restored = Session::from_record(*record);
    EXPECT_EQ(restored->tail_sequence(), session.tail_sequence());
    EXPECT_EQ(restored->next_sequence(), session.next_sequence());
    ASSERT_TRUE(restored->combat().has_value());
    EXPECT_EQ(restored->combat()->combat_id, "campaign-1-combat-1");
    EXPECT_EQ(restored->state().inventory.currency, 3);
    EXPECT_EQ(restored->read().front().display_icon(), "👤");
    EXPECT_TRUE(fs::exists(dir / "campaign-1.json"));
}

TEST_F(JsonFileSessionStoreTest, Load_UnknownSession_ShouldReturnNullopt) {
    EXPECT_FALSE(store->load("nobody").has_value());
}

TEST_F(JsonFileSessionStoreTest, Load_CorruptFile_ShouldThrowPersistenceError) {
    std::ofstream(dir / "broken.json") << "{ not json";
    EXPECT_THROW(store->load("broken"), PersistenceError);
}

TEST_F(JsonFileSessionStoreTest, PathTraversalId_ShouldThrowValidationError) {
    EXPECT_THROW(store->load("../etc/passwd"), ValidationError);
    EXPECT_THROW(JsonFileSessionStore::validate_session_id("a b"), ValidationError);
    EXPECT_NO_THROW(JsonFileSessionStore::validate_session_id("Run_2-b"));
}

TEST_F(JsonFileSessionStoreTest, List_ShouldReturnSortedIdsOfJsonFilesOnly) {
    Session b("beta");
    Session a("alpha");
    store->save(b.to_record());
    store->save(a.to_record());
    std::ofstream(dir / "notes.txt") << "ignored";

    EXPECT_EQ(store->list(), (std::vector<std::string>{"alpha", "beta"}));
}

TEST_F(JsonFileSessionStoreTest, Remove_ShouldReportWhetherRecordExisted) {
    Session s("gone");
    store->save(s.to_record());

    EXPECT_TRUE(store->remove("gone"));
    EXPECT_FALSE(store->remove("gone"));
    EXPECT_FALSE(store->load("gone").has_value());
}

// =============================================================================
// Repository Tests
// =============================================================================

class SessionRepositoryTest : public ::testing::Test {
protected:
    SessionRepositoryTest() : repository(store) {}

    InMemorySessionStore store;
    SessionRepository repository;
};

TEST_F(SessionRepositoryTest, Create_ShouldPersistEmptySession) {
    repository.create("s1");

    EXPECT_TRUE(store.load("s1").has_value());
    EXPECT_TRUE(repository.exists("s1"));
}

TEST_F(SessionRepositoryTest, Create_DuplicateId_ShouldThrowStateConflict) {
    repository.create("s1");
    EXPECT_THROW(repository.create("s1"), StateConflictError);
}

TEST_F(SessionRepositoryTest, Get_ShouldShareOneHandlePerSession) {
    repository.create("s1");
    EXPECT_EQ(repository.get("s1").get(), repository.get("s1").get());
}

TEST_F(SessionRepositoryTest, Get_UnknownId_ShouldThrowNotFound) {
    EXPECT_THROW(repository.get("missing"), NotFoundError);
}

TEST_F(SessionRepositoryTest, Get_StoredButNotCached_ShouldLoadFromStore) {
    ScriptedDice dice;
    Mechanics mechanics(dice);
    Session session("persisted");
    mechanics.record_system_log(session, "hello", "test");
    store.save(session.to_record());

    auto loaded = repository.get("persisted");

    EXPECT_EQ(loaded->tail_sequence(), 1);
}

TEST_F(SessionRepositoryTest, Remove_ShouldDeleteFromStoreAndCache) {
    repository.create("s1");

    repository.remove("s1");

    EXPECT_FALSE(repository.exists("s1"));
    EXPECT_THROW(repository.remove("s1"), NotFoundError);
}

TEST_F(SessionRepositoryTest, Remove_DuringTurn_ShouldThrowStateConflict) {
    auto session = repository.create("s1");
    TurnGuard turn(*session);

    EXPECT_THROW(repository.remove("s1"), StateConflictError);
}
