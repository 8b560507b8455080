#include <gtest/gtest.h>
#include <limits>
#include "fablecore/errors.hpp"
#include "fablecore/helpers.hpp"
#include "fablecore/inventory.hpp"

using namespace fablecore;

class InventoryTest : public ::testing::Test {
protected:
    void apply(const std::string& item_id, int64_t quantity_delta, int64_t currency_delta) {
        auto events = InventoryLogic::handle_delta(state, item_id, quantity_delta, currency_delta);
        for (const auto& event : events) {
            InventoryState::apply_event(state, event);
        }
    }

    InventoryState state;
};

// =============================================================================
// Item Tests
// =============================================================================

TEST_F(InventoryTest, AddItem_ShouldEmitItemAddedWithRunningTotal) {
    apply("potion", 2, 0);

    auto events = InventoryLogic::handle_delta(state, "potion", 3, 0);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind(), v1::ITEM_ADDED);
    auto added = helpers::unpack<v1::ItemAdded>(events[0]);
    EXPECT_EQ(added.quantity(), 3);
    EXPECT_EQ(added.new_quantity(), 5);
}

TEST_F(InventoryTest, RemoveLastItem_ShouldDropEntry) {
    apply("torch", 1, 0);
    apply("torch", -1, 0);

    EXPECT_EQ(state.quantity_of("torch"), 0);
    EXPECT_EQ(state.items.count("torch"), 0u);
}

TEST_F(InventoryTest, RemoveMoreThanHeld_ShouldThrowValidationError) {
    apply("arrow", 3, 0);
    EXPECT_THROW(InventoryLogic::handle_delta(state, "arrow", -4, 0), ValidationError);
    EXPECT_EQ(state.quantity_of("arrow"), 3);
}

TEST_F(InventoryTest, RemoveUnknownItem_ShouldThrowNotFound) {
    EXPECT_THROW(InventoryLogic::handle_delta(state, "dragon-egg", -1, 0), NotFoundError);
}

TEST_F(InventoryTest, QuantityWithoutItemId_ShouldThrowValidationError) {
    EXPECT_THROW(InventoryLogic::handle_delta(state, "", 1, 0), ValidationError);
}

TEST_F(InventoryTest, EmptyDelta_ShouldThrowValidationError) {
    EXPECT_THROW(InventoryLogic::handle_delta(state, "potion", 0, 0), ValidationError);
}

TEST_F(InventoryTest, AddBeyondMaximumStack_ShouldThrowValidationError) {
    // Given a stack already at the largest representable quantity
    state.items["arrow"] = std::numeric_limits<int64_t>::max();

    // When one more is added, the rejection names the add rather than a removal
    try {
        InventoryLogic::handle_delta(state, "arrow", 1, 0);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("exceeds the maximum stack"), std::string::npos);
    }
    EXPECT_EQ(state.quantity_of("arrow"), std::numeric_limits<int64_t>::max());
}

TEST_F(InventoryTest, RemoveMinimumDelta_ShouldThrowValidationError) {
    apply("arrow", 3, 0);
    EXPECT_THROW(InventoryLogic::handle_delta(state, "arrow", std::numeric_limits<int64_t>::min(), 0),
                 ValidationError);
}

// =============================================================================
// Currency Tests
// =============================================================================

TEST_F(InventoryTest, Purchase_ShouldEmitItemThenCurrency) {
    apply("", 0, 20);

    auto events = InventoryLogic::handle_delta(state, "rope", 1, -5);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind(), v1::ITEM_ADDED);
    EXPECT_EQ(events[1].kind(), v1::CURRENCY_CHANGE);
    EXPECT_EQ(helpers::unpack<v1::CurrencyChanged>(events[1]).new_balance(), 15);
}

TEST_F(InventoryTest, Overspending_ShouldThrowAndEmitNothing) {
    apply("", 0, 4);

    // The item half of the delta is valid, but the whole delta is rejected
    EXPECT_THROW(InventoryLogic::handle_delta(state, "rope", 1, -5), ValidationError);
    EXPECT_EQ(state.currency, 4);
    EXPECT_EQ(state.quantity_of("rope"), 0);
}

TEST_F(InventoryTest, CurrencyBeyondMaximumBalance_ShouldThrowValidationError) {
    state.currency = std::numeric_limits<int64_t>::max() - 1;

    EXPECT_THROW(InventoryLogic::handle_delta(state, "", 0, 2), ValidationError);
    auto events = InventoryLogic::handle_delta(state, "", 0, 1);
    EXPECT_EQ(helpers::unpack<v1::CurrencyChanged>(events[0]).new_balance(),
              std::numeric_limits<int64_t>::max());
}

TEST_F(InventoryTest, SpendMinimumDelta_ShouldThrowValidationError) {
    apply("", 0, 10);
    EXPECT_THROW(InventoryLogic::handle_delta(state, "", 0, std::numeric_limits<int64_t>::min()),
                 ValidationError);
    EXPECT_EQ(state.currency, 10);
}

TEST_F(InventoryTest, Snapshot_ShouldMirrorState) {
    apply("potion", 2, 10);

    auto snapshot = state.to_snapshot();

    EXPECT_EQ(snapshot.currency(), 10);
    EXPECT_EQ(snapshot.items().at("potion"), 2);
}
