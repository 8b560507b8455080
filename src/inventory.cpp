#include "fablecore/inventory.hpp"
#include "fablecore/errors.hpp"
#include "fablecore/helpers.hpp"
#include <limits>

namespace fablecore {

int64_t InventoryState::quantity_of(const std::string& item_id) const {
    auto it = items.find(item_id);
    return it != items.end() ? it->second : 0;
}

v1::InventorySnapshot InventoryState::to_snapshot() const {
    v1::InventorySnapshot snapshot;
    for (const auto& [item_id, quantity] : items) {
        (*snapshot.mutable_items())[item_id] = quantity;
    }
    snapshot.set_currency(currency);
    return snapshot;
}

void InventoryState::apply_event(InventoryState& state, const v1::TimelineEvent& event) {
    const auto& payload = event.payload();

    switch (event.kind()) {
        case v1::ITEM_ADDED: {
            v1::ItemAdded e;
            if (payload.UnpackTo(&e)) {
                state.items[e.item_id()] = e.new_quantity();
            }
            break;
        }
        case v1::ITEM_REMOVED: {
            v1::ItemRemoved e;
            if (payload.UnpackTo(&e)) {
                if (e.new_quantity() == 0) {
                    state.items.erase(e.item_id());
                } else {
                    state.items[e.item_id()] = e.new_quantity();
                }
            }
            break;
        }
        case v1::CURRENCY_CHANGE: {
            v1::CurrencyChanged e;
            if (payload.UnpackTo(&e)) {
                state.currency = e.new_balance();
            }
            break;
        }
        default:
            break;
    }
}

std::vector<v1::TimelineEvent> InventoryLogic::handle_delta(
    const InventoryState& state,
    const std::string& item_id,
    int64_t quantity_delta,
    int64_t currency_delta) {

    if (quantity_delta == 0 && currency_delta == 0) {
        throw ValidationError("Inventory delta changes nothing");
    }
    if (quantity_delta != 0 && item_id.empty()) {
        throw ValidationError("item_id is required when quantity changes");
    }

    if (quantity_delta == std::numeric_limits<int64_t>::min()) {
        throw ValidationError("quantity_delta is out of range");
    }
    int64_t held = state.quantity_of(item_id);
    if (quantity_delta < 0 && held == 0) {
        throw NotFoundError("Item " + item_id + " is not in the inventory");
    }
    if (quantity_delta < 0 && -quantity_delta > held) {
        throw ValidationError("Cannot remove " + std::to_string(-quantity_delta) + " x " + item_id +
                              ", only " + std::to_string(held) + " held");
    }
    if (quantity_delta > std::numeric_limits<int64_t>::max() - held) {
        throw ValidationError("Adding " + std::to_string(quantity_delta) + " x " + item_id +
                              " exceeds the maximum stack of " +
                              std::to_string(std::numeric_limits<int64_t>::max()));
    }
    int64_t new_quantity = held + quantity_delta;

    if (currency_delta < 0 && currency_delta < -state.currency) {
        throw ValidationError("Insufficient currency: balance " + std::to_string(state.currency) +
                              ", change " + std::to_string(currency_delta));
    }
    if (currency_delta > std::numeric_limits<int64_t>::max() - state.currency) {
        throw ValidationError("Currency change " + std::to_string(currency_delta) +
                              " exceeds the maximum balance");
    }
    int64_t new_balance = state.currency + currency_delta;

    std::vector<v1::TimelineEvent> events;
    if (quantity_delta > 0) {
        v1::ItemAdded added;
        added.set_item_id(item_id);
        added.set_quantity(quantity_delta);
        added.set_new_quantity(new_quantity);
        events.push_back(helpers::make_event(v1::ITEM_ADDED, added));
    } else if (quantity_delta < 0) {
        v1::ItemRemoved removed;
        removed.set_item_id(item_id);
        removed.set_quantity(-quantity_delta);
        removed.set_new_quantity(new_quantity);
        events.push_back(helpers::make_event(v1::ITEM_REMOVED, removed));
    }
    if (currency_delta != 0) {
        v1::CurrencyChanged changed;
        changed.set_delta(currency_delta);
        changed.set_new_balance(new_balance);
        events.push_back(helpers::make_event(v1::CURRENCY_CHANGE, changed));
    }
    return events;
}

} // namespace fablecore
