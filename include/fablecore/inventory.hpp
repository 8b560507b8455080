#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "fablecore/timeline.pb.h"
#include "fablecore/mechanics.pb.h"

namespace fablecore {

struct InventoryState {
    std::map<std::string, int64_t> items;
    int64_t currency = 0;

    int64_t quantity_of(const std::string& item_id) const;

    v1::InventorySnapshot to_snapshot() const;

    /**
     * Fold one item-added, item-removed or currency-change event into the
     * state. Events of other kinds are ignored.
     */
    static void apply_event(InventoryState& state, const v1::TimelineEvent& event);
};

class InventoryLogic {
public:
    /**
     * Validate an inventory/currency delta and produce its events: one
     * item event when quantity_delta is non-zero, then one currency event
     * when currency_delta is non-zero.
     *
     * Rejects a delta that would drive a count or the balance below zero.
     */
    static std::vector<v1::TimelineEvent> handle_delta(
        const InventoryState& state,
        const std::string& item_id,
        int64_t quantity_delta,
        int64_t currency_delta);
};

} // namespace fablecore
