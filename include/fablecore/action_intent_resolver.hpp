#pragma once

#include "stream_coordinator.hpp"

namespace fablecore {

/// Executes the structured actions attached to a PlayerInput, in order.
class ActionIntentResolver final : public IntentResolver {
public:
    void resolve(const v1::PlayerInput& input, Session& session, Mechanics& mechanics) override;

    static void execute(const v1::Action& action, Session& session, Mechanics& mechanics);
};

} // namespace fablecore
