#pragma once

#include "event_renderer.hpp"
#include "stream_coordinator.hpp"

namespace fablecore {

/**
 * Fallback narrator: reads the turn's committed events back as plain
 * sentences, one word per token.
 *
 * Used when no generative narrator is attached, and as a reference for the
 * Narrator contract.
 */
class RenderingNarrator final : public Narrator {
public:
    void narrate(const NarrationRequest& request, TokenChannel& out) override;

    /// Text the narrator would stream for a request.
    static std::string compose(const NarrationRequest& request);
};

} // namespace fablecore
