#include "fablecore/rendering_narrator.hpp"

namespace fablecore {

std::string RenderingNarrator::compose(const NarrationRequest& request) {
    EventRenderer renderer;
    for (const auto& event : request.history) {
        renderer.learn(event);
    }

    std::string text;
    for (const auto& event : request.turn_events) {
        // The player already knows what they typed.
        if (event.kind() == v1::USER_INPUT) continue;

        std::string line = renderer.render(event);
        if (line.empty()) continue;
        if (!text.empty()) text += " ";
        text += line;
    }
    return text;
}

void RenderingNarrator::narrate(const NarrationRequest& request, TokenChannel& out) {
    std::string text = compose(request);

    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t space = text.find(' ', pos);
        std::size_t end = space == std::string::npos ? text.size() : space + 1;
        if (!out.push(text.substr(pos, end - pos))) {
            return;
        }
        pos = end;
    }
}

} // namespace fablecore
