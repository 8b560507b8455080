#include "fablecore/dice.hpp"
#include "fablecore/errors.hpp"
#include <string>

namespace fablecore {

SeededDice::SeededDice(std::optional<std::uint64_t> seed)
    : rng_(seed ? *seed : std::random_device{}()) {}

int SeededDice::roll(int sides) {
    if (sides < 1) {
        throw ValidationError("A die needs at least one side, got " + std::to_string(sides));
    }
    std::uniform_int_distribution<int> distribution(1, sides);
    std::lock_guard<std::mutex> lock(mutex_);
    return distribution(rng_);
}

} // namespace fablecore
