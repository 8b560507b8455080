#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>

namespace fablecore {

/// Source of uniform integer draws. Injected wherever mechanics need chance,
/// so tests can script exact rolls.
class DiceRoller {
public:
    virtual ~DiceRoller() = default;

    /// Uniform draw in [1, sides]. Throws ValidationError for sides < 1.
    virtual int roll(int sides) = 0;

    int d20() { return roll(20); }
    int percentile() { return roll(100); }
};

/// Mersenne-twister dice, optionally seeded for reproducible runs.
/// Safe to share between sessions running on different threads.
class SeededDice final : public DiceRoller {
public:
    explicit SeededDice(std::optional<std::uint64_t> seed = std::nullopt);

    int roll(int sides) override;

private:
    std::mt19937_64 rng_;
    std::mutex mutex_;
};

} // namespace fablecore
