#pragma once

#include <string>
#include "fablecore/mechanics.pb.h"
#include "dice.hpp"

namespace fablecore {

struct SkillCheckRequest {
    std::string stat_name;
    std::string skill_name;
    int stat_value = 0;
    int skill_rank = 0;
    v1::Difficulty difficulty = v1::NORMAL;

    static SkillCheckRequest from_proto(const v1::SkillCheckAction& action);
};

struct SkillCheckResult {
    int target = 0;
    int roll = 0;
    bool success = false;
    int margin = 0;
};

/**
 * Percentile skill checks.
 *
 * target = clamp(stat * 3 + rank * 10 - difficulty offset, 1, 99).
 * A roll at or under the target succeeds; margin is target - roll.
 */
class SkillCheckResolver {
public:
    static constexpr int kMinTarget = 1;
    static constexpr int kMaxTarget = 99;

    /**
     * Offset a difficulty tier subtracts from the target: -20 favorable,
     * 0 normal, +20 unfavorable. Throws ValidationError for any other tier.
     */
    static int difficulty_offset(v1::Difficulty difficulty);

    /// Computed in 64 bits, so any int stat or rank clamps instead of wrapping.
    static int compute_target(int stat_value, int skill_rank, v1::Difficulty difficulty);

    static SkillCheckResult evaluate(int target, int roll);

    /**
     * Reject negative stats or ranks and unknown tiers.
     */
    static void validate(const SkillCheckRequest& request);

    /**
     * Validate, draw one percentile roll and evaluate it.
     */
    static SkillCheckResult resolve(const SkillCheckRequest& request, DiceRoller& dice);

    static v1::SkillCheckRecorded to_event(const SkillCheckRequest& request,
                                           const SkillCheckResult& result);
};

} // namespace fablecore
