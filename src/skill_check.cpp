#include "fablecore/skill_check.hpp"
#include "fablecore/errors.hpp"
#include "fablecore/validation.hpp"
#include <algorithm>
#include <cstdint>

namespace fablecore {

SkillCheckRequest SkillCheckRequest::from_proto(const v1::SkillCheckAction& action) {
    SkillCheckRequest request;
    request.stat_name = action.stat_name();
    request.skill_name = action.skill_name();
    request.stat_value = action.stat_value();
    request.skill_rank = action.skill_rank();
    request.difficulty = action.difficulty() == v1::DIFFICULTY_UNSPECIFIED
        ? v1::NORMAL
        : action.difficulty();
    return request;
}

int SkillCheckResolver::difficulty_offset(v1::Difficulty difficulty) {
    switch (difficulty) {
        case v1::FAVORABLE: return -20;
        case v1::NORMAL: return 0;
        case v1::UNFAVORABLE: return 20;
        default:
            throw ValidationError("Unknown difficulty tier " + std::to_string(static_cast<int>(difficulty)));
    }
}

int SkillCheckResolver::compute_target(int stat_value, int skill_rank, v1::Difficulty difficulty) {
    int64_t raw = int64_t{stat_value} * 3 + int64_t{skill_rank} * 10 - difficulty_offset(difficulty);
    return static_cast<int>(std::clamp<int64_t>(raw, kMinTarget, kMaxTarget));
}

SkillCheckResult SkillCheckResolver::evaluate(int target, int roll) {
    SkillCheckResult result;
    result.target = target;
    result.roll = roll;
    result.success = roll <= target;
    result.margin = target - roll;
    return result;
}

void SkillCheckResolver::validate(const SkillCheckRequest& request) {
    validation::require_non_negative(request.stat_value, "stat_value");
    validation::require_non_negative(request.skill_rank, "skill_rank");
    difficulty_offset(request.difficulty);
}

SkillCheckResult SkillCheckResolver::resolve(const SkillCheckRequest& request, DiceRoller& dice) {
    validate(request);
    int target = compute_target(request.stat_value, request.skill_rank, request.difficulty);
    return evaluate(target, dice.percentile());
}

v1::SkillCheckRecorded SkillCheckResolver::to_event(const SkillCheckRequest& request,
                                                    const SkillCheckResult& result) {
    v1::SkillCheckRecorded event;
    event.set_stat_name(request.stat_name);
    event.set_skill_name(request.skill_name);
    event.set_stat_value(request.stat_value);
    event.set_skill_rank(request.skill_rank);
    event.set_difficulty(request.difficulty);
    event.set_target(result.target);
    event.set_roll(result.roll);
    event.set_success(result.success);
    event.set_margin(result.margin);
    return event;
}

} // namespace fablecore
