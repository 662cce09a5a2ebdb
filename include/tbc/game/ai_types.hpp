#pragma once

/// @file ai_types.hpp
/// @brief AI action kinds, behavior kinds and tunable weights.

#include <cstdint>
#include <optional>
#include <string_view>

#include "tbc/foundation/types.hpp"

namespace tbc::game {

/// What an AI unit decided to do with its turn.
enum class AIActionKind : uint8_t {
    MeleeAttack,
    RangedSkill,  ///< Use a damage skill (its range may be 1).
    Support,
    Move,
    Wait
};

enum class AIBehaviorKind : uint8_t {
    Berserker,
    Support,
    Coward,
    Protector
};

std::string_view aiActionName(AIActionKind kind);
std::string_view aiBehaviorName(AIBehaviorKind kind);
std::optional<AIBehaviorKind> parseAIBehavior(std::string_view name);

/// Weights and probability gates shared by every behavior.
///
/// Weights are in [0, 1]. Preferences are probabilities drawn against
/// RandomSource::chance().
struct AIBehaviorConfig {
    float lowHpWeight = 0.5f;
    float proximityWeight = 0.3f;
    float threatWeight = 0.2f;
    float aggression = 0.7f;
    float hazardAvoidance = 0.5f;
    float skillPreference = 0.3f;
    float supportPreference = 0.0f;
    float retreatThreshold = 0.3f;  ///< HP fraction below which a unit retreats.

    /// Defaults tuned for @p kind.
    static AIBehaviorConfig ForKind(AIBehaviorKind kind);
};

/// The action chosen for a turn, with the skill to use when relevant.
struct AIActionChoice {
    AIActionKind kind = AIActionKind::Wait;
    std::optional<tbc::foundation::SkillId> skill;
};

}  // namespace tbc::game
