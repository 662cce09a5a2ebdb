#pragma once

/// @file encounter_config.hpp
/// @brief Encounter rules, AI pacing and their YAML loaders.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

#include "tbc/foundation/config_manager.hpp"
#include "tbc/foundation/game_result.hpp"
#include "tbc/game/combat_resolver.hpp"
#include "tbc/game/faction_relationship_resolver.hpp"

namespace tbc::game {

/// How a battle is won.
enum class VictoryCondition : uint8_t {
    KillAll,
    SurviveRounds,
    ProtectTarget,   ///< Evaluated as KillAll.
    ReachLocation    ///< Evaluated as KillAll.
};

std::string_view victoryConditionName(VictoryCondition condition);
std::optional<VictoryCondition> parseVictoryCondition(std::string_view name);

/// Read-only encounter rules consumed by the turn order engine.
struct EncounterConfiguration {
    VictoryCondition condition = VictoryCondition::KillAll;
    int32_t surviveRounds = 0;   ///< Rounds to outlast for SurviveRounds.
    int32_t roundLimit = 0;      ///< 0 = unlimited; exceeding it is a defeat.
    bool requireStakesAcknowledgement = false;
};

/// Pacing of AI-controlled turns, in virtual time.
struct AITiming {
    std::chrono::milliseconds thinkingDelay{1500};
    std::chrono::milliseconds interUnitGap{100};
    std::chrono::milliseconds decisionTimeout{5000};
    std::chrono::milliseconds movementStepDuration{200};
};

// ── Loaders ─────────────────────────────────────────────────────────────
//
// Absent keys keep their defaults; a present key with the wrong type fails
// with ConfigTypeMismatch.

/// Read `combat.*`.
tbc::foundation::GameResult<CombatTuning> LoadCombatTuning(
    const tbc::foundation::ConfigManager& config);

/// Read `ai.*` (values in milliseconds).
tbc::foundation::GameResult<AITiming> LoadAITiming(const tbc::foundation::ConfigManager& config);

/// Read `encounter.*`.
tbc::foundation::GameResult<EncounterConfiguration> LoadEncounter(
    const tbc::foundation::ConfigManager& config);

/// Apply every `[FactionA, FactionB, Relationship]` triple under
/// `factions.relationships` to @p resolver.
/// @return The number of triples applied.
tbc::foundation::GameResult<std::size_t> ApplyFactionRelationships(
    const tbc::foundation::ConfigManager& config, FactionRelationshipResolver& resolver);

}  // namespace tbc::game
