/// @file encounter_config.cpp
/// @brief YAML loaders for combat tuning, AI pacing and encounter rules.

#include "tbc/game/encounter_config.hpp"

#include <string>
#include <vector>

#include "tbc/foundation/game_logger.hpp"

namespace tbc::game {

using tbc::foundation::ConfigManager;
using tbc::foundation::ErrorCode;
using tbc::foundation::GameResult;
using tbc::foundation::LogCategory;
using tbc::foundation::makeError;

namespace {

/// Overwrite @p target with `key` when present.
template <typename T>
bool ReadInto(const ConfigManager& config, std::string_view key, T& target,
              tbc::foundation::GameError& error) {
    auto result = config.getOr<T>(key, target);
    if (result.hasError()) {
        error = result.error();
        TBC_LOG_WARN(LogCategory::Config, std::string(error.message()));
        return false;
    }
    target = result.value();
    return true;
}

bool ReadMillis(const ConfigManager& config, std::string_view key,
                std::chrono::milliseconds& target, tbc::foundation::GameError& error) {
    auto count = static_cast<int64_t>(target.count());
    if (!ReadInto(config, key, count, error)) {
        return false;
    }
    if (count < 0) {
        error = tbc::foundation::GameError(ErrorCode::ConfigValueOutOfRange,
                                           std::string(key) + " must not be negative");
        return false;
    }
    target = std::chrono::milliseconds(count);
    return true;
}

}  // namespace

std::string_view victoryConditionName(VictoryCondition condition) {
    switch (condition) {
        case VictoryCondition::KillAll:       return "KillAll";
        case VictoryCondition::SurviveRounds: return "SurviveRounds";
        case VictoryCondition::ProtectTarget: return "ProtectTarget";
        case VictoryCondition::ReachLocation: return "ReachLocation";
    }
    return "Unknown";
}

std::optional<VictoryCondition> parseVictoryCondition(std::string_view name) {
    for (auto condition : {VictoryCondition::KillAll, VictoryCondition::SurviveRounds,
                           VictoryCondition::ProtectTarget, VictoryCondition::ReachLocation}) {
        if (victoryConditionName(condition) == name) {
            return condition;
        }
    }
    return std::nullopt;
}

GameResult<CombatTuning> LoadCombatTuning(const ConfigManager& config) {
    CombatTuning tuning;
    tbc::foundation::GameError error;
    bool ok = ReadInto(config, "combat.base_hit_chance", tuning.baseHitChance, error) &&
              ReadInto(config, "combat.finesse_hit_factor", tuning.finesseHitFactor, error) &&
              ReadInto(config, "combat.min_hit_chance", tuning.minHitChance, error) &&
              ReadInto(config, "combat.max_hit_chance", tuning.maxHitChance, error) &&
              ReadInto(config, "combat.base_parry_chance", tuning.baseParryChance, error) &&
              ReadInto(config, "combat.finesse_parry_factor", tuning.finesseParryFactor, error) &&
              ReadInto(config, "combat.max_parry_chance", tuning.maxParryChance, error) &&
              ReadInto(config, "combat.base_crit_chance", tuning.baseCritChance, error) &&
              ReadInto(config, "combat.luck_crit_factor", tuning.luckCritFactor, error) &&
              ReadInto(config, "combat.max_crit_chance", tuning.maxCritChance, error) &&
              ReadInto(config, "combat.base_crit_defense", tuning.baseCritDefense, error) &&
              ReadInto(config, "combat.focus_crit_defense_factor",
                       tuning.focusCritDefenseFactor, error) &&
              ReadInto(config, "combat.max_crit_defense", tuning.maxCritDefense, error) &&
              ReadInto(config, "combat.crit_multiplier", tuning.criticalMultiplier, error) &&
              ReadInto(config, "combat.minimum_damage", tuning.minimumDamage, error);
    if (!ok) {
        return GameResult<CombatTuning>::err(std::move(error));
    }
    if (tuning.minimumDamage < 0 || tuning.criticalMultiplier < 1.0f) {
        return makeError<CombatTuning>(ErrorCode::ConfigValueOutOfRange,
                                       "combat.minimum_damage or combat.crit_multiplier out of range");
    }
    return GameResult<CombatTuning>::ok(tuning);
}

GameResult<AITiming> LoadAITiming(const ConfigManager& config) {
    AITiming timing;
    tbc::foundation::GameError error;
    bool ok = ReadMillis(config, "ai.thinking_delay_ms", timing.thinkingDelay, error) &&
              ReadMillis(config, "ai.inter_unit_gap_ms", timing.interUnitGap, error) &&
              ReadMillis(config, "ai.decision_timeout_ms", timing.decisionTimeout, error) &&
              ReadMillis(config, "ai.movement_step_ms", timing.movementStepDuration, error);
    if (!ok) {
        return GameResult<AITiming>::err(std::move(error));
    }
    return GameResult<AITiming>::ok(timing);
}

GameResult<EncounterConfiguration> LoadEncounter(const ConfigManager& config) {
    EncounterConfiguration encounter;
    tbc::foundation::GameError error;

    std::string condition(victoryConditionName(encounter.condition));
    if (!ReadInto(config, "encounter.victory", condition, error)) {
        return GameResult<EncounterConfiguration>::err(std::move(error));
    }
    auto parsed = parseVictoryCondition(condition);
    if (!parsed) {
        return makeError<EncounterConfiguration>(ErrorCode::ConfigValueOutOfRange,
                                                 "unknown victory condition: " + condition);
    }
    encounter.condition = *parsed;

    bool ok = ReadInto(config, "encounter.survive_rounds", encounter.surviveRounds, error) &&
              ReadInto(config, "encounter.round_limit", encounter.roundLimit, error) &&
              ReadInto(config, "encounter.require_stakes_ack",
                       encounter.requireStakesAcknowledgement, error);
    if (!ok) {
        return GameResult<EncounterConfiguration>::err(std::move(error));
    }
    if (encounter.surviveRounds < 0 || encounter.roundLimit < 0) {
        return makeError<EncounterConfiguration>(ErrorCode::ConfigValueOutOfRange,
                                                 "encounter round counts must not be negative");
    }
    return GameResult<EncounterConfiguration>::ok(encounter);
}

GameResult<std::size_t> ApplyFactionRelationships(const ConfigManager& config,
                                                  FactionRelationshipResolver& resolver) {
    auto triples = config.getOr<std::vector<std::vector<std::string>>>(
        "factions.relationships", {});
    if (triples.hasError()) {
        return GameResult<std::size_t>::err(triples.error());
    }

    std::size_t applied = 0;
    for (const auto& triple : triples.value()) {
        if (triple.size() != 3) {
            return makeError<std::size_t>(ErrorCode::ConfigTypeMismatch,
                                          "faction relationship entries need three fields");
        }
        auto a = parseFaction(triple[0]);
        auto b = parseFaction(triple[1]);
        if (!a || !b) {
            return makeError<std::size_t>(ErrorCode::UnknownFaction,
                                          "unknown faction in relationship " + triple[0] +
                                              "/" + triple[1]);
        }
        auto relationship = parseRelationship(triple[2]);
        if (!relationship) {
            return makeError<std::size_t>(ErrorCode::UnknownRelationship,
                                          "unknown relationship: " + triple[2]);
        }
        resolver.SetRelationship(*a, *b, *relationship);
        ++applied;
    }
    return GameResult<std::size_t>::ok(applied);
}

}  // namespace tbc::game
