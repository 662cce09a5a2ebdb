#pragma once

/// @file faction_types.hpp
/// @brief Faction and relationship enumerations.

#include <cstdint>
#include <optional>
#include <string_view>

namespace tbc::game {

/// Allegiance of a combatant. Player is reserved for player-controlled units.
enum class Faction : uint8_t {
    Player,
    Faction1,
    Faction2,
    Faction3,
    Neutral
};

/// Number of distinct factions (for array sizing).
constexpr std::size_t kFactionCount = 5;

/// Relationship between two factions.
enum class FactionRelationship : uint8_t {
    Hostile,
    Neutral,
    Ally
};

constexpr std::string_view factionName(Faction faction) {
    switch (faction) {
        case Faction::Player:   return "Player";
        case Faction::Faction1: return "Faction1";
        case Faction::Faction2: return "Faction2";
        case Faction::Faction3: return "Faction3";
        case Faction::Neutral:  return "Neutral";
    }
    return "Unknown";
}

constexpr std::string_view relationshipName(FactionRelationship relationship) {
    switch (relationship) {
        case FactionRelationship::Hostile: return "Hostile";
        case FactionRelationship::Neutral: return "Neutral";
        case FactionRelationship::Ally:    return "Ally";
    }
    return "Unknown";
}

/// Parse a faction name as written in configuration files.
constexpr std::optional<Faction> parseFaction(std::string_view name) {
    for (std::size_t i = 0; i < kFactionCount; ++i) {
        auto faction = static_cast<Faction>(i);
        if (factionName(faction) == name) {
            return faction;
        }
    }
    return std::nullopt;
}

/// Parse a relationship name as written in configuration files.
constexpr std::optional<FactionRelationship> parseRelationship(std::string_view name) {
    if (name == "Hostile") return FactionRelationship::Hostile;
    if (name == "Neutral") return FactionRelationship::Neutral;
    if (name == "Ally") return FactionRelationship::Ally;
    return std::nullopt;
}

}  // namespace tbc::game
