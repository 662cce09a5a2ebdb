#pragma once

/// @file faction_relationship_resolver.hpp
/// @brief Symmetric faction x faction relationship matrix.

#include <array>
#include <optional>

#include "tbc/game/faction_types.hpp"

namespace tbc::game {

/// Resolves the relationship between two factions in O(1).
///
/// Identical factions are always Ally; pairs without an explicit entry are
/// Hostile. Writes are applied to both directions in one step, so
/// GetRelationship(a, b) == GetRelationship(b, a) holds after every call.
///
/// Owned by the battle session and passed by reference to the turn engine,
/// the action executor and the AI.
class FactionRelationshipResolver {
public:
    FactionRelationshipResolver() = default;

    [[nodiscard]] FactionRelationship GetRelationship(Faction a, Faction b) const;

    /// Set the relationship for the unordered pair {a, b}.
    /// Setting a faction's relationship with itself is ignored.
    void SetRelationship(Faction a, Faction b, FactionRelationship relationship);

    /// Drop the explicit entry for {a, b}, restoring the Hostile default.
    void ClearRelationship(Faction a, Faction b);

    /// Drop every explicit entry.
    void Reset();

    [[nodiscard]] bool AreHostile(Faction a, Faction b) const {
        return GetRelationship(a, b) == FactionRelationship::Hostile;
    }

    [[nodiscard]] bool AreAllied(Faction a, Faction b) const {
        return GetRelationship(a, b) == FactionRelationship::Ally;
    }

    [[nodiscard]] bool AreNeutral(Faction a, Faction b) const {
        return GetRelationship(a, b) == FactionRelationship::Neutral;
    }

    /// True when {a, b} has an explicit entry.
    [[nodiscard]] bool HasExplicitRelationship(Faction a, Faction b) const;

private:
    static std::size_t Index(Faction f) { return static_cast<std::size_t>(f); }

    std::array<std::array<std::optional<FactionRelationship>, kFactionCount>, kFactionCount>
        matrix_{};
};

}  // namespace tbc::game
