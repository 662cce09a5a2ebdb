/// @file faction_relationship_resolver.cpp
/// @brief FactionRelationshipResolver implementation.

#include "tbc/game/faction_relationship_resolver.hpp"

#include <string>

#include "tbc/foundation/game_logger.hpp"

namespace tbc::game {

using tbc::foundation::LogCategory;

FactionRelationship FactionRelationshipResolver::GetRelationship(Faction a, Faction b) const {
    if (a == b) {
        return FactionRelationship::Ally;
    }
    auto ia = Index(a);
    auto ib = Index(b);
    if (ia >= kFactionCount || ib >= kFactionCount) {
        return FactionRelationship::Hostile;
    }
    return matrix_[ia][ib].value_or(FactionRelationship::Hostile);
}

void FactionRelationshipResolver::SetRelationship(Faction a, Faction b,
                                                  FactionRelationship relationship) {
    if (a == b) {
        TBC_LOG_WARN(LogCategory::Faction,
                     std::string("Ignoring relationship override for ") +
                         std::string(factionName(a)) + " with itself");
        return;
    }
    auto ia = Index(a);
    auto ib = Index(b);
    if (ia >= kFactionCount || ib >= kFactionCount) {
        TBC_LOG_WARN(LogCategory::Faction, "Ignoring relationship for unknown faction");
        return;
    }
    matrix_[ia][ib] = relationship;
    matrix_[ib][ia] = relationship;

    TBC_LOG_INFO(LogCategory::Faction,
                 std::string(factionName(a)) + " <-> " + std::string(factionName(b)) +
                     " = " + std::string(relationshipName(relationship)));
}

void FactionRelationshipResolver::ClearRelationship(Faction a, Faction b) {
    auto ia = Index(a);
    auto ib = Index(b);
    if (ia >= kFactionCount || ib >= kFactionCount) {
        return;
    }
    matrix_[ia][ib].reset();
    matrix_[ib][ia].reset();
}

void FactionRelationshipResolver::Reset() {
    for (auto& row : matrix_) {
        row.fill(std::nullopt);
    }
}

bool FactionRelationshipResolver::HasExplicitRelationship(Faction a, Faction b) const {
    auto ia = Index(a);
    auto ib = Index(b);
    if (ia >= kFactionCount || ib >= kFactionCount) {
        return false;
    }
    return matrix_[ia][ib].has_value();
}

}  // namespace tbc::game
