/// @file combatant_roster.cpp
/// @brief CombatantRoster implementation.

#include "tbc/game/combatant_roster.hpp"

#include <algorithm>
#include <string>

namespace tbc::game {

using tbc::foundation::ErrorCode;
using tbc::foundation::GameError;
using tbc::foundation::GameResult;

GameResult<Combatant*> CombatantRoster::Add(std::unique_ptr<Combatant> combatant) {
    if (!combatant || !combatant->Id().isValid()) {
        return GameResult<Combatant*>::err(
            GameError(ErrorCode::InvalidArgument, "combatant is null or has the null id"));
    }
    auto id = combatant->Id();
    if (Contains(id)) {
        return GameResult<Combatant*>::err(
            GameError(ErrorCode::AlreadyExists,
                      "combatant already registered: " + std::to_string(id.value()), id));
    }
    auto* raw = combatant.get();
    index_.emplace(id, std::move(combatant));
    order_.push_back(id);
    return GameResult<Combatant*>::ok(raw);
}

GameResult<Combatant*> CombatantRoster::Emplace(CombatantId id, std::string name,
                                                Faction faction, CombatStats stats,
                                                GridPos position) {
    return Add(std::make_unique<Combatant>(id, std::move(name), faction, stats, position));
}

bool CombatantRoster::Remove(CombatantId id) {
    if (index_.erase(id) == 0) {
        return false;
    }
    std::erase(order_, id);
    return true;
}

Combatant* CombatantRoster::Find(CombatantId id) {
    auto it = index_.find(id);
    return it != index_.end() ? it->second.get() : nullptr;
}

const Combatant* CombatantRoster::Find(CombatantId id) const {
    auto it = index_.find(id);
    return it != index_.end() ? it->second.get() : nullptr;
}

std::vector<const Combatant*> CombatantRoster::All() const {
    std::vector<const Combatant*> out;
    out.reserve(order_.size());
    for (auto id : order_) {
        out.push_back(index_.at(id).get());
    }
    return out;
}

std::vector<Combatant*> CombatantRoster::All() {
    std::vector<Combatant*> out;
    out.reserve(order_.size());
    for (auto id : order_) {
        out.push_back(index_.at(id).get());
    }
    return out;
}

void CombatantRoster::Clear() {
    index_.clear();
    order_.clear();
}

}  // namespace tbc::game
