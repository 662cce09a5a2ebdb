#pragma once

/// @file combatant_roster.hpp
/// @brief Arena owning every combatant of a battle, keyed by stable id.

#include <memory>
#include <unordered_map>
#include <vector>

#include "tbc/foundation/game_result.hpp"
#include "tbc/game/combatant.hpp"

namespace tbc::game {

/// Owns combatants for the lifetime of a battle.
///
/// Other subsystems hold CombatantId handles and resolve them here, so a
/// removed unit can never be reached through a dangling reference.
class CombatantRoster {
public:
    CombatantRoster() = default;

    CombatantRoster(const CombatantRoster&) = delete;
    CombatantRoster& operator=(const CombatantRoster&) = delete;

    /// Take ownership of @p combatant. Fails with AlreadyExists on a duplicate
    /// id and InvalidArgument on the null id.
    tbc::foundation::GameResult<Combatant*> Add(std::unique_ptr<Combatant> combatant);

    /// Construct and add a combatant in place.
    tbc::foundation::GameResult<Combatant*> Emplace(CombatantId id, std::string name,
                                                    Faction faction, CombatStats stats,
                                                    GridPos position = {});

    /// Destroy the combatant with @p id.
    bool Remove(CombatantId id);

    [[nodiscard]] Combatant* Find(CombatantId id);
    [[nodiscard]] const Combatant* Find(CombatantId id) const;

    [[nodiscard]] bool Contains(CombatantId id) const { return index_.count(id) > 0; }

    /// Every combatant, in insertion order.
    [[nodiscard]] std::vector<const Combatant*> All() const;
    [[nodiscard]] std::vector<Combatant*> All();

    /// Every id, in insertion order.
    [[nodiscard]] const std::vector<CombatantId>& Ids() const noexcept { return order_; }

    [[nodiscard]] std::size_t Size() const noexcept { return order_.size(); }

    void Clear();

private:
    std::unordered_map<CombatantId, std::unique_ptr<Combatant>> index_;
    std::vector<CombatantId> order_;
};

}  // namespace tbc::game
