#pragma once

/// @file battle_services.hpp
/// @brief Narrow contracts for the grid, hazard and movement collaborators.
///
/// The battle core never owns board geometry, hazards or animation. It
/// consumes them through these interfaces, which the host (or SquareGrid
/// and TimedMovementDriver in tests) implements.

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "tbc/foundation/types.hpp"
#include "tbc/game/grid_types.hpp"

namespace tbc::game {

class Combatant;

/// Board geometry and occupancy.
class IGridService {
public:
    virtual ~IGridService() = default;

    /// Cells @p unit can reach with @p budget steps, excluding its own cell.
    [[nodiscard]] virtual std::vector<GridPos> ReachableCells(const Combatant& unit,
                                                              int32_t budget) const = 0;

    /// Ordered steps from the unit's cell to @p target, excluding the start.
    /// Empty when unreachable.
    [[nodiscard]] virtual std::vector<GridPos> Path(const Combatant& unit,
                                                    GridPos target) const = 0;

    [[nodiscard]] virtual bool IsValidPosition(int32_t x, int32_t y) const = 0;

    [[nodiscard]] virtual std::optional<GridCell> CellAt(int32_t x, int32_t y) const = 0;

    /// Record that @p id now stands on @p to (leaving @p from).
    virtual void MoveOccupant(tbc::foundation::CombatantId id, GridPos from, GridPos to) = 0;

    /// Clear whatever occupies @p pos (e.g. a unit that left the battle).
    virtual void ClearOccupant(GridPos pos) = 0;
};

/// Persistent cell effects.
class IHazardService {
public:
    virtual ~IHazardService() = default;

    /// Advance every hazard by one round (damage-over-time, expiry).
    virtual void TickRoundHazards() = 0;

    /// Apply the hazard at @p cell to @p unit.
    /// @return The HP actually removed (0 when no hazard is there).
    virtual int32_t ApplyHazardDamage(Combatant& unit, GridPos cell) = 0;
};

/// Animated movement with a completion callback.
class IMovementDriver {
public:
    virtual ~IMovementDriver() = default;

    /// Begin animating @p id along @p path; invoke @p onArrived when done.
    virtual void MoveAlong(tbc::foundation::CombatantId id, std::vector<GridPos> path,
                           std::function<void()> onArrived) = 0;

    /// Abort an in-flight animation for @p id. Its callback is dropped.
    virtual void Cancel(tbc::foundation::CombatantId id) = 0;
};

}  // namespace tbc::game
