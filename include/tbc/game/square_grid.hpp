#pragma once

/// @file square_grid.hpp
/// @brief Rectangular reference board implementing the grid and hazard services.

#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "tbc/foundation/timer_scheduler.hpp"
#include "tbc/game/battle_services.hpp"

namespace tbc::game {

/// A hazard placed on a cell.
struct HazardSpec {
    int32_t damage = 5;
    int32_t durationRounds = -1;  ///< -1 = permanent.
};

/// Width x height board with 8-neighbour movement (diagonals cost one step).
///
/// Obstacles and occupied cells block movement; hazard cells are walkable.
class SquareGrid final : public IGridService, public IHazardService {
public:
    SquareGrid(int32_t width, int32_t height);

    // ── IGridService ────────────────────────────────────────────────────
    [[nodiscard]] std::vector<GridPos> ReachableCells(const Combatant& unit,
                                                      int32_t budget) const override;
    [[nodiscard]] std::vector<GridPos> Path(const Combatant& unit,
                                            GridPos target) const override;
    [[nodiscard]] bool IsValidPosition(int32_t x, int32_t y) const override;
    [[nodiscard]] std::optional<GridCell> CellAt(int32_t x, int32_t y) const override;
    void MoveOccupant(tbc::foundation::CombatantId id, GridPos from, GridPos to) override;
    void ClearOccupant(GridPos pos) override;

    // ── IHazardService ──────────────────────────────────────────────────
    void TickRoundHazards() override;
    int32_t ApplyHazardDamage(Combatant& unit, GridPos cell) override;

    // ── Board setup ─────────────────────────────────────────────────────
    void SetObstacle(GridPos pos, bool blocked = true);
    void PlaceHazard(GridPos pos, HazardSpec spec);
    void RemoveHazard(GridPos pos);

    /// Put @p unit on its current position. Fails on invalid or taken cells.
    bool PlaceCombatant(const Combatant& unit);

    [[nodiscard]] int32_t Width() const noexcept { return width_; }
    [[nodiscard]] int32_t Height() const noexcept { return height_; }
    [[nodiscard]] std::size_t HazardCount() const noexcept { return hazards_.size(); }
    [[nodiscard]] int32_t RoundTicks() const noexcept { return roundTicks_; }

private:
    /// Breadth-first distances from @p start limited to @p budget steps.
    [[nodiscard]] std::unordered_map<GridPos, GridPos> Explore(
        GridPos start, int32_t budget, std::unordered_map<GridPos, int32_t>& dist) const;

    [[nodiscard]] bool IsPassable(GridPos pos, tbc::foundation::CombatantId self) const;

    int32_t width_;
    int32_t height_;
    std::unordered_set<GridPos> obstacles_;
    std::unordered_map<GridPos, tbc::foundation::CombatantId> occupants_;
    std::unordered_map<GridPos, HazardSpec> hazards_;
    int32_t roundTicks_ = 0;
};

/// IMovementDriver that completes after a fixed virtual time per step.
class TimedMovementDriver final : public IMovementDriver {
public:
    TimedMovementDriver(tbc::foundation::TimerScheduler& timers,
                        tbc::foundation::TimerScheduler::Duration perStep);

    void MoveAlong(tbc::foundation::CombatantId id, std::vector<GridPos> path,
                   std::function<void()> onArrived) override;
    void Cancel(tbc::foundation::CombatantId id) override;

    [[nodiscard]] bool IsMoving(tbc::foundation::CombatantId id) const {
        return inFlight_.count(id) > 0;
    }

private:
    tbc::foundation::TimerScheduler& timers_;
    tbc::foundation::TimerScheduler::Duration perStep_;
    std::unordered_map<tbc::foundation::CombatantId, tbc::foundation::TimerId> inFlight_;
};

}  // namespace tbc::game
