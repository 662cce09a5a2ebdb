/// @file square_grid.cpp
/// @brief SquareGrid and TimedMovementDriver implementations.

#include "tbc/game/square_grid.hpp"

#include <algorithm>
#include <array>
#include <deque>
#include <string>

#include "tbc/foundation/game_logger.hpp"
#include "tbc/game/combatant.hpp"

namespace tbc::game {

using tbc::foundation::CombatantId;
using tbc::foundation::LogCategory;

namespace {

constexpr std::array<GridPos, 8> kNeighbourOffsets = {{
    {-1, -1}, {0, -1}, {1, -1},
    {-1,  0},          {1,  0},
    {-1,  1}, {0,  1}, {1,  1},
}};

}  // namespace

SquareGrid::SquareGrid(int32_t width, int32_t height)
    : width_(std::max(width, 1)), height_(std::max(height, 1)) {}

// ── IGridService ────────────────────────────────────────────────────────

bool SquareGrid::IsValidPosition(int32_t x, int32_t y) const {
    return x >= 0 && y >= 0 && x < width_ && y < height_;
}

std::optional<GridCell> SquareGrid::CellAt(int32_t x, int32_t y) const {
    if (!IsValidPosition(x, y)) {
        return std::nullopt;
    }
    GridPos pos{x, y};
    GridCell cell;
    cell.pos = pos;
    cell.walkable = obstacles_.count(pos) == 0;
    if (auto occ = occupants_.find(pos); occ != occupants_.end()) {
        cell.occupant = occ->second;
    }
    if (auto hz = hazards_.find(pos); hz != hazards_.end()) {
        cell.hasHazard = true;
        cell.hazardDamage = hz->second.damage;
    }
    return cell;
}

bool SquareGrid::IsPassable(GridPos pos, CombatantId self) const {
    if (!IsValidPosition(pos.x, pos.y) || obstacles_.count(pos) > 0) {
        return false;
    }
    auto occ = occupants_.find(pos);
    return occ == occupants_.end() || occ->second == self;
}

std::unordered_map<GridPos, GridPos> SquareGrid::Explore(
    GridPos start, int32_t budget, std::unordered_map<GridPos, int32_t>& dist) const {
    std::unordered_map<GridPos, GridPos> parent;
    CombatantId self;
    if (auto occ = occupants_.find(start); occ != occupants_.end()) {
        self = occ->second;
    }

    std::deque<GridPos> frontier;
    dist[start] = 0;
    frontier.push_back(start);
    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop_front();
        auto d = dist[current];
        if (d >= budget) {
            continue;
        }
        for (const auto& offset : kNeighbourOffsets) {
            GridPos next{current.x + offset.x, current.y + offset.y};
            if (dist.count(next) > 0 || !IsPassable(next, self)) {
                continue;
            }
            dist[next] = d + 1;
            parent[next] = current;
            frontier.push_back(next);
        }
    }
    return parent;
}

std::vector<GridPos> SquareGrid::ReachableCells(const Combatant& unit, int32_t budget) const {
    std::vector<GridPos> cells;
    if (budget <= 0) {
        return cells;
    }
    std::unordered_map<GridPos, int32_t> dist;
    Explore(unit.Position(), budget, dist);
    cells.reserve(dist.size());
    for (const auto& [pos, d] : dist) {
        if (pos != unit.Position()) {
            cells.push_back(pos);
        }
    }
    // Row-major order keeps AI tie-breaks independent of hash layout.
    std::sort(cells.begin(), cells.end(), [](GridPos a, GridPos b) {
        return a.y != b.y ? a.y < b.y : a.x < b.x;
    });
    return cells;
}

std::vector<GridPos> SquareGrid::Path(const Combatant& unit, GridPos target) const {
    std::vector<GridPos> path;
    if (target == unit.Position() || !IsPassable(target, unit.Id())) {
        return path;
    }
    std::unordered_map<GridPos, int32_t> dist;
    auto parent = Explore(unit.Position(), width_ * height_, dist);
    if (dist.count(target) == 0) {
        return path;
    }
    for (auto step = target; step != unit.Position(); step = parent.at(step)) {
        path.push_back(step);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

void SquareGrid::MoveOccupant(CombatantId id, GridPos from, GridPos to) {
    auto occ = occupants_.find(from);
    if (occ != occupants_.end() && occ->second == id) {
        occupants_.erase(occ);
    }
    occupants_[to] = id;
}

void SquareGrid::ClearOccupant(GridPos pos) {
    occupants_.erase(pos);
}

// ── IHazardService ──────────────────────────────────────────────────────

void SquareGrid::TickRoundHazards() {
    ++roundTicks_;
    for (auto it = hazards_.begin(); it != hazards_.end();) {
        auto& spec = it->second;
        if (spec.durationRounds > 0) {
            --spec.durationRounds;
            if (spec.durationRounds == 0) {
                it = hazards_.erase(it);
                continue;
            }
        }
        ++it;
    }
}

int32_t SquareGrid::ApplyHazardDamage(Combatant& unit, GridPos cell) {
    auto hz = hazards_.find(cell);
    if (hz == hazards_.end()) {
        return 0;
    }
    auto dealt = unit.ApplyDamage(hz->second.damage);
    if (dealt > 0) {
        TBC_LOG_DEBUG(LogCategory::Combat,
                      unit.Name() + " takes " + std::to_string(dealt) + " hazard damage");
    }
    return dealt;
}

// ── Board setup ─────────────────────────────────────────────────────────

void SquareGrid::SetObstacle(GridPos pos, bool blocked) {
    if (!IsValidPosition(pos.x, pos.y)) {
        return;
    }
    if (blocked) {
        obstacles_.insert(pos);
    } else {
        obstacles_.erase(pos);
    }
}

void SquareGrid::PlaceHazard(GridPos pos, HazardSpec spec) {
    if (!IsValidPosition(pos.x, pos.y)) {
        TBC_LOG_WARN(LogCategory::Combat, "Hazard placed outside the board ignored");
        return;
    }
    auto [it, inserted] = hazards_.try_emplace(pos, spec);
    if (!inserted) {
        // Re-placing refreshes: keep the longer remaining duration.
        auto& existing = it->second;
        existing.damage = spec.damage;
        if (existing.durationRounds >= 0 &&
            (spec.durationRounds < 0 || spec.durationRounds > existing.durationRounds)) {
            existing.durationRounds = spec.durationRounds;
        }
    }
}

void SquareGrid::RemoveHazard(GridPos pos) {
    hazards_.erase(pos);
}

bool SquareGrid::PlaceCombatant(const Combatant& unit) {
    auto pos = unit.Position();
    if (!IsValidPosition(pos.x, pos.y) || obstacles_.count(pos) > 0 ||
        occupants_.count(pos) > 0) {
        TBC_LOG_WARN(LogCategory::Combat, "Cannot place " + unit.Name() + " on its cell");
        return false;
    }
    occupants_[pos] = unit.Id();
    return true;
}

// ── TimedMovementDriver ─────────────────────────────────────────────────

TimedMovementDriver::TimedMovementDriver(tbc::foundation::TimerScheduler& timers,
                                         tbc::foundation::TimerScheduler::Duration perStep)
    : timers_(timers), perStep_(perStep) {}

void TimedMovementDriver::MoveAlong(CombatantId id, std::vector<GridPos> path,
                                    std::function<void()> onArrived) {
    Cancel(id);
    auto duration = perStep_ * static_cast<int64_t>(path.size());
    auto timer = timers_.scheduleAfter(duration, [this, id, onArrived] {
        inFlight_.erase(id);
        if (onArrived) {
            onArrived();
        }
    });
    if (timer.hasError()) {
        TBC_LOG_ERROR(LogCategory::Combat,
                      "Movement timer rejected: " + std::string(timer.error().message()));
        if (onArrived) {
            onArrived();
        }
        return;
    }
    inFlight_[id] = timer.value();
}

void TimedMovementDriver::Cancel(CombatantId id) {
    auto it = inFlight_.find(id);
    if (it == inFlight_.end()) {
        return;
    }
    auto cancelled = timers_.cancel(it->second);
    if (cancelled.hasError()) {
        TBC_LOG_DEBUG(LogCategory::Combat,
                      "Movement timer already gone: " + std::string(cancelled.error().message()));
    }
    inFlight_.erase(it);
}

}  // namespace tbc::game
