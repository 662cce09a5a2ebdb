#pragma once

/// @file grid_types.hpp
/// @brief Integer grid coordinates, cells and distance helpers.

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <optional>

#include "tbc/foundation/types.hpp"

namespace tbc::game {

/// Integer cell coordinate on the battle grid.
struct GridPos {
    int32_t x = 0;
    int32_t y = 0;

    constexpr bool operator==(const GridPos&) const = default;
};

/// max(|dx|, |dy|): adjacency and reach allow diagonals.
constexpr int32_t ChebyshevDistance(GridPos a, GridPos b) {
    auto dx = a.x > b.x ? a.x - b.x : b.x - a.x;
    auto dy = a.y > b.y ? a.y - b.y : b.y - a.y;
    return dx > dy ? dx : dy;
}

/// |dx| + |dy|, used by AI scoring.
constexpr int32_t ManhattanDistance(GridPos a, GridPos b) {
    auto dx = a.x > b.x ? a.x - b.x : b.x - a.x;
    auto dy = a.y > b.y ? a.y - b.y : b.y - a.y;
    return dx + dy;
}

/// Snapshot of one grid cell as reported by the grid service.
struct GridCell {
    GridPos pos;
    bool walkable = true;
    std::optional<tbc::foundation::CombatantId> occupant;
    bool hasHazard = false;
    int32_t hazardDamage = 0;  ///< Damage dealt to an occupant when a hazard fires.
};

}  // namespace tbc::game

template <>
struct std::hash<tbc::game::GridPos> {
    std::size_t operator()(const tbc::game::GridPos& p) const noexcept {
        return std::hash<int64_t>{}((static_cast<int64_t>(p.x) << 32) ^
                                    static_cast<uint32_t>(p.y));
    }
};
