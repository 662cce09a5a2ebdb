#pragma once

/// @file ai_behavior.hpp
/// @brief Strategy-selectable AI behaviors held in a tagged variant.

#include <optional>
#include <variant>
#include <vector>

#include "tbc/foundation/random_source.hpp"
#include "tbc/game/ai_types.hpp"
#include "tbc/game/battle_services.hpp"
#include "tbc/game/combatant.hpp"
#include "tbc/game/faction_relationship_resolver.hpp"

namespace tbc::game {

/// Read-only view of the battle handed to a behavior for one decision.
struct AIContext {
    const Combatant& self;
    const std::vector<const Combatant*>& units;
    const FactionRelationshipResolver& factions;
    const IGridService* grid;
    tbc::foundation::RandomSource& rng;
};

/// Closes in on the weakest nearby enemy and attacks relentlessly.
struct BerserkerBehavior {
    AIBehaviorConfig config = AIBehaviorConfig::ForKind(AIBehaviorKind::Berserker);

    const Combatant* ChooseTarget(const AIContext& ctx) const;
    AIActionChoice ChooseAction(const AIContext& ctx, const Combatant& target) const;
    float ScoreMove(const AIContext& ctx, GridPos cell, const Combatant& target) const;
};

/// Heals wounded allies, otherwise harasses from a distance.
struct SupportBehavior {
    AIBehaviorConfig config = AIBehaviorConfig::ForKind(AIBehaviorKind::Support);

    const Combatant* ChooseTarget(const AIContext& ctx) const;
    AIActionChoice ChooseAction(const AIContext& ctx, const Combatant& target) const;
    float ScoreMove(const AIContext& ctx, GridPos cell, const Combatant& target) const;
};

/// Keeps its distance and retreats once badly hurt.
struct CowardBehavior {
    AIBehaviorConfig config = AIBehaviorConfig::ForKind(AIBehaviorKind::Coward);

    const Combatant* ChooseTarget(const AIContext& ctx) const;
    AIActionChoice ChooseAction(const AIContext& ctx, const Combatant& target) const;
    float ScoreMove(const AIContext& ctx, GridPos cell, const Combatant& target) const;
};

/// Intercepts enemies threatening endangered allies.
struct ProtectorBehavior {
    AIBehaviorConfig config = AIBehaviorConfig::ForKind(AIBehaviorKind::Protector);

    const Combatant* ChooseTarget(const AIContext& ctx) const;
    AIActionChoice ChooseAction(const AIContext& ctx, const Combatant& target) const;
    float ScoreMove(const AIContext& ctx, GridPos cell, const Combatant& target) const;
};

/// One AI strategy, dispatched through ChooseTarget / ChooseAction /
/// EvaluateBestMove.
///
/// Example:
/// @code
///   AIBehavior behavior = AIBehavior::Make(AIBehaviorKind::Coward);
///   AIContext ctx{self, units, factions, &grid, rng};
///   if (const auto* target = behavior.ChooseTarget(ctx)) {
///       auto action = behavior.ChooseAction(ctx, *target);
///       auto cell = behavior.EvaluateBestMove(ctx, *target, grid.ReachableCells(self, 4));
///   }
/// @endcode
class AIBehavior {
public:
    using Variant = std::variant<BerserkerBehavior, SupportBehavior, CowardBehavior,
                                 ProtectorBehavior>;

    AIBehavior() = default;
    AIBehavior(Variant behavior) : behavior_(std::move(behavior)) {}

    /// Behavior of @p kind with its default weights.
    static AIBehavior Make(AIBehaviorKind kind);

    /// Behavior of @p kind with custom weights.
    static AIBehavior Make(AIBehaviorKind kind, AIBehaviorConfig config);

    [[nodiscard]] AIBehaviorKind Kind() const noexcept;
    [[nodiscard]] const AIBehaviorConfig& Config() const;

    /// Best target among ctx.units, or nullptr when nothing is worth acting on.
    [[nodiscard]] const Combatant* ChooseTarget(const AIContext& ctx) const;

    [[nodiscard]] AIActionChoice ChooseAction(const AIContext& ctx, const Combatant& target) const;

    /// Best cell among the current one and @p reachable. Returns nullopt
    /// when staying put scores at least as well as any move.
    [[nodiscard]] std::optional<GridPos> EvaluateBestMove(const AIContext& ctx,
                                                          const Combatant& target,
                                                          const std::vector<GridPos>& reachable) const;

private:
    Variant behavior_;
};

}  // namespace tbc::game
