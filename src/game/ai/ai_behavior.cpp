/// @file ai_behavior.cpp
/// @brief Target, action and movement scoring of the AI behaviors.

#include "tbc/game/ai_behavior.hpp"

#include <array>
#include <limits>

namespace tbc::game {

namespace {

// ── Shared scoring ──────────────────────────────────────────────────────

constexpr float kHazardPenalty = 1000.0f;

bool IsEnemy(const AIContext& ctx, const Combatant& unit) {
    return &unit != &ctx.self && unit.IsAlive() &&
           ctx.factions.AreHostile(ctx.self.GetFaction(), unit.GetFaction());
}

bool IsAlly(const AIContext& ctx, const Combatant& unit) {
    return &unit != &ctx.self && unit.IsAlive() &&
           ctx.factions.AreAllied(ctx.self.GetFaction(), unit.GetFaction());
}

std::vector<const Combatant*> Enemies(const AIContext& ctx) {
    std::vector<const Combatant*> out;
    for (const auto* unit : ctx.units) {
        if (unit != nullptr && IsEnemy(ctx, *unit)) {
            out.push_back(unit);
        }
    }
    return out;
}

std::vector<const Combatant*> Allies(const AIContext& ctx) {
    std::vector<const Combatant*> out;
    for (const auto* unit : ctx.units) {
        if (unit != nullptr && IsAlly(ctx, *unit)) {
            out.push_back(unit);
        }
    }
    return out;
}

bool HasHazard(const AIContext& ctx, GridPos cell) {
    if (ctx.grid == nullptr) {
        return false;
    }
    auto info = ctx.grid->CellAt(cell.x, cell.y);
    return info && info->hasHazard;
}

/// Missing HP is attractive, distance is not.
float BaseTargetScore(const AIContext& ctx, const Combatant& target) {
    auto distance = ManhattanDistance(ctx.self.Position(), target.Position());
    return (1.0f - target.HpPercent()) * 100.0f - static_cast<float>(distance) * 10.0f;
}

/// Avoid hazards, approach the target, strongly prefer ending adjacent.
float BaseMoveScore(const AIContext& ctx, GridPos cell, const Combatant& target) {
    float score = 0.0f;
    if (HasHazard(ctx, cell)) {
        score -= kHazardPenalty;
    }
    score -= static_cast<float>(ManhattanDistance(cell, target.Position())) * 10.0f;
    if (ChebyshevDistance(cell, target.Position()) == 1) {
        score += 100.0f;
    }
    return score;
}

/// First damage skill usable at @p distance that suits the archetype.
const Skill* FindDamageSkill(const Combatant& self, int32_t distance, bool meleeOnly) {
    for (const auto& skill : self.Skills()) {
        if (skill.IsSupport() || !IsSkillSuitableForArchetype(skill, self.Archetype())) {
            continue;
        }
        if (meleeOnly ? skill.IsMeleeRange() : skill.range >= distance) {
            return &skill;
        }
    }
    return nullptr;
}

const Skill* FindSupportSkill(const Combatant& self) {
    for (const auto& skill : self.Skills()) {
        if (skill.IsSupport()) {
            return &skill;
        }
    }
    return nullptr;
}

AIActionChoice Choice(AIActionKind kind, const Skill* skill = nullptr) {
    AIActionChoice choice;
    choice.kind = kind;
    if (skill != nullptr) {
        choice.skill = skill->id;
    }
    return choice;
}

/// Highest-scoring candidate; the first one wins ties.
template <typename Score>
const Combatant* PickBest(const std::vector<const Combatant*>& candidates, Score score) {
    const Combatant* best = nullptr;
    float bestScore = std::numeric_limits<float>::lowest();
    for (const auto* unit : candidates) {
        auto value = score(*unit);
        if (best == nullptr || value > bestScore) {
            best = unit;
            bestScore = value;
        }
    }
    return best;
}

}  // namespace

// ── Names and defaults ──────────────────────────────────────────────────

std::string_view aiActionName(AIActionKind kind) {
    switch (kind) {
        case AIActionKind::MeleeAttack: return "MeleeAttack";
        case AIActionKind::RangedSkill: return "RangedSkill";
        case AIActionKind::Support:     return "Support";
        case AIActionKind::Move:        return "Move";
        case AIActionKind::Wait:        return "Wait";
    }
    return "Unknown";
}

std::string_view aiBehaviorName(AIBehaviorKind kind) {
    switch (kind) {
        case AIBehaviorKind::Berserker: return "Berserker";
        case AIBehaviorKind::Support:   return "Support";
        case AIBehaviorKind::Coward:    return "Coward";
        case AIBehaviorKind::Protector: return "Protector";
    }
    return "Unknown";
}

std::optional<AIBehaviorKind> parseAIBehavior(std::string_view name) {
    constexpr std::array<AIBehaviorKind, 4> kinds = {
        AIBehaviorKind::Berserker, AIBehaviorKind::Support,
        AIBehaviorKind::Coward, AIBehaviorKind::Protector};
    for (auto kind : kinds) {
        if (aiBehaviorName(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

AIBehaviorConfig AIBehaviorConfig::ForKind(AIBehaviorKind kind) {
    AIBehaviorConfig config;
    switch (kind) {
        case AIBehaviorKind::Berserker:
            break;
        case AIBehaviorKind::Support:
            config.supportPreference = 0.5f;
            config.hazardAvoidance = 0.8f;
            config.aggression = 0.3f;
            break;
        case AIBehaviorKind::Coward:
            config.hazardAvoidance = 0.9f;
            config.aggression = 0.2f;
            break;
        case AIBehaviorKind::Protector:
            config.hazardAvoidance = 0.6f;
            config.aggression = 0.5f;
            break;
    }
    return config;
}

// ── Berserker ───────────────────────────────────────────────────────────

const Combatant* BerserkerBehavior::ChooseTarget(const AIContext& ctx) const {
    return PickBest(Enemies(ctx), [&](const Combatant& enemy) {
        auto distance = static_cast<float>(ManhattanDistance(ctx.self.Position(), enemy.Position()));
        return BaseTargetScore(ctx, enemy) +
               (1.0f - enemy.HpPercent()) * 100.0f * config.lowHpWeight -
               distance * 10.0f * (1.0f - config.proximityWeight);
    });
}

AIActionChoice BerserkerBehavior::ChooseAction(const AIContext& ctx,
                                               const Combatant& target) const {
    if (!target.IsAlive()) {
        return Choice(AIActionKind::Wait);
    }
    if (ChebyshevDistance(ctx.self.Position(), target.Position()) != 1) {
        return Choice(AIActionKind::Move);
    }
    if (!ctx.self.Skills().empty() && ctx.rng.chance() < config.skillPreference) {
        if (const auto* skill = FindDamageSkill(ctx.self, 1, true)) {
            return Choice(AIActionKind::RangedSkill, skill);
        }
    }
    return Choice(AIActionKind::MeleeAttack);
}

float BerserkerBehavior::ScoreMove(const AIContext& ctx, GridPos cell,
                                   const Combatant& target) const {
    auto score = BaseMoveScore(ctx, cell, target);
    if (HasHazard(ctx, cell)) {
        score -= kHazardPenalty * (1.0f - config.hazardAvoidance);
    }
    if (ChebyshevDistance(cell, target.Position()) == 1) {
        score += 100.0f * config.aggression;
    }
    return score;
}

// ── Support ─────────────────────────────────────────────────────────────

const Combatant* SupportBehavior::ChooseTarget(const AIContext& ctx) const {
    auto allies = Allies(ctx);
    if (!allies.empty() && ctx.rng.chance() < config.supportPreference) {
        const Combatant* neediest = nullptr;
        for (const auto* ally : allies) {
            if (ally->HpPercent() < 0.8f &&
                (neediest == nullptr || ally->HpPercent() < neediest->HpPercent())) {
                neediest = ally;
            }
        }
        if (neediest != nullptr) {
            return neediest;
        }
    }

    return PickBest(Enemies(ctx), [&](const Combatant& enemy) {
        auto distance = static_cast<float>(ManhattanDistance(ctx.self.Position(), enemy.Position()));
        return BaseTargetScore(ctx, enemy) + (1.0f - enemy.HpPercent()) * 150.0f +
               distance * 5.0f;
    });
}

AIActionChoice SupportBehavior::ChooseAction(const AIContext& ctx, const Combatant& target) const {
    if (!target.IsAlive()) {
        return Choice(AIActionKind::Wait);
    }
    if (!ctx.factions.AreHostile(ctx.self.GetFaction(), target.GetFaction())) {
        if (const auto* skill = FindSupportSkill(ctx.self)) {
            return Choice(AIActionKind::Support, skill);
        }
        return Choice(AIActionKind::Wait);
    }

    auto distance = ChebyshevDistance(ctx.self.Position(), target.Position());
    if (distance == 1) {
        return Choice(AIActionKind::MeleeAttack);
    }
    if (distance <= 3) {
        if (const auto* skill = FindDamageSkill(ctx.self, distance, false)) {
            return Choice(AIActionKind::RangedSkill, skill);
        }
    }
    return Choice(AIActionKind::Move);
}

float SupportBehavior::ScoreMove(const AIContext& ctx, GridPos cell,
                                 const Combatant& target) const {
    auto score = BaseMoveScore(ctx, cell, target);
    if (HasHazard(ctx, cell)) {
        score -= kHazardPenalty * config.hazardAvoidance;
    }
    auto distance = ChebyshevDistance(cell, target.Position());
    if (!ctx.factions.AreHostile(ctx.self.GetFaction(), target.GetFaction())) {
        if (distance <= 2) {
            score += 50.0f;
        }
    } else if (distance >= 2 && distance <= 3) {
        score += 30.0f;
    } else if (distance == 1) {
        score -= 20.0f;
    }
    return score;
}

// ── Coward ──────────────────────────────────────────────────────────────

const Combatant* CowardBehavior::ChooseTarget(const AIContext& ctx) const {
    bool retreating = ctx.self.HpPercent() < config.retreatThreshold;
    return PickBest(Enemies(ctx), [&](const Combatant& enemy) {
        auto distance = static_cast<float>(ManhattanDistance(ctx.self.Position(), enemy.Position()));
        auto score = BaseTargetScore(ctx, enemy) + (1.0f - enemy.HpPercent()) * 120.0f +
                     distance * 15.0f;
        if (retreating && enemy.HpPercent() > 0.5f) {
            score -= 200.0f;
        }
        return score;
    });
}

AIActionChoice CowardBehavior::ChooseAction(const AIContext& ctx, const Combatant& target) const {
    if (!target.IsAlive()) {
        return Choice(AIActionKind::Wait);
    }
    auto distance = ChebyshevDistance(ctx.self.Position(), target.Position());
    bool retreating = ctx.self.HpPercent() < config.retreatThreshold;

    if (distance == 1) {
        if (!retreating && ctx.self.HpPercent() > 0.6f) {
            return Choice(AIActionKind::MeleeAttack);
        }
        return Choice(AIActionKind::Move);
    }
    if (distance <= 3) {
        if (const auto* skill = FindDamageSkill(ctx.self, distance, false)) {
            return Choice(AIActionKind::RangedSkill, skill);
        }
    }
    return Choice(retreating ? AIActionKind::Wait : AIActionKind::Move);
}

float CowardBehavior::ScoreMove(const AIContext& ctx, GridPos cell, const Combatant& target) const {
    float score = 0.0f;
    if (HasHazard(ctx, cell)) {
        score -= kHazardPenalty * config.hazardAvoidance;
    }
    if (!target.IsAlive()) {
        return score + 10.0f;
    }
    auto distance = ChebyshevDistance(cell, target.Position());
    if (ctx.self.HpPercent() < config.retreatThreshold) {
        score += static_cast<float>(distance) * 50.0f - 100.0f;
    } else if (distance >= 2 && distance <= 3) {
        score += 40.0f;
    } else if (distance == 1) {
        score -= 50.0f;
    } else if (distance > 3) {
        score -= 20.0f;
    }
    return score;
}

// ── Protector ───────────────────────────────────────────────────────────

const Combatant* ProtectorBehavior::ChooseTarget(const AIContext& ctx) const {
    auto allies = Allies(ctx);
    auto enemies = Enemies(ctx);

    const Combatant* endangered = nullptr;
    float highestThreat = 0.0f;
    for (const auto* ally : allies) {
        int nearby = 0;
        for (const auto* enemy : enemies) {
            if (ManhattanDistance(ally->Position(), enemy->Position()) <= 2) {
                ++nearby;
            }
        }
        auto threat = (1.0f - ally->HpPercent()) * 100.0f + static_cast<float>(nearby) * 50.0f;
        if (threat > highestThreat && (ally->HpPercent() < 0.7f || nearby > 0)) {
            highestThreat = threat;
            endangered = ally;
        }
    }
    if (endangered != nullptr) {
        const Combatant* closest = nullptr;
        int32_t closestDistance = std::numeric_limits<int32_t>::max();
        for (const auto* enemy : enemies) {
            auto distance = ManhattanDistance(endangered->Position(), enemy->Position());
            if (distance <= 2 && distance < closestDistance) {
                closestDistance = distance;
                closest = enemy;
            }
        }
        if (closest != nullptr) {
            return closest;
        }
    }

    return PickBest(enemies, [&](const Combatant& enemy) {
        auto distance = static_cast<float>(ManhattanDistance(ctx.self.Position(), enemy.Position()));
        int guarded = 0;
        for (const auto* ally : allies) {
            if (ManhattanDistance(enemy.Position(), ally->Position()) <= 2) {
                ++guarded;
            }
        }
        return BaseTargetScore(ctx, enemy) - distance * 15.0f + static_cast<float>(guarded) * 30.0f;
    });
}

AIActionChoice ProtectorBehavior::ChooseAction(const AIContext& ctx,
                                               const Combatant& target) const {
    if (!target.IsAlive()) {
        return Choice(AIActionKind::Wait);
    }
    if (ChebyshevDistance(ctx.self.Position(), target.Position()) != 1) {
        return Choice(AIActionKind::Move);
    }
    if (const auto* skill = FindDamageSkill(ctx.self, 1, true)) {
        if (ctx.rng.chance() < config.skillPreference) {
            return Choice(AIActionKind::RangedSkill, skill);
        }
    }
    return Choice(AIActionKind::MeleeAttack);
}

float ProtectorBehavior::ScoreMove(const AIContext& ctx, GridPos cell,
                                   const Combatant& target) const {
    auto score = BaseMoveScore(ctx, cell, target);
    if (HasHazard(ctx, cell)) {
        score -= kHazardPenalty * config.hazardAvoidance;
    }
    auto distance = ChebyshevDistance(cell, target.Position());
    if (distance == 1) {
        score += 150.0f;
    } else {
        score -= static_cast<float>(distance) * 10.0f;
    }
    return score;
}

// ── AIBehavior ──────────────────────────────────────────────────────────

AIBehavior AIBehavior::Make(AIBehaviorKind kind) {
    return Make(kind, AIBehaviorConfig::ForKind(kind));
}

AIBehavior AIBehavior::Make(AIBehaviorKind kind, AIBehaviorConfig config) {
    switch (kind) {
        case AIBehaviorKind::Support:
            return AIBehavior(SupportBehavior{config});
        case AIBehaviorKind::Coward:
            return AIBehavior(CowardBehavior{config});
        case AIBehaviorKind::Protector:
            return AIBehavior(ProtectorBehavior{config});
        case AIBehaviorKind::Berserker:
            break;
    }
    return AIBehavior(BerserkerBehavior{config});
}

AIBehaviorKind AIBehavior::Kind() const noexcept {
    return static_cast<AIBehaviorKind>(behavior_.index());
}

const AIBehaviorConfig& AIBehavior::Config() const {
    return std::visit([](const auto& b) -> const AIBehaviorConfig& { return b.config; },
                      behavior_);
}

const Combatant* AIBehavior::ChooseTarget(const AIContext& ctx) const {
    return std::visit([&](const auto& b) { return b.ChooseTarget(ctx); }, behavior_);
}

AIActionChoice AIBehavior::ChooseAction(const AIContext& ctx, const Combatant& target) const {
    return std::visit([&](const auto& b) { return b.ChooseAction(ctx, target); }, behavior_);
}

std::optional<GridPos> AIBehavior::EvaluateBestMove(const AIContext& ctx, const Combatant& target,
                                                    const std::vector<GridPos>& reachable) const {
    return std::visit(
        [&](const auto& b) -> std::optional<GridPos> {
            auto current = ctx.self.Position();
            auto bestScore = b.ScoreMove(ctx, current, target);
            std::optional<GridPos> best;
            for (auto cell : reachable) {
                if (cell == current) {
                    continue;
                }
                auto score = b.ScoreMove(ctx, cell, target);
                if (score > bestScore) {
                    bestScore = score;
                    best = cell;
                }
            }
            return best;
        },
        behavior_);
}

}  // namespace tbc::game
