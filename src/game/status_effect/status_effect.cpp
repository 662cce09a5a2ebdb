/// @file status_effect.cpp
/// @brief Status effect presets, per-turn ticking and aggregation.

#include "tbc/game/status_effect.hpp"

#include <algorithm>
#include <array>
#include <string>

#include "tbc/foundation/game_logger.hpp"
#include "tbc/game/combatant.hpp"

namespace tbc::game {

using tbc::foundation::LogCategory;
using tbc::foundation::LogContext;
using tbc::foundation::LogLevel;

std::string_view statusEffectName(StatusEffectType type) {
    constexpr std::array<std::string_view, kStatusEffectTypeCount> names = {
        "Burn", "Poison", "Freeze", "Stun", "Slow", "Haste", "Regeneration", "Shield"
    };
    auto idx = static_cast<std::size_t>(type);
    return idx < kStatusEffectTypeCount ? names[idx] : "Unknown";
}

// ── Presets ─────────────────────────────────────────────────────────────

// Durations count the victim's turn starts, and the expiring tick lands before
// the victim acts. Control effects therefore need one more turn than they block.
StatusEffectDefinition StatusEffectDefinition::Preset(StatusEffectType type) {
    StatusEffectDefinition def;
    def.type = type;
    def.name = std::string(statusEffectName(type));
    switch (type) {
        case StatusEffectType::Burn:
            def.damagePerTurn = 5;
            def.defaultDuration = 3;
            break;
        case StatusEffectType::Poison:
            def.damagePerTurn = 3;
            def.defaultDuration = 4;
            break;
        case StatusEffectType::Freeze:
            def.preventsMovement = true;
            def.movementMultiplier = 0.0f;
            def.parryModifier = -5.0f;
            def.defaultDuration = 3;
            break;
        case StatusEffectType::Stun:
            def.preventsActions = true;
            def.defaultDuration = 2;
            break;
        case StatusEffectType::Slow:
            def.movementMultiplier = 0.5f;
            def.defaultDuration = 2;
            break;
        case StatusEffectType::Haste:
            def.movementMultiplier = 1.5f;
            def.hitModifier = 5.0f;
            def.defaultDuration = 2;
            break;
        case StatusEffectType::Regeneration:
            def.healingPerTurn = 5;
            def.defaultDuration = 3;
            break;
        case StatusEffectType::Shield:
            def.parryModifier = 10.0f;
            def.critDefenseModifier = 20.0f;
            def.defaultDuration = 2;
            break;
    }
    return def;
}

// ── StatusEffectInstance ────────────────────────────────────────────────

StatusEffectInstance::StatusEffectInstance(
    std::shared_ptr<const StatusEffectDefinition> definition, int32_t duration)
    : definition_(std::move(definition)), remaining_(std::max(duration, 0)) {}

bool StatusEffectInstance::OnTurnStart(Combatant& unit) {
    if (IsExpired() || !unit.IsAlive()) {
        return false;
    }

    if (definition_->damagePerTurn > 0) {
        auto dealt = unit.ApplyDamage(definition_->damagePerTurn);
        LogContext ctx;
        ctx.combatantId = unit.Id();
        ctx.extra["effect"] = definition_->name;
        ctx.extra["damage"] = std::to_string(dealt);
        tbc::foundation::GameLogger::instance().logWithContext(
            LogLevel::Debug, LogCategory::Status, "Status damage applied", ctx);
    }
    // A unit killed by the damage above receives no healing.
    if (definition_->healingPerTurn > 0 && unit.IsAlive()) {
        auto healed = unit.ApplyHealing(definition_->healingPerTurn);
        LogContext ctx;
        ctx.combatantId = unit.Id();
        ctx.extra["effect"] = definition_->name;
        ctx.extra["healing"] = std::to_string(healed);
        tbc::foundation::GameLogger::instance().logWithContext(
            LogLevel::Debug, LogCategory::Status, "Status healing applied", ctx);
    }

    --remaining_;
    return true;
}

void StatusEffectInstance::Refresh(int32_t newDuration) {
    remaining_ = std::max(remaining_, newDuration);
}

// ── StatusEffectHolder ──────────────────────────────────────────────────

StatusEffectInstance& StatusEffectHolder::Apply(
    std::shared_ptr<const StatusEffectDefinition> definition, int32_t duration) {
    if (duration <= 0) {
        duration = definition->defaultDuration;
    }
    for (auto& existing : effects_) {
        if (existing.Type() == definition->type) {
            existing.Refresh(duration);
            return existing;
        }
    }
    effects_.emplace_back(std::move(definition), duration);
    return effects_.back();
}

std::size_t StatusEffectHolder::TickTurnStart(Combatant& owner) {
    std::size_t ticked = 0;
    for (auto& effect : effects_) {
        if (effect.OnTurnStart(owner)) {
            ++ticked;
        }
    }
    std::erase_if(effects_, [](const StatusEffectInstance& e) { return e.IsExpired(); });
    return ticked;
}

bool StatusEffectHolder::Remove(StatusEffectType type) {
    auto removed = std::erase_if(effects_, [type](const StatusEffectInstance& e) {
        return e.Type() == type;
    });
    return removed > 0;
}

bool StatusEffectHolder::Has(StatusEffectType type) const {
    return Find(type) != nullptr;
}

const StatusEffectInstance* StatusEffectHolder::Find(StatusEffectType type) const {
    auto it = std::find_if(effects_.begin(), effects_.end(),
                           [type](const StatusEffectInstance& e) { return e.Type() == type; });
    return it != effects_.end() ? &*it : nullptr;
}

bool StatusEffectHolder::PreventsActions() const {
    return std::any_of(effects_.begin(), effects_.end(), [](const StatusEffectInstance& e) {
        return e.Definition().preventsActions;
    });
}

bool StatusEffectHolder::PreventsMovement() const {
    return std::any_of(effects_.begin(), effects_.end(), [](const StatusEffectInstance& e) {
        return e.Definition().preventsMovement;
    });
}

float StatusEffectHolder::MovementMultiplier() const {
    float multiplier = 1.0f;
    for (const auto& e : effects_) {
        multiplier *= e.Definition().movementMultiplier;
    }
    return multiplier;
}

StatusModifiers StatusEffectHolder::Aggregate() const {
    StatusModifiers mods;
    for (const auto& e : effects_) {
        const auto& def = e.Definition();
        mods.hit += def.hitModifier;
        mods.crit += def.critModifier;
        mods.parry += def.parryModifier;
        mods.critDefense += def.critDefenseModifier;
        mods.movementMultiplier *= def.movementMultiplier;
        mods.preventsActions = mods.preventsActions || def.preventsActions;
        mods.preventsMovement = mods.preventsMovement || def.preventsMovement;
    }
    return mods;
}

}  // namespace tbc::game
