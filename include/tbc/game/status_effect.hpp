#pragma once

/// @file status_effect.hpp
/// @brief Turn-based status effects: definitions, instances and the per-unit holder.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tbc::game {

class Combatant;

/// Catalogue of status effect kinds.
enum class StatusEffectType : uint8_t {
    Burn,
    Poison,
    Freeze,
    Stun,
    Slow,
    Haste,
    Regeneration,
    Shield
};

/// Number of status effect kinds.
constexpr std::size_t kStatusEffectTypeCount = 8;

std::string_view statusEffectName(StatusEffectType type);

/// Static description of an effect, shared by all of its instances.
struct StatusEffectDefinition {
    StatusEffectType type = StatusEffectType::Burn;
    std::string name;
    int32_t defaultDuration = 3;   ///< Turns, used when no duration is given.
    int32_t damagePerTurn = 0;
    int32_t healingPerTurn = 0;
    bool preventsActions = false;
    bool preventsMovement = false;
    float movementMultiplier = 1.0f;

    // Additive modifiers read while gathering combat stats (percentage points).
    float hitModifier = 0.0f;
    float critModifier = 0.0f;
    float parryModifier = 0.0f;
    float critDefenseModifier = 0.0f;

    /// Preset definition for a catalogue entry.
    [[nodiscard]] static StatusEffectDefinition Preset(StatusEffectType type);
};

/// One active effect on a unit.
///
/// The remaining duration drops by exactly one per OnTurnStart call; an
/// effect with duration d applies its per-turn damage/healing exactly d
/// times, including on the call that expires it.
class StatusEffectInstance {
public:
    StatusEffectInstance(std::shared_ptr<const StatusEffectDefinition> definition,
                         int32_t duration);

    /// Apply damage then healing to @p unit and consume one turn.
    /// No-op when already expired or when the unit is dead.
    /// @return true when the tick was applied.
    bool OnTurnStart(Combatant& unit);

    /// Extend to @p newDuration if it is longer. Never shortens.
    void Refresh(int32_t newDuration);

    [[nodiscard]] bool IsExpired() const noexcept { return remaining_ <= 0; }
    [[nodiscard]] int32_t Remaining() const noexcept { return remaining_; }
    [[nodiscard]] const StatusEffectDefinition& Definition() const noexcept { return *definition_; }
    [[nodiscard]] StatusEffectType Type() const noexcept { return definition_->type; }

private:
    std::shared_ptr<const StatusEffectDefinition> definition_;
    int32_t remaining_;
};

/// Aggregate view of every active effect on a unit.
struct StatusModifiers {
    float hit = 0.0f;
    float crit = 0.0f;
    float parry = 0.0f;
    float critDefense = 0.0f;
    float movementMultiplier = 1.0f;
    bool preventsActions = false;
    bool preventsMovement = false;
};

/// Collection of active effects on one unit; at most one instance per type.
class StatusEffectHolder {
public:
    /// Add an effect, or refresh the existing instance of the same type.
    /// A non-positive @p duration falls back to the definition's default.
    /// @return The added or refreshed instance.
    StatusEffectInstance& Apply(std::shared_ptr<const StatusEffectDefinition> definition,
                                int32_t duration = 0);

    /// Tick every effect once for the owner's turn start and drop expired ones.
    /// @return The number of effects that ticked.
    std::size_t TickTurnStart(Combatant& owner);

    /// Remove the instance of @p type if present.
    bool Remove(StatusEffectType type);

    void Clear() { effects_.clear(); }

    [[nodiscard]] bool Has(StatusEffectType type) const;
    [[nodiscard]] const StatusEffectInstance* Find(StatusEffectType type) const;

    [[nodiscard]] bool PreventsActions() const;
    [[nodiscard]] bool PreventsMovement() const;

    /// Product of all movement multipliers (1.0 when none).
    [[nodiscard]] float MovementMultiplier() const;

    /// Summed modifiers across all active effects.
    [[nodiscard]] StatusModifiers Aggregate() const;

    [[nodiscard]] const std::vector<StatusEffectInstance>& Effects() const noexcept { return effects_; }
    [[nodiscard]] std::size_t Count() const noexcept { return effects_.size(); }

private:
    std::vector<StatusEffectInstance> effects_;
};

}  // namespace tbc::game
