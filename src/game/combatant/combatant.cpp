/// @file combatant.cpp
/// @brief Combatant implementation.

#include "tbc/game/combatant.hpp"

#include <algorithm>
#include <cmath>

namespace tbc::game {

Combatant::Combatant(CombatantId id, std::string name, Faction faction, CombatStats stats,
                     GridPos position)
    : id_(id),
      name_(std::move(name)),
      faction_(faction),
      stats_(stats),
      hp_(0),
      position_(position) {
    stats_.maxHp = std::max(stats_.maxHp, 1);
    hp_ = stats_.maxHp;
    movementRemaining_ = stats_.movementPoints;
}

float Combatant::HpPercent() const noexcept {
    return static_cast<float>(hp_) / static_cast<float>(stats_.maxHp);
}

void Combatant::SetHp(int32_t hp) {
    hp_ = std::clamp(hp, 0, stats_.maxHp);
}

int32_t Combatant::ApplyDamage(int32_t amount) {
    if (amount <= 0 || !IsAlive()) {
        return 0;
    }
    auto before = hp_;
    SetHp(hp_ - amount);
    return before - hp_;
}

int32_t Combatant::ApplyHealing(int32_t amount) {
    if (amount <= 0 || !IsAlive()) {
        return 0;
    }
    auto before = hp_;
    SetHp(hp_ + amount);
    return hp_ - before;
}

// ── Turn state ──────────────────────────────────────────────────────────

void Combatant::StartTurn() {
    hasMoved_ = false;
    hasActed_ = false;
    movementLocked_ = false;
    statusEffects_.TickTurnStart(*this);
    movementRemaining_ = EffectiveMovementBudget();
}

int32_t Combatant::EffectiveMovementBudget() const {
    if (statusEffects_.PreventsMovement()) {
        return 0;
    }
    auto scaled = static_cast<float>(stats_.movementPoints) * statusEffects_.MovementMultiplier();
    return std::max(static_cast<int32_t>(std::floor(scaled)), 0);
}

bool Combatant::CanSpendMovement(int32_t cost) const {
    if (cost < 0 || movementLocked_ || !IsAlive()) {
        return false;
    }
    if (statusEffects_.PreventsMovement()) {
        return false;
    }
    return cost <= movementRemaining_;
}

bool Combatant::SpendMovement(int32_t cost) {
    if (!CanSpendMovement(cost)) {
        return false;
    }
    movementRemaining_ -= cost;
    if (cost > 0) {
        hasMoved_ = true;
    }
    return true;
}

void Combatant::MarkActed() {
    hasActed_ = true;
    if (hasMoved_) {
        movementLocked_ = true;
        movementRemaining_ = 0;
    }
}

bool Combatant::CanAct() const {
    return IsAlive() && !hasActed_ && !statusEffects_.PreventsActions();
}

// ── Skills ──────────────────────────────────────────────────────────────

void Combatant::AddSkill(Skill skill) {
    auto it = std::find_if(skills_.begin(), skills_.end(),
                           [&](const Skill& s) { return s.id == skill.id; });
    if (it != skills_.end()) {
        *it = std::move(skill);
        return;
    }
    skills_.push_back(std::move(skill));
}

const Skill* Combatant::FindSkill(SkillId id) const {
    auto it = std::find_if(skills_.begin(), skills_.end(),
                           [id](const Skill& s) { return s.id == id; });
    return it != skills_.end() ? &*it : nullptr;
}

}  // namespace tbc::game
