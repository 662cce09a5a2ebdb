/// @file battle_statistics.cpp
/// @brief BattleStatistics implementation.

#include "tbc/game/battle_statistics.hpp"

#include <string>

#include "tbc/foundation/game_logger.hpp"

namespace tbc::game {

using tbc::foundation::connectScoped;

BattleStatistics::BattleStatistics(BattleEvents& events) {
    connections_.push_back(connectScoped(
        events.attackResolved,
        [this](CombatantId attacker, CombatantId target, const CombatResolutionResult& result) {
            OnAttack(attacker, target, result);
        }));
    connections_.push_back(
        connectScoped(events.unitDefeated, [this](CombatantId id) { OnDefeated(id); }));
    connections_.push_back(connectScoped(events.skillUsed, [this](CombatantId user, SkillId) {
        ++stats_[user].skillsUsed;
    }));
    connections_.push_back(connectScoped(events.unitTurnEnded, [this](CombatantId id) {
        ++stats_[id].turnsTaken;
    }));
    connections_.push_back(
        connectScoped(events.roundStarted, [this](int32_t round) { rounds_ = round; }));
    connections_.push_back(connectScoped(events.combatEnded, [this](bool victory) {
        outcome_ = victory;
        TBC_LOG_INFO(tbc::foundation::LogCategory::Session,
                     "Battle finished after " + std::to_string(rounds_) + " round(s), " +
                         std::to_string(totalDamage_) + " total damage");
    }));
}

void BattleStatistics::OnAttack(CombatantId attacker, CombatantId target,
                                const CombatResolutionResult& result) {
    auto& dealer = stats_[attacker];
    ++dealer.attacks;
    if (!result.hit) {
        ++dealer.misses;
        return;
    }
    if (result.parried) {
        ++dealer.parried;
        return;
    }
    if (result.criticalHit && !result.criticalDefended) {
        ++dealer.criticalHits;
    }
    dealer.damageDealt += result.finalDamage;
    stats_[target].damageTaken += result.finalDamage;
    totalDamage_ += result.finalDamage;
    lastAttacker_[target] = attacker;
}

void BattleStatistics::OnDefeated(CombatantId id) {
    auto it = lastAttacker_.find(id);
    if (it != lastAttacker_.end()) {
        ++stats_[it->second].kills;
    }
}

CombatantStatistics BattleStatistics::For(CombatantId id) const {
    auto it = stats_.find(id);
    return it == stats_.end() ? CombatantStatistics{} : it->second;
}

void BattleStatistics::Reset() {
    stats_.clear();
    lastAttacker_.clear();
    rounds_ = 0;
    totalDamage_ = 0;
    outcome_.reset();
}

}  // namespace tbc::game
