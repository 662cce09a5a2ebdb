/// @file turn_order_engine.cpp
/// @brief TurnOrderEngine implementation.

#include "tbc/game/turn_order_engine.hpp"

#include <algorithm>
#include <string>

#include "tbc/foundation/game_logger.hpp"

namespace tbc::game {

using tbc::foundation::ErrorCode;
using tbc::foundation::GameLogger;
using tbc::foundation::GameResult;
using tbc::foundation::LogCategory;
using tbc::foundation::LogContext;
using tbc::foundation::LogLevel;
using tbc::foundation::makeError;

std::string_view engineStateName(EngineState state) {
    switch (state) {
        case EngineState::NotStarted:   return "NotStarted";
        case EngineState::WindowActive: return "WindowActive";
        case EngineState::CombatOver:   return "CombatOver";
    }
    return "Unknown";
}

TurnOrderEngine::TurnOrderEngine(CombatantRoster& roster,
                                 const FactionRelationshipResolver& factions,
                                 IHazardService* hazards)
    : roster_(roster), factions_(factions), hazards_(hazards) {}

bool TurnOrderEngine::ActsBefore(const Combatant& a, const Combatant& b) const {
    if (a.Stats().speed != b.Stats().speed) {
        return a.Stats().speed > b.Stats().speed;
    }
    return a.IsPlayerControlled() && !b.IsPlayerControlled();
}

// ── Lifecycle ───────────────────────────────────────────────────────────

GameResult<void> TurnOrderEngine::Initialize(const std::vector<CombatantId>& units,
                                             EncounterConfiguration config) {
    if (aiDriver_ != nullptr) {
        aiDriver_->CancelAll();
    }
    order_.clear();
    window_.clear();
    windowFaction_.reset();
    outcome_.reset();
    state_ = EngineState::NotStarted;
    config_ = config;
    cursor_ = 0;
    roundEnd_ = 0;
    round_ = 1;
    lastHazardRound_ = 1;

    for (auto id : units) {
        if (!roster_.Contains(id)) {
            TBC_LOG_WARN(LogCategory::Turn,
                         "Skipping unknown combatant " + std::to_string(id.value()));
            continue;
        }
        if (IndexOf(id)) {
            continue;
        }
        order_.push_back(id);
    }
    if (order_.empty()) {
        TBC_LOG_WARN(LogCategory::Turn, "Initialize called without any combatants");
        return GameResult<void>::err(
            tbc::foundation::GameError(ErrorCode::EmptyRoster, "no combatants to order"));
    }

    std::stable_sort(order_.begin(), order_.end(), [this](CombatantId a, CombatantId b) {
        return ActsBefore(*roster_.Find(a), *roster_.Find(b));
    });

    roundEnd_ = order_.size();
    state_ = EngineState::WindowActive;

    TBC_LOG_INFO(LogCategory::Turn,
                 "Combat initialized with " + std::to_string(order_.size()) + " units (" +
                     std::string(victoryConditionName(config_.condition)) + ")");
    events_.roundStarted.emit(round_);
    AdvanceToNextWindow();
    return GameResult<void>::ok();
}

GameResult<void> TurnOrderEngine::RegisterUnit(CombatantId id) {
    const auto* unit = roster_.Find(id);
    if (unit == nullptr) {
        return GameResult<void>::err(tbc::foundation::GameError(
            ErrorCode::UnitNotFound, "cannot register unknown combatant", id));
    }
    if (state_ == EngineState::NotStarted) {
        return makeError<void>(ErrorCode::CombatNotRunning, "combat has not been initialized");
    }
    if (state_ == EngineState::CombatOver) {
        return makeError<void>(ErrorCode::CombatOver, "combat is already over");
    }
    if (IndexOf(id)) {
        TBC_LOG_WARN(LogCategory::Turn, unit->Name() + " is already registered");
        return GameResult<void>::ok();
    }

    // Slot among the units still due this round, after the active block.
    auto pos = cursor_;
    while (pos < roundEnd_) {
        const auto* other = roster_.Find(order_[pos]);
        if (other == nullptr || !windowFaction_ || other->GetFaction() != *windowFaction_) {
            break;
        }
        ++pos;
    }
    while (pos < roundEnd_) {
        const auto* other = roster_.Find(order_[pos]);
        if (other != nullptr && ActsBefore(*unit, *other)) {
            break;
        }
        ++pos;
    }
    order_.insert(order_.begin() + static_cast<std::ptrdiff_t>(pos), id);
    ++roundEnd_;

    TBC_LOG_INFO(LogCategory::Turn, unit->Name() + " joined the battle at slot " +
                                        std::to_string(pos));
    if (window_.empty()) {
        AdvanceToNextWindow();
    }
    return GameResult<void>::ok();
}

GameResult<void> TurnOrderEngine::UnregisterUnit(CombatantId id) {
    auto index = IndexOf(id);
    if (!index) {
        return GameResult<void>::err(tbc::foundation::GameError(
            ErrorCode::UnitNotFound, "combatant is not in the turn order", id));
    }
    EraseAt(*index);
    bool wasInWindow = RemoveFromWindow(id);
    TBC_LOG_INFO(LogCategory::Turn, "Combatant " + std::to_string(id.value()) + " left the battle");

    if (state_ != EngineState::WindowActive) {
        return GameResult<void>::ok();
    }
    if (EvaluateVictory()) {
        return GameResult<void>::ok();
    }
    if (wasInWindow) {
        ContinueAfterWindowChange();
    }
    return GameResult<void>::ok();
}

GameResult<void> TurnOrderEngine::EndTurn(CombatantId id) {
    if (state_ == EngineState::CombatOver) {
        return makeError<void>(ErrorCode::CombatOver, "combat is already over");
    }
    if (state_ != EngineState::WindowActive) {
        return makeError<void>(ErrorCode::CombatNotRunning, "combat has not been initialized");
    }
    if (!IsUnitInCurrentWindow(id)) {
        TBC_LOG_WARN(LogCategory::Turn, "EndTurn for combatant " + std::to_string(id.value()) +
                                            " outside the current window");
        return GameResult<void>::err(tbc::foundation::GameError(
            ErrorCode::NotInTurnWindow, "unit is not in the current turn window", id));
    }

    auto* unit = roster_.Find(id);
    if (unit != nullptr && unit->IsAlive() && hazards_ != nullptr) {
        auto oldHp = unit->Hp();
        if (hazards_->ApplyHazardDamage(*unit, unit->Position()) > 0) {
            EmitHpChange(*unit, oldHp);
            if (!unit->IsAlive()) {
                TBC_LOG_INFO(LogCategory::Turn, unit->Name() + " was killed by a hazard");
                events_.unitDefeated.emit(id);
            }
        }
    }

    if (auto index = IndexOf(id)) {
        EraseAt(*index);
        order_.push_back(id);
    }
    RemoveFromWindow(id);

    if (unit != nullptr) {
        LogContext ctx;
        ctx.combatantId = id;
        ctx.round = round_;
        GameLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Turn,
                                              unit->Name() + " ended turn", ctx);
    }
    events_.unitTurnEnded.emit(id);

    if (state_ != EngineState::WindowActive || EvaluateVictory()) {
        return GameResult<void>::ok();
    }
    ContinueAfterWindowChange();
    return GameResult<void>::ok();
}

void TurnOrderEngine::OnCombatantHpChanged(CombatantId id, int32_t oldHp) {
    const auto* unit = roster_.Find(id);
    if (unit == nullptr) {
        return;
    }
    EmitHpChange(*unit, oldHp);
    if (unit->IsAlive() || oldHp <= 0) {
        return;
    }

    TBC_LOG_INFO(LogCategory::Turn, unit->Name() + " was defeated");
    events_.unitDefeated.emit(id);
    if (state_ != EngineState::WindowActive) {
        return;
    }
    bool wasInWindow = RemoveFromWindow(id);
    if (EvaluateVictory()) {
        return;
    }
    if (wasInWindow) {
        ContinueAfterWindowChange();
    }
}

bool TurnOrderEngine::IsCombatOver() {
    return EvaluateVictory();
}

bool TurnOrderEngine::IsUnitInCurrentWindow(CombatantId id) const {
    return std::find(window_.begin(), window_.end(), id) != window_.end();
}

// ── Windows ─────────────────────────────────────────────────────────────

void TurnOrderEngine::AdvanceToNextWindow() {
    window_.clear();
    windowFaction_.reset();
    while (state_ == EngineState::WindowActive) {
        if (EvaluateVictory()) {
            return;
        }
        if (cursor_ >= roundEnd_) {
            StartNextRound();
            continue;
        }
        const auto* head = roster_.Find(order_[cursor_]);
        if (head == nullptr || !head->IsAlive()) {
            ++cursor_;
            continue;
        }
        BuildWindow();
        StartWindowTurns();
        if (!window_.empty()) {
            break;
        }
    }
    if (state_ != EngineState::WindowActive) {
        return;
    }
    AnnounceWindow();
    DispatchWindow();
}

void TurnOrderEngine::StartNextRound() {
    cursor_ = 0;
    roundEnd_ = order_.size();
    ++round_;
    TBC_LOG_INFO(LogCategory::Turn, "Round " + std::to_string(round_) + " begins");
    events_.roundStarted.emit(round_);

    if (round_ > lastHazardRound_) {
        lastHazardRound_ = round_;
        if (hazards_ != nullptr) {
            hazards_->TickRoundHazards();
        }
    }
}

void TurnOrderEngine::BuildWindow() {
    window_.clear();
    windowFaction_ = roster_.Find(order_[cursor_])->GetFaction();
    for (auto i = cursor_; i < roundEnd_; ++i) {
        const auto* unit = roster_.Find(order_[i]);
        if (unit == nullptr) {
            continue;
        }
        if (unit->GetFaction() != *windowFaction_) {
            break;
        }
        if (unit->IsAlive()) {
            window_.push_back(order_[i]);
        }
    }
}

void TurnOrderEngine::StartWindowTurns() {
    auto members = window_;
    for (auto id : members) {
        auto* unit = roster_.Find(id);
        auto oldHp = unit->Hp();
        unit->StartTurn();
        EmitHpChange(*unit, oldHp);
        if (!unit->IsAlive()) {
            TBC_LOG_INFO(LogCategory::Turn, unit->Name() + " succumbed at turn start");
            events_.unitDefeated.emit(id);
            RemoveFromWindow(id);
        }
    }
}

void TurnOrderEngine::AnnounceWindow() {
    if (window_.empty()) {
        return;
    }
    auto snapshot = window_;
    TBC_LOG_DEBUG(LogCategory::Turn,
                  std::string(factionName(*windowFaction_)) + " window with " +
                      std::to_string(snapshot.size()) + " unit(s), round " +
                      std::to_string(round_));
    events_.turnWindowChanged.emit(snapshot);
    events_.currentUnitChanged.emit(snapshot.front());
}

void TurnOrderEngine::DispatchWindow() {
    if (state_ != EngineState::WindowActive || window_.empty() ||
        *windowFaction_ == Faction::Player) {
        return;
    }
    if (aiDriver_ != nullptr) {
        aiDriver_->OnAIWindowReady();
        return;
    }

    auto head = window_.front();
    TBC_LOG_ERROR(LogCategory::Turn, "No AI driver attached; forcing end of turn for combatant " +
                                         std::to_string(head.value()));
    auto result = EndTurn(head);
    if (result.hasError()) {
        TBC_LOG_ERROR(LogCategory::Turn, std::string(result.error().message()));
    }
}

void TurnOrderEngine::ContinueAfterWindowChange() {
    if (state_ != EngineState::WindowActive) {
        return;
    }
    if (window_.empty()) {
        AdvanceToNextWindow();
        return;
    }
    AnnounceWindow();
    DispatchWindow();
}

// ── Victory ─────────────────────────────────────────────────────────────

bool TurnOrderEngine::EvaluateVictory() {
    if (state_ == EngineState::CombatOver) {
        return true;
    }
    if (state_ == EngineState::NotStarted) {
        return false;
    }

    bool playerAlive = false;
    bool hostileAlive = false;
    for (auto id : order_) {
        const auto* unit = roster_.Find(id);
        if (unit == nullptr || !unit->IsAlive()) {
            continue;
        }
        if (unit->GetFaction() == Faction::Player) {
            playerAlive = true;
        } else if (factions_.AreHostile(unit->GetFaction(), Faction::Player)) {
            hostileAlive = true;
        }
    }

    if (!playerAlive) {
        FinishCombat(false);
        return true;
    }

    if (config_.condition == VictoryCondition::SurviveRounds) {
        if (round_ > config_.surviveRounds) {
            FinishCombat(true);
            return true;
        }
        return false;
    }

    // KillAll; ProtectTarget and ReachLocation are evaluated the same way.
    if (!hostileAlive) {
        FinishCombat(true);
        return true;
    }
    if (config_.roundLimit > 0 && round_ > config_.roundLimit) {
        TBC_LOG_INFO(LogCategory::Turn, "Round limit reached");
        FinishCombat(false);
        return true;
    }
    return false;
}

void TurnOrderEngine::FinishCombat(bool playerVictory) {
    state_ = EngineState::CombatOver;
    outcome_ = playerVictory;
    window_.clear();
    windowFaction_.reset();

    TBC_LOG_INFO(LogCategory::Turn, std::string("Combat over after round ") +
                                        std::to_string(round_) +
                                        (playerVictory ? ": victory" : ": defeat"));
    if (aiDriver_ != nullptr) {
        aiDriver_->CancelAll();
    }
    events_.combatEnded.emit(playerVictory);
}

// ── Helpers ─────────────────────────────────────────────────────────────

std::optional<std::size_t> TurnOrderEngine::IndexOf(CombatantId id) const {
    auto it = std::find(order_.begin(), order_.end(), id);
    if (it == order_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - order_.begin());
}

void TurnOrderEngine::EraseAt(std::size_t index) {
    order_.erase(order_.begin() + static_cast<std::ptrdiff_t>(index));
    if (index < cursor_) {
        --cursor_;
    }
    if (index < roundEnd_) {
        --roundEnd_;
    }
}

bool TurnOrderEngine::RemoveFromWindow(CombatantId id) {
    auto it = std::find(window_.begin(), window_.end(), id);
    if (it == window_.end()) {
        return false;
    }
    window_.erase(it);
    return true;
}

void TurnOrderEngine::EmitHpChange(const Combatant& unit, int32_t oldHp) {
    if (unit.Hp() != oldHp) {
        events_.hpChanged.emit(unit.Id(), oldHp, unit.Hp());
    }
}

}  // namespace tbc::game
