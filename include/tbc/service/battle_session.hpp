#pragma once

/// @file battle_session.hpp
/// @brief BattleSession: owns and wires every component of one battle.
///
/// The session is the composition root of the battle core. It constructs
/// the roster, faction matrix, timer queue, resolver, turn engine, action
/// executor, AI controller and window sequencer, connects them, and exposes
/// the player-facing request API. Nothing here is process-wide: two
/// sessions never share state.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "tbc/foundation/config_manager.hpp"
#include "tbc/foundation/game_result.hpp"
#include "tbc/foundation/random_source.hpp"
#include "tbc/foundation/timer_scheduler.hpp"
#include "tbc/game/ai_behavior.hpp"
#include "tbc/game/battle_events.hpp"
#include "tbc/game/battle_statistics.hpp"
#include "tbc/game/combatant_roster.hpp"
#include "tbc/game/encounter_config.hpp"
#include "tbc/game/faction_relationship_resolver.hpp"
#include "tbc/game/square_grid.hpp"
#include "tbc/game/turn_order_engine.hpp"

namespace tbc::service {

// -- Configuration -----------------------------------------------------------

/// Settings for one battle.
struct BattleSessionConfig {
    int32_t gridWidth = 8;
    int32_t gridHeight = 8;

    /// Seed of the default random source.
    uint32_t seed = 5489u;

    tbc::game::CombatTuning tuning;
    tbc::game::AITiming timing;
    tbc::game::EncounterConfiguration encounter;

    /// Read `battle.*`, `combat.*`, `ai.*` and `encounter.*`.
    static tbc::foundation::GameResult<BattleSessionConfig> fromConfig(
        const tbc::foundation::ConfigManager& config);
};

enum class SessionState : uint8_t {
    Setup,           ///< Adding combatants.
    AwaitingStakes,  ///< start() called; waiting for acknowledgeStakes().
    Running,
    Finished,
    ShutDown
};

std::string_view sessionStateName(SessionState state);

// -- Battle Session ----------------------------------------------------------

/// One battle from setup to outcome.
///
/// Usage:
/// @code
///   BattleSession session(config);
///   session.factions().SetRelationship(Faction::Player, Faction::Faction1,
///                                      FactionRelationship::Hostile);
///   session.addCombatant(std::move(hero));
///   session.addCombatant(std::move(goblin), AIBehavior::Make(AIBehaviorKind::Berserker));
///   session.start();
///
///   session.requestMove(heroId, {3, 2});
///   session.requestAttack(heroId, goblinId);
///   session.requestEndTurn(heroId);
///   session.advance(std::chrono::milliseconds(16));   // drive AI turns
/// @endcode
class BattleSession {
public:
    using Duration = tbc::foundation::TimerScheduler::Duration;

    explicit BattleSession(BattleSessionConfig config = {},
                           std::unique_ptr<tbc::foundation::RandomSource> rng = nullptr);
    ~BattleSession();

    BattleSession(const BattleSession&) = delete;
    BattleSession& operator=(const BattleSession&) = delete;

    // -- Setup ----------------------------------------------------------------

    /// Take ownership of @p combatant and place it on the board. AI-controlled
    /// units need a @p behavior. Mid-battle additions join the turn order.
    tbc::foundation::GameResult<tbc::game::Combatant*> addCombatant(
        std::unique_ptr<tbc::game::Combatant> combatant,
        std::optional<tbc::game::AIBehavior> behavior = std::nullopt);

    /// Remove a combatant from the battle (e.g. it fled the scene).
    tbc::foundation::GameResult<void> removeCombatant(tbc::game::CombatantId id);

    /// Apply `factions.relationships` from @p config.
    tbc::foundation::GameResult<std::size_t> applyFactionConfig(
        const tbc::foundation::ConfigManager& config);

    // -- Lifecycle ------------------------------------------------------------

    /// Begin combat, or wait for acknowledgeStakes() when the encounter asks.
    tbc::foundation::GameResult<void> start();

    /// Release the stakes gate and begin combat.
    tbc::foundation::GameResult<void> acknowledgeStakes();

    /// Cancel every pending asynchronous step without ending any turn.
    void shutdown();

    /// Advance virtual time, running due AI and movement continuations.
    std::size_t advance(Duration delta);

    /// Advance until nothing is pending or @p limit has elapsed.
    std::size_t runUntilIdle(Duration limit);

    // -- Player requests ------------------------------------------------------

    tbc::foundation::GameResult<tbc::game::CombatResolutionResult> requestAttack(
        tbc::game::CombatantId attacker, tbc::game::CombatantId target);

    tbc::foundation::GameResult<tbc::game::CombatResolutionResult> requestSkill(
        tbc::game::CombatantId user, tbc::game::SkillId skill, tbc::game::CombatantId target);

    tbc::foundation::GameResult<int32_t> requestSupport(tbc::game::CombatantId user,
                                                        tbc::game::SkillId skill,
                                                        tbc::game::CombatantId ally);

    tbc::foundation::GameResult<std::vector<tbc::game::GridPos>> requestMove(
        tbc::game::CombatantId id, tbc::game::GridPos destination);

    tbc::foundation::GameResult<void> requestEndTurn(tbc::game::CombatantId id);

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] SessionState state() const noexcept;
    [[nodiscard]] std::optional<bool> outcome() const noexcept;

    [[nodiscard]] tbc::game::CombatantRoster& roster() noexcept;
    [[nodiscard]] tbc::game::FactionRelationshipResolver& factions() noexcept;
    [[nodiscard]] tbc::game::SquareGrid& grid() noexcept;
    [[nodiscard]] tbc::game::TurnOrderEngine& engine() noexcept;
    [[nodiscard]] tbc::game::BattleEvents& events() noexcept;
    [[nodiscard]] const tbc::game::BattleStatistics& statistics() const noexcept;
    [[nodiscard]] tbc::foundation::TimerScheduler& timers() noexcept;
    [[nodiscard]] const BattleSessionConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tbc::service
