#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

#include "tbc/foundation/timer_scheduler.hpp"
#include "tbc/game/ai_window_sequencer.hpp"
#include "tbc/game/combatant_roster.hpp"

using namespace tbc::game;
using namespace std::chrono_literals;
using tbc::foundation::CombatantId;
using tbc::foundation::ErrorCode;
using tbc::foundation::GameResult;
using tbc::foundation::TimerScheduler;
using tbc::foundation::makeError;

namespace {

constexpr CombatantId kGoblin{1};
constexpr CombatantId kShaman{2};
constexpr CombatantId kKnight{3};

/// Records turn starts and lets the test decide when each unit finishes.
class FakeRunner : public IAITurnRunner {
public:
    GameResult<void> BeginTurn(CombatantId id, CompletionCallback onComplete) override {
        if (failNext) {
            failNext = false;
            return makeError<void>(ErrorCode::TurnAlreadyInProgress, "refused");
        }
        begun.push_back(id);
        pending[id] = std::move(onComplete);
        return GameResult<void>::ok();
    }

    void CancelTurn(CombatantId id) override {
        cancelled.push_back(id);
        pending.erase(id);
    }

    void CancelAll() override {
        ++cancelAllCount;
        pending.clear();
    }

    /// Invoke @p id's completion callback, keeping a copy for replays.
    void complete(CombatantId id) {
        auto it = pending.find(id);
        ASSERT_NE(it, pending.end());
        stale[id] = it->second;
        auto callback = std::move(it->second);
        pending.erase(it);
        callback(id);
    }

    /// Fire a completion the runner already delivered or dropped.
    void replay(CombatantId id) { stale.at(id)(id); }

    std::vector<CombatantId> begun;
    std::vector<CombatantId> cancelled;
    std::unordered_map<CombatantId, CompletionCallback> pending;
    std::unordered_map<CombatantId, CompletionCallback> stale;
    int cancelAllCount = 0;
    bool failNext = false;
};

AITiming TestTiming() {
    AITiming timing;
    timing.interUnitGap = 100ms;
    timing.decisionTimeout = 5000ms;
    return timing;
}

class AIWindowSequencerTest : public ::testing::Test {
protected:
    AIWindowSequencerTest()
        : engine_(roster_, factions_), sequencer_(engine_, runner_, timers_, TestTiming()) {
        engine_.SetAITurnDriver(&sequencer_);
        add(kGoblin, Faction::Faction1, 9);
        add(kShaman, Faction::Faction1, 8);
        add(kKnight, Faction::Player, 1);
        engine_.events().unitTurnEnded.connect([this](CombatantId id) { ended_.push_back(id); });
    }

    void add(CombatantId id, Faction faction, int32_t speed) {
        CombatStats stats;
        stats.speed = speed;
        GridPos pos{static_cast<int32_t>(id.value()), 0};
        auto result = roster_.Emplace(id, "Unit" + std::to_string(id.value()), faction, stats,
                                      pos);
        EXPECT_TRUE(result.hasValue());
    }

    void start() { ASSERT_TRUE(engine_.Initialize(roster_.Ids()).hasValue()); }

    void kill(CombatantId id) {
        auto* unit = roster_.Find(id);
        auto oldHp = unit->Hp();
        unit->SetHp(0);
        engine_.OnCombatantHpChanged(id, oldHp);
    }

    static std::size_t count(const std::vector<CombatantId>& ids, CombatantId id) {
        return static_cast<std::size_t>(std::count(ids.begin(), ids.end(), id));
    }

    CombatantRoster roster_;
    FactionRelationshipResolver factions_;
    TurnOrderEngine engine_;
    TimerScheduler timers_;
    FakeRunner runner_;
    AIWindowSequencer sequencer_;

    std::vector<CombatantId> ended_;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Sequencing
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AIWindowSequencerTest, WaitsGapBeforeFirstUnit) {
    start();
    EXPECT_TRUE(runner_.begun.empty());

    timers_.advance(99ms);
    EXPECT_TRUE(runner_.begun.empty());
    EXPECT_FALSE(sequencer_.InFlight().has_value());

    timers_.advance(1ms);
    ASSERT_EQ(runner_.begun.size(), 1u);
    EXPECT_EQ(runner_.begun[0], kGoblin);
    EXPECT_EQ(sequencer_.InFlight(), std::optional<CombatantId>(kGoblin));
}

TEST_F(AIWindowSequencerTest, RunsWindowMembersOneAtATime) {
    start();
    timers_.advance(100ms);
    timers_.advance(1000ms);
    EXPECT_EQ(runner_.begun.size(), 1u);

    runner_.complete(kGoblin);
    ASSERT_EQ(ended_.size(), 1u);
    EXPECT_EQ(ended_[0], kGoblin);
    EXPECT_FALSE(sequencer_.InFlight().has_value());

    timers_.advance(100ms);
    ASSERT_EQ(runner_.begun.size(), 2u);
    EXPECT_EQ(runner_.begun[1], kShaman);

    runner_.complete(kShaman);
    EXPECT_EQ(engine_.GetCurrentWindow(), std::vector<CombatantId>{kKnight});
    EXPECT_EQ(engine_.WindowFaction(), std::optional<Faction>(Faction::Player));

    timers_.advance(10000ms);
    EXPECT_EQ(runner_.begun.size(), 2u);
    EXPECT_EQ(sequencer_.TimeoutCount(), 0u);
}

TEST_F(AIWindowSequencerTest, RepeatedReadyDoesNotRestartInFlightUnit) {
    start();
    timers_.advance(100ms);
    sequencer_.OnAIWindowReady();
    timers_.advance(100ms);
    EXPECT_EQ(runner_.begun.size(), 1u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Timeout
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AIWindowSequencerTest, TimeoutForcesEndTurnOnce) {
    start();
    timers_.advance(100ms);

    timers_.advance(4999ms);
    EXPECT_TRUE(ended_.empty());

    timers_.advance(1ms);
    EXPECT_EQ(sequencer_.TimeoutCount(), 1u);
    EXPECT_EQ(count(runner_.cancelled, kGoblin), 1u);
    ASSERT_EQ(ended_.size(), 1u);
    EXPECT_EQ(ended_[0], kGoblin);

    timers_.advance(100ms);
    ASSERT_EQ(runner_.begun.size(), 2u);
    EXPECT_EQ(runner_.begun[1], kShaman);
}

TEST_F(AIWindowSequencerTest, LateCompletionIsIgnored) {
    start();
    timers_.advance(100ms);
    runner_.complete(kGoblin);
    timers_.advance(100ms);
    ASSERT_EQ(sequencer_.InFlight(), std::optional<CombatantId>(kShaman));

    runner_.replay(kGoblin);
    EXPECT_EQ(count(ended_, kGoblin), 1u);
    EXPECT_EQ(sequencer_.InFlight(), std::optional<CombatantId>(kShaman));
    EXPECT_TRUE(engine_.IsUnitInCurrentWindow(kShaman));
}

TEST_F(AIWindowSequencerTest, CompletionAfterTimeoutIsIgnored) {
    start();
    timers_.advance(100ms);
    auto callback = runner_.pending.at(kGoblin);

    timers_.advance(5000ms);
    ASSERT_EQ(ended_.size(), 1u);

    callback(kGoblin);
    EXPECT_EQ(ended_.size(), 1u);
    EXPECT_EQ(count(ended_, kShaman), 0u);
}

TEST_F(AIWindowSequencerTest, CompletionDisarmsTimeout) {
    start();
    timers_.advance(100ms);
    runner_.complete(kGoblin);
    timers_.advance(100ms);
    runner_.complete(kShaman);

    timers_.advance(10000ms);
    EXPECT_EQ(sequencer_.TimeoutCount(), 0u);
    EXPECT_EQ(ended_.size(), 2u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Interruptions
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AIWindowSequencerTest, DeathMidTurnCancelsWithoutEndTurn) {
    start();
    timers_.advance(100ms);

    kill(kGoblin);
    EXPECT_EQ(count(runner_.cancelled, kGoblin), 1u);
    EXPECT_FALSE(sequencer_.InFlight().has_value());
    EXPECT_EQ(count(ended_, kGoblin), 0u);

    timers_.advance(100ms);
    ASSERT_EQ(runner_.begun.size(), 2u);
    EXPECT_EQ(runner_.begun[1], kShaman);

    timers_.advance(10000ms);
    EXPECT_EQ(count(ended_, kGoblin), 0u);
}

TEST_F(AIWindowSequencerTest, UnregisterMidTurnCancelsWithoutEndTurn) {
    start();
    timers_.advance(100ms);

    ASSERT_TRUE(engine_.UnregisterUnit(kGoblin).hasValue());
    EXPECT_EQ(count(runner_.cancelled, kGoblin), 1u);
    EXPECT_EQ(count(ended_, kGoblin), 0u);

    timers_.advance(100ms);
    ASSERT_EQ(runner_.begun.size(), 2u);
    EXPECT_EQ(runner_.begun[1], kShaman);
}

TEST_F(AIWindowSequencerTest, FailedStartEndsTurnImmediately) {
    runner_.failNext = true;
    start();
    timers_.advance(100ms);

    EXPECT_TRUE(runner_.begun.empty());
    ASSERT_EQ(ended_.size(), 1u);
    EXPECT_EQ(ended_[0], kGoblin);

    timers_.advance(100ms);
    ASSERT_EQ(runner_.begun.size(), 1u);
    EXPECT_EQ(runner_.begun[0], kShaman);
}

TEST_F(AIWindowSequencerTest, CombatEndCancelsEverything) {
    start();
    timers_.advance(100ms);
    auto before = runner_.cancelAllCount;

    kill(kKnight);
    EXPECT_TRUE(engine_.IsCombatOver());
    EXPECT_GT(runner_.cancelAllCount, before);
    EXPECT_EQ(count(runner_.cancelled, kGoblin), 1u);
    EXPECT_FALSE(sequencer_.InFlight().has_value());

    timers_.advance(10000ms);
    EXPECT_EQ(runner_.begun.size(), 1u);
    EXPECT_TRUE(ended_.empty());
}

TEST_F(AIWindowSequencerTest, CancelAllDropsPendingGap) {
    start();
    sequencer_.CancelAll();
    EXPECT_EQ(timers_.pendingCount(), 0u);

    timers_.advance(1000ms);
    EXPECT_TRUE(runner_.begun.empty());
}
