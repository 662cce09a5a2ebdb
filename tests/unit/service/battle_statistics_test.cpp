#include <gtest/gtest.h>

#include <memory>

#include "tbc/game/battle_statistics.hpp"

using namespace tbc::game;
using tbc::foundation::CombatantId;
using tbc::foundation::SkillId;

namespace {

CombatResolutionResult Hit(int32_t damage, bool critical = false) {
    CombatResolutionResult result;
    result.hit = true;
    result.criticalHit = critical;
    result.finalDamage = damage;
    return result;
}

CombatResolutionResult Miss() {
    return CombatResolutionResult{};
}

CombatResolutionResult Parry() {
    CombatResolutionResult result;
    result.hit = true;
    result.parried = true;
    return result;
}

}  // namespace

TEST(BattleStatisticsTest, UnknownCombatantHasZeroCounters) {
    BattleEvents events;
    BattleStatistics stats(events);

    auto counters = stats.For(CombatantId(7));
    EXPECT_EQ(counters.attacks, 0);
    EXPECT_EQ(counters.damageDealt, 0);
    EXPECT_FALSE(stats.Outcome().has_value());
}

TEST(BattleStatisticsTest, AttacksAreClassified) {
    BattleEvents events;
    BattleStatistics stats(events);
    CombatantId knight(1);
    CombatantId orc(2);

    events.attackResolved.emit(knight, orc, Hit(6));
    events.attackResolved.emit(knight, orc, Hit(9, true));
    events.attackResolved.emit(knight, orc, Miss());
    events.attackResolved.emit(knight, orc, Parry());

    auto dealt = stats.For(knight);
    EXPECT_EQ(dealt.attacks, 4);
    EXPECT_EQ(dealt.damageDealt, 15);
    EXPECT_EQ(dealt.criticalHits, 1);
    EXPECT_EQ(dealt.misses, 1);
    EXPECT_EQ(dealt.parried, 1);

    EXPECT_EQ(stats.For(orc).damageTaken, 15);
    EXPECT_EQ(stats.TotalDamage(), 15);
}

TEST(BattleStatisticsTest, DefendedCriticalIsNotCounted) {
    BattleEvents events;
    BattleStatistics stats(events);

    auto result = Hit(5, true);
    result.criticalDefended = true;
    events.attackResolved.emit(CombatantId(1), CombatantId(2), result);

    EXPECT_EQ(stats.For(CombatantId(1)).criticalHits, 0);
}

TEST(BattleStatisticsTest, KillGoesToLastLandedAttacker) {
    BattleEvents events;
    BattleStatistics stats(events);
    CombatantId knight(1);
    CombatantId ranger(2);
    CombatantId orc(3);

    events.attackResolved.emit(ranger, orc, Hit(4));
    events.attackResolved.emit(knight, orc, Hit(8));
    events.attackResolved.emit(ranger, orc, Miss());
    events.unitDefeated.emit(orc);

    EXPECT_EQ(stats.For(knight).kills, 1);
    EXPECT_EQ(stats.For(ranger).kills, 0);
}

TEST(BattleStatisticsTest, DeathWithoutAttackerCreditsNobody) {
    BattleEvents events;
    BattleStatistics stats(events);

    events.unitDefeated.emit(CombatantId(3));
    EXPECT_EQ(stats.For(CombatantId(3)).kills, 0);
}

TEST(BattleStatisticsTest, TurnsSkillsRoundsAndOutcome) {
    BattleEvents events;
    BattleStatistics stats(events);
    CombatantId shaman(4);

    events.roundStarted.emit(1);
    events.skillUsed.emit(shaman, SkillId(10));
    events.unitTurnEnded.emit(shaman);
    events.roundStarted.emit(2);
    events.unitTurnEnded.emit(shaman);
    events.combatEnded.emit(false);

    EXPECT_EQ(stats.For(shaman).skillsUsed, 1);
    EXPECT_EQ(stats.For(shaman).turnsTaken, 2);
    EXPECT_EQ(stats.RoundsPlayed(), 2);
    ASSERT_TRUE(stats.Outcome().has_value());
    EXPECT_FALSE(*stats.Outcome());
}

TEST(BattleStatisticsTest, ResetClearsEverything) {
    BattleEvents events;
    BattleStatistics stats(events);

    events.attackResolved.emit(CombatantId(1), CombatantId(2), Hit(3));
    events.roundStarted.emit(3);
    events.combatEnded.emit(true);
    stats.Reset();

    EXPECT_EQ(stats.For(CombatantId(1)).damageDealt, 0);
    EXPECT_EQ(stats.RoundsPlayed(), 0);
    EXPECT_EQ(stats.TotalDamage(), 0);
    EXPECT_FALSE(stats.Outcome().has_value());
}

TEST(BattleStatisticsTest, StopsListeningWhenDestroyed) {
    BattleEvents events;
    {
        BattleStatistics stats(events);
        EXPECT_GT(events.attackResolved.slotCount(), 0u);
    }
    EXPECT_EQ(events.attackResolved.slotCount(), 0u);
    events.attackResolved.emit(CombatantId(1), CombatantId(2), Hit(3));
}
