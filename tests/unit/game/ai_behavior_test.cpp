#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "tbc/foundation/random_source.hpp"
#include "tbc/game/ai_behavior.hpp"
#include "tbc/game/square_grid.hpp"

using namespace tbc::game;
using tbc::foundation::CombatantId;
using tbc::foundation::ScriptedRandomSource;
using tbc::foundation::SkillId;

namespace {

class AIBehaviorTest : public ::testing::Test {
protected:
    AIBehaviorTest() : grid_(8, 8) {}

    Combatant& add(uint64_t id, Faction faction, GridPos pos, int32_t hp = 20) {
        CombatStats stats;
        stats.maxHp = 20;
        units_.push_back(std::make_unique<Combatant>(CombatantId(id), "Unit" + std::to_string(id),
                                                     faction, stats, pos));
        units_.back()->SetHp(hp);
        view_.push_back(units_.back().get());
        return *units_.back();
    }

    AIContext context(const Combatant& self, ScriptedRandomSource& rng) {
        return AIContext{self, view_, factions_, &grid_, rng};
    }

    static Skill damageSkill(uint64_t id, int32_t range) {
        Skill skill;
        skill.id = SkillId(id);
        skill.name = "Skill" + std::to_string(id);
        skill.range = range;
        skill.power = 6;
        return skill;
    }

    static Skill healSkill(uint64_t id) {
        Skill skill;
        skill.id = SkillId(id);
        skill.name = "Heal" + std::to_string(id);
        skill.kind = SkillKind::Support;
        skill.range = 2;
        skill.healAmount = 5;
        return skill;
    }

    FactionRelationshipResolver factions_;
    SquareGrid grid_;
    std::vector<std::unique_ptr<Combatant>> units_;
    std::vector<const Combatant*> view_;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Names and configuration
// ═══════════════════════════════════════════════════════════════════════════

TEST(AIBehaviorNamesTest, ParseRoundTripsEveryKind) {
    for (auto kind : {AIBehaviorKind::Berserker, AIBehaviorKind::Support, AIBehaviorKind::Coward,
                      AIBehaviorKind::Protector}) {
        auto parsed = parseAIBehavior(aiBehaviorName(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(parseAIBehavior("Pacifist").has_value());
    EXPECT_EQ(aiActionName(AIActionKind::RangedSkill), "RangedSkill");
}

TEST(AIBehaviorConfigTest, KindDefaults) {
    auto berserker = AIBehaviorConfig::ForKind(AIBehaviorKind::Berserker);
    EXPECT_FLOAT_EQ(berserker.aggression, 0.7f);
    EXPECT_FLOAT_EQ(berserker.supportPreference, 0.0f);

    auto support = AIBehaviorConfig::ForKind(AIBehaviorKind::Support);
    EXPECT_FLOAT_EQ(support.supportPreference, 0.5f);
    EXPECT_FLOAT_EQ(support.aggression, 0.3f);

    auto coward = AIBehaviorConfig::ForKind(AIBehaviorKind::Coward);
    EXPECT_FLOAT_EQ(coward.hazardAvoidance, 0.9f);
    EXPECT_FLOAT_EQ(coward.retreatThreshold, 0.3f);
}

TEST(AIBehaviorConfigTest, MakeKeepsKindAndCustomWeights) {
    AIBehaviorConfig config;
    config.aggression = 0.1f;
    auto behavior = AIBehavior::Make(AIBehaviorKind::Protector, config);
    EXPECT_EQ(behavior.Kind(), AIBehaviorKind::Protector);
    EXPECT_FLOAT_EQ(behavior.Config().aggression, 0.1f);

    EXPECT_EQ(AIBehavior().Kind(), AIBehaviorKind::Berserker);
    EXPECT_EQ(AIBehavior::Make(AIBehaviorKind::Coward).Kind(), AIBehaviorKind::Coward);
}

// ═══════════════════════════════════════════════════════════════════════════
// Berserker
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AIBehaviorTest, BerserkerPrefersWoundedEnemy) {
    auto& self = add(1, Faction::Faction1, {0, 0});
    add(2, Faction::Player, {2, 0});
    auto& wounded = add(3, Faction::Player, {3, 0}, 5);
    add(4, Faction::Player, {1, 0}, 0);
    add(5, Faction::Faction1, {1, 1});

    ScriptedRandomSource rng({0.99f});
    auto behavior = AIBehavior::Make(AIBehaviorKind::Berserker);
    EXPECT_EQ(behavior.ChooseTarget(context(self, rng)), &wounded);
}

TEST_F(AIBehaviorTest, NoTargetWithoutLivingEnemies) {
    auto& self = add(1, Faction::Faction1, {0, 0});
    add(2, Faction::Faction1, {1, 0});
    add(3, Faction::Player, {2, 0}, 0);

    ScriptedRandomSource rng({0.99f});
    for (auto kind : {AIBehaviorKind::Berserker, AIBehaviorKind::Coward,
                      AIBehaviorKind::Protector}) {
        EXPECT_EQ(AIBehavior::Make(kind).ChooseTarget(context(self, rng)), nullptr);
    }
}

TEST_F(AIBehaviorTest, BerserkerClosesDistanceThenAttacks) {
    auto& self = add(1, Faction::Faction1, {0, 0});
    auto& far = add(2, Faction::Player, {4, 0});
    auto& near = add(3, Faction::Player, {1, 1});

    ScriptedRandomSource rng({0.99f});
    auto behavior = AIBehavior::Make(AIBehaviorKind::Berserker);
    EXPECT_EQ(behavior.ChooseAction(context(self, rng), far).kind, AIActionKind::Move);

    auto attack = behavior.ChooseAction(context(self, rng), near);
    EXPECT_EQ(attack.kind, AIActionKind::MeleeAttack);
    EXPECT_FALSE(attack.skill.has_value());
    EXPECT_EQ(rng.consumed(), 0u);
}

TEST_F(AIBehaviorTest, BerserkerSometimesUsesMeleeSkill) {
    auto& self = add(1, Faction::Faction1, {0, 0});
    self.AddSkill(damageSkill(40, 3));
    self.AddSkill(damageSkill(41, 1));
    auto& target = add(2, Faction::Player, {1, 0});

    ScriptedRandomSource rng({0.1f, 0.9f});
    auto behavior = AIBehavior::Make(AIBehaviorKind::Berserker);

    auto skill = behavior.ChooseAction(context(self, rng), target);
    EXPECT_EQ(skill.kind, AIActionKind::RangedSkill);
    ASSERT_TRUE(skill.skill.has_value());
    EXPECT_EQ(*skill.skill, SkillId(41));

    EXPECT_EQ(behavior.ChooseAction(context(self, rng), target).kind, AIActionKind::MeleeAttack);
}

TEST_F(AIBehaviorTest, DeadTargetMeansWait) {
    auto& self = add(1, Faction::Faction1, {0, 0});
    auto& corpse = add(2, Faction::Player, {1, 0}, 0);

    ScriptedRandomSource rng({0.99f});
    for (auto kind : {AIBehaviorKind::Berserker, AIBehaviorKind::Support, AIBehaviorKind::Coward,
                      AIBehaviorKind::Protector}) {
        EXPECT_EQ(AIBehavior::Make(kind).ChooseAction(context(self, rng), corpse).kind,
                  AIActionKind::Wait);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Support
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AIBehaviorTest, SupportTendsWoundedAllyWhenInclined) {
    auto& self = add(1, Faction::Faction1, {0, 0});
    self.AddSkill(healSkill(50));
    add(2, Faction::Faction1, {0, 1}, 15);
    auto& hurt = add(3, Faction::Faction1, {0, 2}, 6);
    auto& enemy = add(4, Faction::Player, {3, 0});

    auto behavior = AIBehavior::Make(AIBehaviorKind::Support);

    ScriptedRandomSource inclined({0.1f});
    const auto* target = behavior.ChooseTarget(context(self, inclined));
    EXPECT_EQ(target, &hurt);

    auto action = behavior.ChooseAction(context(self, inclined), hurt);
    EXPECT_EQ(action.kind, AIActionKind::Support);
    ASSERT_TRUE(action.skill.has_value());
    EXPECT_EQ(*action.skill, SkillId(50));

    ScriptedRandomSource reluctant({0.9f});
    EXPECT_EQ(behavior.ChooseTarget(context(self, reluctant)), &enemy);
}

TEST_F(AIBehaviorTest, SupportWithoutHealWaitsOnAlly) {
    auto& self = add(1, Faction::Faction1, {0, 0});
    auto& ally = add(2, Faction::Faction1, {0, 1}, 5);

    ScriptedRandomSource rng({0.99f});
    auto behavior = AIBehavior::Make(AIBehaviorKind::Support);
    EXPECT_EQ(behavior.ChooseAction(context(self, rng), ally).kind, AIActionKind::Wait);
}

TEST_F(AIBehaviorTest, SupportHarassesFromRange) {
    auto& self = add(1, Faction::Faction1, {0, 0});
    self.AddSkill(damageSkill(60, 3));
    auto& adjacent = add(2, Faction::Player, {1, 0});
    auto& inRange = add(3, Faction::Player, {2, 2});
    auto& distant = add(4, Faction::Player, {6, 6});

    ScriptedRandomSource rng({0.99f});
    auto behavior = AIBehavior::Make(AIBehaviorKind::Support);
    auto ctx = context(self, rng);

    EXPECT_EQ(behavior.ChooseAction(ctx, adjacent).kind, AIActionKind::MeleeAttack);
    auto ranged = behavior.ChooseAction(ctx, inRange);
    EXPECT_EQ(ranged.kind, AIActionKind::RangedSkill);
    ASSERT_TRUE(ranged.skill.has_value());
    EXPECT_EQ(*ranged.skill, SkillId(60));
    EXPECT_EQ(behavior.ChooseAction(ctx, distant).kind, AIActionKind::Move);
}

// ═══════════════════════════════════════════════════════════════════════════
// Coward
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AIBehaviorTest, CowardFightsOnlyWhileHealthy) {
    auto& self = add(1, Faction::Faction1, {0, 0});
    auto& adjacent = add(2, Faction::Player, {1, 0});
    auto& distant = add(3, Faction::Player, {6, 0});

    ScriptedRandomSource rng({0.99f});
    auto behavior = AIBehavior::Make(AIBehaviorKind::Coward);

    EXPECT_EQ(behavior.ChooseAction(context(self, rng), adjacent).kind,
              AIActionKind::MeleeAttack);
    EXPECT_EQ(behavior.ChooseAction(context(self, rng), distant).kind, AIActionKind::Move);

    self.SetHp(10);
    EXPECT_EQ(behavior.ChooseAction(context(self, rng), adjacent).kind, AIActionKind::Move);

    self.SetHp(4);
    EXPECT_EQ(behavior.ChooseAction(context(self, rng), adjacent).kind, AIActionKind::Move);
    EXPECT_EQ(behavior.ChooseAction(context(self, rng), distant).kind, AIActionKind::Wait);
}

TEST_F(AIBehaviorTest, RetreatingCowardAvoidsHealthyEnemies) {
    auto& self = add(1, Faction::Faction1, {0, 0}, 4);
    add(2, Faction::Player, {5, 0});
    auto& weak = add(3, Faction::Player, {7, 7}, 6);

    ScriptedRandomSource rng({0.99f});
    EXPECT_EQ(AIBehavior::Make(AIBehaviorKind::Coward).ChooseTarget(context(self, rng)), &weak);
}

// ═══════════════════════════════════════════════════════════════════════════
// Protector
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AIBehaviorTest, ProtectorInterceptsThreatToEndangeredAlly) {
    auto& self = add(1, Faction::Faction1, {0, 0});
    add(2, Faction::Faction1, {6, 0}, 5);
    add(3, Faction::Player, {1, 0});
    auto& threat = add(4, Faction::Player, {7, 0});

    ScriptedRandomSource rng({0.99f});
    EXPECT_EQ(AIBehavior::Make(AIBehaviorKind::Protector).ChooseTarget(context(self, rng)),
              &threat);
}

TEST_F(AIBehaviorTest, ProtectorFallsBackToNearestEnemy) {
    auto& self = add(1, Faction::Faction1, {0, 0});
    add(2, Faction::Faction1, {0, 7});
    auto& near = add(3, Faction::Player, {1, 0});
    add(4, Faction::Player, {7, 3});

    ScriptedRandomSource rng({0.99f});
    EXPECT_EQ(AIBehavior::Make(AIBehaviorKind::Protector).ChooseTarget(context(self, rng)),
              &near);
}

// ═══════════════════════════════════════════════════════════════════════════
// Movement
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AIBehaviorTest, BestMoveEndsAdjacentToTarget) {
    auto& self = add(1, Faction::Faction1, {0, 0});
    auto& target = add(2, Faction::Player, {3, 0});

    ScriptedRandomSource rng({0.99f});
    auto behavior = AIBehavior::Make(AIBehaviorKind::Berserker);
    auto best = behavior.EvaluateBestMove(context(self, rng), target,
                                          {{1, 0}, {2, 0}, {1, 1}, {0, 0}});
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(*best, (GridPos{2, 0}));
}

TEST_F(AIBehaviorTest, BestMoveAvoidsHazards) {
    auto& self = add(1, Faction::Faction1, {0, 0});
    auto& target = add(2, Faction::Player, {3, 0});
    grid_.PlaceHazard({2, 0}, HazardSpec{5, -1});

    ScriptedRandomSource rng({0.99f});
    auto behavior = AIBehavior::Make(AIBehaviorKind::Berserker);
    auto best = behavior.EvaluateBestMove(context(self, rng), target, {{2, 0}, {2, 1}});
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(*best, (GridPos{2, 1}));
}

TEST_F(AIBehaviorTest, StayingPutWhenAlreadyBestPlaced) {
    auto& self = add(1, Faction::Faction1, {2, 0});
    auto& target = add(2, Faction::Player, {3, 0});

    ScriptedRandomSource rng({0.99f});
    auto behavior = AIBehavior::Make(AIBehaviorKind::Berserker);
    EXPECT_FALSE(
        behavior.EvaluateBestMove(context(self, rng), target, {{1, 0}, {0, 0}}).has_value());
    EXPECT_FALSE(behavior.EvaluateBestMove(context(self, rng), target, {}).has_value());
}

TEST_F(AIBehaviorTest, CowardKeepsSkirmishDistance) {
    auto& self = add(1, Faction::Faction1, {1, 0});
    auto& target = add(2, Faction::Player, {3, 0});

    ScriptedRandomSource rng({0.99f});
    auto behavior = AIBehavior::Make(AIBehaviorKind::Coward);
    EXPECT_FALSE(
        behavior.EvaluateBestMove(context(self, rng), target, {{2, 0}, {0, 0}}).has_value());
}

TEST_F(AIBehaviorTest, RetreatingCowardFlees) {
    auto& self = add(1, Faction::Faction1, {2, 0}, 2);
    auto& target = add(2, Faction::Player, {3, 0});

    ScriptedRandomSource rng({0.99f});
    auto behavior = AIBehavior::Make(AIBehaviorKind::Coward);
    auto best = behavior.EvaluateBestMove(context(self, rng), target, {{1, 0}, {0, 0}});
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(*best, (GridPos{0, 0}));
}
