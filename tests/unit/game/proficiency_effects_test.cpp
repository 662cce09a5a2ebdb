#include <gtest/gtest.h>

#include "tbc/game/proficiency_effects.hpp"

using namespace tbc::game;

TEST(ProficiencyEffectsTest, FamiliarIsNeutral) {
    auto mods = ProficiencyEffects::Lookup(ProficiencyTier::Familiar);
    EXPECT_FLOAT_EQ(mods.statEfficiency, 1.0f);
    EXPECT_FLOAT_EQ(mods.hitVarianceBonus, 0.0f);
    EXPECT_FLOAT_EQ(mods.fumbleReduction, 0.0f);
}

TEST(ProficiencyEffectsTest, UntrainedHalvesStats) {
    EXPECT_FLOAT_EQ(ProficiencyEffects::StatEfficiency(ProficiencyTier::Untrained), 0.5f);
    EXPECT_EQ(ProficiencyEffects::ApplyStatEfficiency(9, ProficiencyTier::Untrained), 5);
}

TEST(ProficiencyEffectsTest, ColumnsAreMonotonicAboveUntrained) {
    for (std::size_t i = 1; i + 1 < kProficiencyTierCount; ++i) {
        auto lower = ProficiencyEffects::Lookup(static_cast<ProficiencyTier>(i));
        auto upper = ProficiencyEffects::Lookup(static_cast<ProficiencyTier>(i + 1));
        EXPECT_LE(lower.statEfficiency, upper.statEfficiency);
        EXPECT_LE(lower.hitVarianceBonus, upper.hitVarianceBonus);
        EXPECT_LE(lower.fumbleReduction, upper.fumbleReduction);
        EXPECT_LE(lower.recoveryBonus, upper.recoveryBonus);
        EXPECT_LE(lower.staminaBonus, upper.staminaBonus);
    }
}

TEST(ProficiencyEffectsTest, LegendaryTopsTheTable) {
    EXPECT_FLOAT_EQ(ProficiencyEffects::StatEfficiency(ProficiencyTier::Legendary), 1.5f);
    EXPECT_FLOAT_EQ(ProficiencyEffects::HitVarianceBonus(ProficiencyTier::Legendary), 15.0f);
    EXPECT_EQ(ProficiencyEffects::ApplyStatEfficiency(10, ProficiencyTier::Legendary), 15);
}

TEST(ProficiencyEffectsTest, OutOfRangeFallsBackToFamiliar) {
    auto mods = ProficiencyEffects::LookupOrdinal(42);
    EXPECT_FLOAT_EQ(mods.statEfficiency, 1.0f);
    EXPECT_FLOAT_EQ(ProficiencyEffects::LookupOrdinal(-1).hitVarianceBonus, 0.0f);
    EXPECT_FLOAT_EQ(
        ProficiencyEffects::StatEfficiency(static_cast<ProficiencyTier>(200)), 1.0f);
}

TEST(ProficiencyEffectsTest, TierNamesParse) {
    EXPECT_EQ(ProficiencyEffects::TierName(ProficiencyTier::Grandmaster), "Grandmaster");
    EXPECT_EQ(ProficiencyEffects::ParseTier("Expert"), ProficiencyTier::Expert);
    EXPECT_FALSE(ProficiencyEffects::ParseTier("Novice").has_value());
}
