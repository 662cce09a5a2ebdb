/// @file proficiency_effects.cpp
/// @brief Proficiency modifier table.

#include "tbc/game/proficiency_effects.hpp"

#include <cmath>

namespace tbc::game {

namespace {

// ── Tier table ──────────────────────────────────────────────────────────
//                     efficiency  hit   fumble  recovery  stamina
constexpr std::array<ProficiencyModifiers, kProficiencyTierCount> kTierTable = {{
    {0.50f,  0.0f,  0.0f, 0.00f, 0.00f},  // Untrained
    {1.00f,  0.0f,  0.0f, 0.00f, 0.00f},  // Familiar
    {1.05f,  1.0f,  1.0f, 0.05f, 0.05f},  // Trained
    {1.10f,  2.0f,  2.0f, 0.10f, 0.10f},  // Competent
    {1.15f,  3.5f,  3.5f, 0.15f, 0.15f},  // Proficient
    {1.20f,  5.0f,  5.0f, 0.18f, 0.18f},  // Advanced
    {1.25f,  7.0f,  7.0f, 0.22f, 0.22f},  // Expert
    {1.30f,  9.0f, 10.0f, 0.25f, 0.25f},  // Master
    {1.40f, 12.0f, 15.0f, 0.28f, 0.28f},  // Grandmaster
    {1.50f, 15.0f, 20.0f, 0.30f, 0.30f},  // Legendary
}};

constexpr std::array<std::string_view, kProficiencyTierCount> kTierNames = {
    "Untrained", "Familiar", "Trained", "Competent", "Proficient",
    "Advanced", "Expert", "Master", "Grandmaster", "Legendary"
};

constexpr auto kFamiliarIndex = static_cast<std::size_t>(ProficiencyTier::Familiar);

}  // namespace

ProficiencyModifiers ProficiencyEffects::Lookup(ProficiencyTier tier) {
    auto idx = static_cast<std::size_t>(tier);
    if (idx >= kProficiencyTierCount) {
        return kTierTable[kFamiliarIndex];
    }
    return kTierTable[idx];
}

ProficiencyModifiers ProficiencyEffects::LookupOrdinal(int ordinal) {
    if (ordinal < 0 || ordinal >= static_cast<int>(kProficiencyTierCount)) {
        return kTierTable[kFamiliarIndex];
    }
    return kTierTable[static_cast<std::size_t>(ordinal)];
}

int32_t ProficiencyEffects::ApplyStatEfficiency(int32_t stat, ProficiencyTier tier) {
    auto scaled = static_cast<float>(stat) * StatEfficiency(tier);
    return static_cast<int32_t>(std::lround(scaled));
}

std::string_view ProficiencyEffects::TierName(ProficiencyTier tier) {
    auto idx = static_cast<std::size_t>(tier);
    return idx < kProficiencyTierCount ? kTierNames[idx] : "Familiar";
}

std::optional<ProficiencyTier> ProficiencyEffects::ParseTier(std::string_view name) {
    for (std::size_t i = 0; i < kProficiencyTierCount; ++i) {
        if (kTierNames[i] == name) {
            return static_cast<ProficiencyTier>(i);
        }
    }
    return std::nullopt;
}

}  // namespace tbc::game
