#pragma once

/// @file random_source.hpp
/// @brief Injectable random sources for combat rolls and AI probability gates.

#include <cstdint>
#include <deque>
#include <initializer_list>
#include <random>

namespace tbc::foundation {

/// Source of uniform draws used by every stochastic battle decision.
///
/// Combat math and AI gates never touch global random state; they draw from
/// the RandomSource handed to them, so a battle replays exactly under a
/// fixed seed or a scripted sequence.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Uniform draw in [0, 100).
    virtual float rollPercent() = 0;

    /// Uniform draw in [0, 1).
    virtual float chance() = 0;
};

/// std::mt19937-backed source for real battles.
class MersenneRandomSource final : public RandomSource {
public:
    explicit MersenneRandomSource(uint32_t seed = std::mt19937::default_seed);

    float rollPercent() override;
    float chance() override;

    void reseed(uint32_t seed);

private:
    std::mt19937 engine_;
    std::uniform_real_distribution<float> unit_{0.0f, 1.0f};
};

/// Replays a fixed list of draws; used to pin down exact outcomes in tests.
///
/// rollPercent() and chance() consume the same queue in call order. When the
/// queue runs dry every further draw returns the fallback value, interpreted
/// on the percent scale (chance() returns fallback / 100).
class ScriptedRandomSource final : public RandomSource {
public:
    ScriptedRandomSource(std::initializer_list<float> draws, float fallback = 50.0f);

    float rollPercent() override;
    float chance() override;

    /// Append further draws to the end of the queue.
    void push(float draw);

    [[nodiscard]] std::size_t remaining() const noexcept { return draws_.size(); }
    [[nodiscard]] std::size_t consumed() const noexcept { return consumed_; }

private:
    float next(float fallback);

    std::deque<float> draws_;
    float fallback_;
    std::size_t consumed_ = 0;
};

} // namespace tbc::foundation
