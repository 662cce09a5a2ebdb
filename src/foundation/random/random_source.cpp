#include "tbc/foundation/random_source.hpp"

#include <algorithm>

namespace tbc::foundation {

MersenneRandomSource::MersenneRandomSource(uint32_t seed) : engine_(seed) {}

float MersenneRandomSource::rollPercent() {
    // Keep the upper bound exclusive even after float rounding.
    return std::min(unit_(engine_) * 100.0f, 99.999f);
}

float MersenneRandomSource::chance() {
    return std::min(unit_(engine_), 0.99999f);
}

void MersenneRandomSource::reseed(uint32_t seed) {
    engine_.seed(seed);
    unit_.reset();
}

ScriptedRandomSource::ScriptedRandomSource(std::initializer_list<float> draws, float fallback)
    : draws_(draws), fallback_(fallback) {}

float ScriptedRandomSource::rollPercent() {
    return next(fallback_);
}

float ScriptedRandomSource::chance() {
    return next(fallback_ / 100.0f);
}

void ScriptedRandomSource::push(float draw) {
    draws_.push_back(draw);
}

float ScriptedRandomSource::next(float fallback) {
    ++consumed_;
    if (draws_.empty()) {
        return fallback;
    }
    auto value = draws_.front();
    draws_.pop_front();
    return value;
}

} // namespace tbc::foundation
