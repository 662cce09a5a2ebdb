#pragma once

/// @file types.hpp
/// @brief Strong ID types shared by every battle subsystem.

#include <cstdint>
#include <functional>

namespace tbc::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Keeps a CombatantId from being passed where a SkillId is expected
/// while sharing the same underlying representation.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct CombatantIdTag {};
struct SkillIdTag {};

/// Stable identity of a battle participant. Zero is the null id.
using CombatantId = StrongId<CombatantIdTag>;

/// Identifier of a skill definition known to a combatant.
using SkillId = StrongId<SkillIdTag, uint32_t>;

/// Handle returned by TimerScheduler::scheduleAfter.
using TimerId = uint64_t;

/// Invalid/null sentinel for any ID type.
template <typename Tag, typename T>
constexpr StrongId<Tag, T> NULL_ID{};

} // namespace tbc::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<tbc::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const tbc::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
