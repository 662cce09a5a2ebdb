#pragma once

/// @file timer_scheduler.hpp
/// @brief Single-threaded virtual-time timer queue for battle pacing.

#include "tbc/foundation/game_result.hpp"
#include "tbc/foundation/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>

namespace tbc::foundation {

/// Deterministic one-shot timer queue driven by the host's game loop.
///
/// Time only moves when advance() is called, which makes AI thinking
/// delays, movement animations and decision timeouts reproducible in tests.
/// Timers due at the same instant fire in the order they were scheduled.
/// A callback may schedule or cancel other timers; a timer it schedules
/// that falls due inside the current advance() window fires in the same call.
///
/// Example:
/// @code
///   TimerScheduler timers;
///   auto id = timers.scheduleAfter(std::chrono::milliseconds(1500),
///                                  [] { decide(); });
///   timers.advance(std::chrono::milliseconds(16));  // once per frame
///   timers.cancel(id.value());
/// @endcode
class TimerScheduler {
public:
    using Callback = std::function<void()>;
    using Duration = std::chrono::milliseconds;

    TimerScheduler() = default;

    TimerScheduler(const TimerScheduler&) = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;

    /// Schedule @p callback to run once @p delay of virtual time has elapsed.
    /// @return The TimerId, or InvalidDelay / InvalidArgument.
    GameResult<TimerId> scheduleAfter(Duration delay, Callback callback);

    /// Cancel a pending timer.
    /// @return Success, or TimerNotFound if it already fired or never existed.
    GameResult<void> cancel(TimerId id);

    /// Advance virtual time by @p delta, firing every timer that falls due.
    /// @return The number of callbacks invoked.
    std::size_t advance(Duration delta);

    /// Repeatedly jump to the next due timer until the queue is empty or
    /// @p limit of virtual time has elapsed.
    /// @return The number of callbacks invoked.
    std::size_t runUntilIdle(Duration limit);

    /// Current virtual time since construction.
    [[nodiscard]] Duration now() const noexcept { return now_; }

    [[nodiscard]] std::size_t pendingCount() const noexcept { return byId_.size(); }

    [[nodiscard]] bool isPending(TimerId id) const { return byId_.count(id) > 0; }

    /// Drop every pending timer without running it.
    void clear();

private:
    // Ordered by (due time, id); ids are monotonic so ties keep scheduling order.
    using Key = std::pair<Duration, TimerId>;

    std::size_t fireDue(Duration until);

    Duration now_{0};
    TimerId nextId_ = 1;
    std::map<Key, Callback> queue_;
    std::unordered_map<TimerId, Duration> byId_;
};

}  // namespace tbc::foundation
