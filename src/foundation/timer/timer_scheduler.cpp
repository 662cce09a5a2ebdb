/// @file timer_scheduler.cpp
/// @brief TimerScheduler implementation.

#include "tbc/foundation/timer_scheduler.hpp"

#include <string>

namespace tbc::foundation {

GameResult<TimerId> TimerScheduler::scheduleAfter(Duration delay, Callback callback) {
    if (delay.count() < 0) {
        return GameResult<TimerId>::err(
            GameError(ErrorCode::InvalidDelay,
                      "negative timer delay: " + std::to_string(delay.count()) + "ms"));
    }
    if (!callback) {
        return GameResult<TimerId>::err(
            GameError(ErrorCode::InvalidArgument, "timer callback is empty"));
    }

    auto id = nextId_++;
    auto due = now_ + delay;
    queue_.emplace(Key{due, id}, std::move(callback));
    byId_.emplace(id, due);
    return GameResult<TimerId>::ok(id);
}

GameResult<void> TimerScheduler::cancel(TimerId id) {
    auto it = byId_.find(id);
    if (it == byId_.end()) {
        return GameResult<void>::err(
            GameError(ErrorCode::TimerNotFound, "timer not pending: " + std::to_string(id)));
    }
    queue_.erase(Key{it->second, id});
    byId_.erase(it);
    return GameResult<void>::ok();
}

std::size_t TimerScheduler::advance(Duration delta) {
    if (delta.count() < 0) {
        return 0;
    }
    auto target = now_ + delta;
    auto fired = fireDue(target);
    now_ = target;
    return fired;
}

std::size_t TimerScheduler::runUntilIdle(Duration limit) {
    auto deadline = now_ + limit;
    std::size_t fired = 0;
    while (!queue_.empty() && queue_.begin()->first.first <= deadline) {
        fired += fireDue(queue_.begin()->first.first);
    }
    if (!queue_.empty()) {
        now_ = deadline;
    }
    return fired;
}

void TimerScheduler::clear() {
    queue_.clear();
    byId_.clear();
}

std::size_t TimerScheduler::fireDue(Duration until) {
    std::size_t fired = 0;
    while (!queue_.empty()) {
        auto it = queue_.begin();
        auto [due, id] = it->first;
        if (due > until) {
            break;
        }
        // Detach before invoking so the callback can reschedule or cancel freely.
        auto callback = std::move(it->second);
        queue_.erase(it);
        byId_.erase(id);
        now_ = due;
        callback();
        ++fired;
    }
    return fired;
}

}  // namespace tbc::foundation
