#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> for observer-style battle notifications.
///
/// Slots (callbacks) are registered via connect() and invoked when emit() is
/// called. Emission snapshots the slot list first, so a slot may connect or
/// disconnect (including itself) while the signal is firing.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace tbc::foundation {

/// Signal dispatching an event to registered callbacks in connection order.
///
/// @tparam Args The argument types passed to each slot when the signal fires.
///
/// Example:
/// @code
///   Signal<CombatantId> unitDefeated;
///   auto id = unitDefeated.connect([](CombatantId who) {
///       std::cout << "unit " << who.value() << " defeated\n";
///   });
///   unitDefeated.emit(CombatantId(42));
///   unitDefeated.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;
    ~Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) = delete;
    Signal& operator=(Signal&&) = delete;

    /// Register a callback. Returns a SlotId for later disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        slots_.emplace(id, std::move(slot));
        return id;
    }

    /// Remove a previously registered callback by its SlotId.
    void disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        slots_.erase(id);
    }

    /// Remove every registered callback.
    void disconnectAll() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

    /// Fire the signal, invoking every registered slot with the given args.
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& [id, slot] : slots_) {
                snapshot.push_back(slot);
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

private:
    // Ordered by id so slots fire in connection order.
    std::map<SlotId, Slot> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

/// RAII handle that disconnects a slot when destroyed.
///
/// The owner of the handle must not outlive the signal it points at.
class ScopedConnection {
public:
    ScopedConnection() = default;

    template <typename... Args>
    ScopedConnection(Signal<Args...>& signal, typename Signal<Args...>::SlotId id)
        : disconnect_([&signal, id] { signal.disconnect(id); }) {}

    ~ScopedConnection() { reset(); }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    ScopedConnection(ScopedConnection&& other) noexcept
        : disconnect_(std::move(other.disconnect_)) {
        other.disconnect_ = nullptr;
    }

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            reset();
            disconnect_ = std::move(other.disconnect_);
            other.disconnect_ = nullptr;
        }
        return *this;
    }

    /// Disconnect now; further calls are no-ops.
    void reset() {
        if (disconnect_) {
            disconnect_();
            disconnect_ = nullptr;
        }
    }

    /// Forget the slot without disconnecting it.
    void release() noexcept { disconnect_ = nullptr; }

    [[nodiscard]] bool connected() const noexcept { return static_cast<bool>(disconnect_); }

private:
    std::function<void()> disconnect_;
};

/// Connect @p slot to @p signal and return an owning ScopedConnection.
template <typename... Args, typename F>
[[nodiscard]] ScopedConnection connectScoped(Signal<Args...>& signal, F&& slot) {
    auto id = signal.connect(std::forward<F>(slot));
    return ScopedConnection(signal, id);
}

} // namespace tbc::foundation
