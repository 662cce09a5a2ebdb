#pragma once

/// @file cancellation.hpp
/// @brief Cooperative cancellation for asynchronous per-unit turns.

#include <atomic>
#include <memory>

namespace tbc::foundation {

/// Read side of a cancellation flag.
///
/// Copies share the same flag. A default-constructed token can never be
/// cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool isCancelled() const noexcept {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

    [[nodiscard]] bool canBeCancelled() const noexcept { return static_cast<bool>(flag_); }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

/// Write side of a cancellation flag. Cancellation is one-way.
class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    [[nodiscard]] CancellationToken token() const { return CancellationToken(flag_); }

    /// Request cancellation. Returns true only for the first call.
    bool cancel() noexcept {
        return !flag_->exchange(true, std::memory_order_acq_rel);
    }

    [[nodiscard]] bool isCancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace tbc::foundation
