#pragma once

/// @file game_error.hpp
/// @brief Battle-core error type used with Result<T, GameError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "tbc/foundation/error_code.hpp"

namespace tbc::foundation {

/// Recovery class of an error.
///
/// None of these is fatal: invalid input is refused locally, a missing
/// collaborator aborts the current operation, and a timeout cancels the
/// in-flight turn.
enum class ErrorKind : uint8_t {
    InvalidInput,
    MissingCollaborator,
    Timeout,
    Internal
};

/// Classify an error code into its recovery class.
constexpr ErrorKind errorKind(ErrorCode code) {
    switch (code) {
        case ErrorCode::CollaboratorMissing:
        case ErrorCode::BehaviorNotAssigned:
        case ErrorCode::LoggerNotInitialized:
            return ErrorKind::MissingCollaborator;
        case ErrorCode::DecisionTimeout:
        case ErrorCode::TurnCancelled:
            return ErrorKind::Timeout;
        case ErrorCode::Unknown:
        case ErrorCode::TurnError:
        case ErrorCode::CombatError:
        case ErrorCode::AIError:
        case ErrorCode::StatusError:
        case ErrorCode::FactionError:
        case ErrorCode::TimerError:
        case ErrorCode::LoggerError:
        case ErrorCode::LoggerFlushFailed:
        case ErrorCode::ConfigLoadFailed:
            return ErrorKind::Internal;
        default:
            return ErrorKind::InvalidInput;
    }
}

/// Rich error type carrying an error code, human-readable message,
/// and optional type-erased context data (usually the CombatantId involved).
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    [[nodiscard]] ErrorKind kind() const noexcept { return errorKind(code_); }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace tbc::foundation
