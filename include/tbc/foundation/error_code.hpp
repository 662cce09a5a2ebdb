#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the tactical battle core.

#include <cstdint>
#include <string_view>

namespace tbc::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    CollaboratorMissing = 0x0005,

    // Turn (0x0100 - 0x01FF)
    TurnError = 0x0100,
    NotInTurnWindow = 0x0101,
    CombatNotRunning = 0x0102,
    CombatOver = 0x0103,
    UnitNotFound = 0x0104,
    EmptyRoster = 0x0105,
    AwaitingAcknowledgement = 0x0106,

    // Combat (0x0200 - 0x02FF)
    CombatError = 0x0200,
    UnitDead = 0x0201,
    InvalidTarget = 0x0202,
    TargetOutOfRange = 0x0203,
    AlreadyActed = 0x0204,
    ActionPrevented = 0x0205,
    SkillNotKnown = 0x0206,
    InvalidPosition = 0x0207,
    MovementPrevented = 0x0208,
    InsufficientMovement = 0x0209,

    // AI (0x0300 - 0x03FF)
    AIError = 0x0300,
    BehaviorNotAssigned = 0x0301,
    DecisionTimeout = 0x0302,
    TurnCancelled = 0x0303,
    TurnAlreadyInProgress = 0x0304,

    // Status (0x0400 - 0x04FF)
    StatusError = 0x0400,
    InvalidDuration = 0x0401,

    // Faction (0x0500 - 0x05FF)
    FactionError = 0x0500,
    UnknownFaction = 0x0501,
    UnknownRelationship = 0x0502,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigValueOutOfRange = 0x0603,

    // Timer (0x0700 - 0x07FF)
    TimerError = 0x0700,
    TimerNotFound = 0x0701,
    InvalidDelay = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Turn";
        case 0x0200: return "Combat";
        case 0x0300: return "AI";
        case 0x0400: return "Status";
        case 0x0500: return "Faction";
        case 0x0600: return "Config";
        case 0x0700: return "Timer";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace tbc::foundation
