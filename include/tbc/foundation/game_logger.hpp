#pragma once

/// @file game_logger.hpp
/// @brief Category-filtered battle logging on top of the kcenon logger interface.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tbc/foundation/game_result.hpp"
#include "tbc/foundation/types.hpp"

namespace tbc::foundation {

/// Severity, mirrored one-to-one onto kcenon's log_level.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Battle subsystems used for structured filtering.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Foundation services (timers, config plumbing)
    Turn    = 1, ///< Turn order, windows, rounds, victory
    Combat  = 2, ///< Attack resolution and action execution
    AI      = 3, ///< Decision making and AI turn sequencing
    Status  = 4, ///< Status effect ticks
    Faction = 5, ///< Faction relationship changes
    Config  = 6, ///< Configuration loading
    Session = 7  ///< Battle session lifecycle
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Turn", "Combat", "AI", "Status", "Faction", "Config", "Session"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Fields rendered after the message as "{combatant=7, target=3, round=2, key=value}".
struct LogContext {
    std::optional<CombatantId> combatantId;
    std::optional<CombatantId> targetId;
    std::optional<int32_t> round;
    std::unordered_map<std::string, std::string> extra;
};

/// Each category writes to the registry logger "tbc.<Category>", or to the
/// registry default when none is registered. Combat, AI and Status start at
/// Debug; every other category starts at Info.
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;

    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    GameResult<void> flush();

    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tbc::foundation

// Calls below TBC_MIN_LOG_LEVEL (a LogLevel ordinal) compile to nothing.
#ifndef TBC_MIN_LOG_LEVEL
    #define TBC_MIN_LOG_LEVEL 0
#endif

#define TBC_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= TBC_MIN_LOG_LEVEL &&                      \
            ::tbc::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::tbc::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define TBC_LOG_DEBUG(cat, msg) \
    TBC_LOG(::tbc::foundation::LogLevel::Debug, (cat), (msg))

#define TBC_LOG_INFO(cat, msg) \
    TBC_LOG(::tbc::foundation::LogLevel::Info, (cat), (msg))

#define TBC_LOG_WARN(cat, msg) \
    TBC_LOG(::tbc::foundation::LogLevel::Warning, (cat), (msg))

#define TBC_LOG_ERROR(cat, msg) \
    TBC_LOG(::tbc::foundation::LogLevel::Error, (cat), (msg))
