#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon common_system logger interfaces.
///
/// Diagnostic logging only: the player-visible narrative produced by the
/// battle engine is returned as a BattleLog and never routed through here.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tbe/foundation/game_result.hpp"

namespace tbe::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Startup, shutdown, executable plumbing
    Config      = 1, ///< Configuration loading and lookups
    Battle      = 2, ///< Turn engine state transitions
    Action      = 3, ///< Action resolution and damage computation
    Status      = 4, ///< Status effect application and resolution
    Progression = 5, ///< Experience and leveling
    Content     = 6  ///< Species/action loading and persistence
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Config", "Battle", "Action", "Status", "Progression", "Content"
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

/// Parse a level name ("debug", "INFO", ...). Case-insensitive.
GameResult<LogLevel> parseLogLevel(std::string_view name);

/// Structured context attached to a diagnostic log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.character = "Rock Pawn";
///   ctx.round = 3;
///   ctx.extra["damage"] = "12";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Action,
///                         "Damage applied", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> character;
    std::optional<uint32_t> round;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-filtered logger forwarding to kcenon's GlobalLoggerRegistry.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Config      | Info          |
/// | Battle      | Debug         |
/// | Action      | Debug         |
/// | Status      | Debug         |
/// | Progression | Info          |
/// | Content     | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with context fields appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    GameResult<void> flush();

    /// Process-wide instance used by the TBE_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tbe::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// TBE_MIN_LOG_LEVEL can be defined before including this header to drop
/// logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
#ifndef TBE_MIN_LOG_LEVEL
    #define TBE_MIN_LOG_LEVEL 0
#endif

#define TBE_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= TBE_MIN_LOG_LEVEL &&                      \
            ::tbe::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::tbe::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define TBE_LOG_DEBUG(cat, msg) \
    TBE_LOG(::tbe::foundation::LogLevel::Debug, (cat), (msg))

#define TBE_LOG_INFO(cat, msg) \
    TBE_LOG(::tbe::foundation::LogLevel::Info, (cat), (msg))

#define TBE_LOG_WARN(cat, msg) \
    TBE_LOG(::tbe::foundation::LogLevel::Warning, (cat), (msg))

#define TBE_LOG_ERROR(cat, msg) \
    TBE_LOG(::tbe::foundation::LogLevel::Error, (cat), (msg))
