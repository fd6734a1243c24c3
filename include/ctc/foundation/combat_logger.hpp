#pragma once

/// @file combat_logger.hpp
/// @brief CombatLogger wrapping kcenon common_system logging for the timing core.
///
/// Category-based filtering, structured context and per-category runtime
/// levels. The kcenon registry stays hidden behind PIMPL; hosts plug their
/// own backend in through GlobalLoggerRegistry.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "ctc/foundation/game_result.hpp"
#include "ctc/foundation/types.hpp"

namespace ctc::foundation {

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

/// Subsystems of the timing core, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core   = 0, ///< Service lifecycle and wiring
    Pulse  = 1, ///< Global tick scheduler
    Timing = 2, ///< Interval providers and weapon table
    Combat = 3, ///< Swing/spell/bandage/wand orchestration
    Audit  = 4, ///< Audit buffer and flushes
    Shadow = 5, ///< Shadow provider comparison
    Config = 6  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Pulse", "Timing", "Combat", "Audit", "Shadow", "Config"
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

/// Structured context appended to a log line as `{key=value, ...}`.
///
/// @code
///   LogContext ctx;
///   ctx.actorId = attacker.id();
///   ctx.action = "swing";
///   ctx.extra["interval_ms"] = "1450";
///   CombatLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Combat,
///                                           "Swing scheduled", ctx);
/// @endcode
struct LogContext {
    std::optional<ActorId> actorId;
    std::optional<ActorId> targetId;
    std::optional<std::string> action;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger for the combat timing core.
///
/// Default levels: Combat and Shadow at Debug, everything else at Info.
class CombatLogger {
public:
    CombatLogger();
    ~CombatLogger();

    CombatLogger(const CombatLogger&) = delete;
    CombatLogger& operator=(const CombatLogger&) = delete;
    CombatLogger(CombatLogger&&) noexcept;
    CombatLogger& operator=(CombatLogger&&) noexcept;

    /// Log under a category. No-op below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Restore the default level of every category.
    void resetLevels();

    GameResult<void> flush();

    static CombatLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ctc::foundation
// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// @name CTC_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define CTC_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold (0=Trace ... 6=Off).
/// @{

#ifndef CTC_MIN_LOG_LEVEL
    #define CTC_MIN_LOG_LEVEL 0
#endif

#define CTC_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= CTC_MIN_LOG_LEVEL &&                        \
            ::ctc::foundation::CombatLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::ctc::foundation::CombatLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define CTC_LOG_DEBUG(cat, msg) \
    CTC_LOG(::ctc::foundation::LogLevel::Debug, (cat), (msg))

#define CTC_LOG_INFO(cat, msg) \
    CTC_LOG(::ctc::foundation::LogLevel::Info, (cat), (msg))

#define CTC_LOG_WARN(cat, msg) \
    CTC_LOG(::ctc::foundation::LogLevel::Warning, (cat), (msg))

#define CTC_LOG_ERROR(cat, msg) \
    CTC_LOG(::ctc::foundation::LogLevel::Error, (cat), (msg))

/// @}
