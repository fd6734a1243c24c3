/// @file combat_logger.cpp
/// @brief CombatLogger implementation on top of the kcenon logger registry.

#include "ctc/foundation/combat_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <string>

namespace ctc::foundation {

namespace kci = kcenon::common::interfaces;

static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // Pulse
    LogLevel::Info,   // Timing
    LogLevel::Debug,  // Combat
    LogLevel::Info,   // Audit
    LogLevel::Debug,  // Shadow
    LogLevel::Info    // Config
};

static std::string formatContext(const LogContext& ctx) {
    std::string out;
    auto append = [&out](std::string_view key, std::string_view val) {
        if (!out.empty()) {
            out += ", ";
        }
        out += key;
        out += '=';
        out += val;
    };

    if (ctx.actorId && ctx.actorId->isValid()) {
        append("actor", std::to_string(ctx.actorId->value()));
    }
    if (ctx.targetId && ctx.targetId->isValid()) {
        append("target", std::to_string(ctx.targetId->value()));
    }
    if (ctx.action && !ctx.action->empty()) {
        append("action", *ctx.action);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct CombatLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = "ctc." + std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    /// Named logger "ctc.<Category>" when the host registered one, else the default.
    std::shared_ptr<kci::ILogger> resolve(LogCategory cat) const {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto named = registry.get_logger(loggerNames[static_cast<std::size_t>(cat)]);
        if (named && named != kci::GlobalLoggerRegistry::null_logger()) {
            return named;
        }
        return registry.get_default_logger();
    }

    void write(LogLevel level, LogCategory cat, std::string_view msg, std::string_view ctx) {
        auto logger = resolve(cat);
        if (!logger) {
            return;
        }

        // [Category] message {key=val, ...}
        std::string line;
        line.reserve(msg.size() + ctx.size() + 16);
        line += '[';
        line += logCategoryName(cat);
        line += "] ";
        line += msg;
        if (!ctx.empty()) {
            line += " {";
            line += ctx;
            line += '}';
        }
        logger->log(mapLevel(level), line);
    }
};

CombatLogger::CombatLogger() : impl_(std::make_unique<Impl>()) {}

CombatLogger::~CombatLogger() = default;

CombatLogger::CombatLogger(CombatLogger&&) noexcept = default;
CombatLogger& CombatLogger::operator=(CombatLogger&&) noexcept = default;

void CombatLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, msg, {});
}

void CombatLogger::logWithContext(LogLevel level, LogCategory cat,
                                  std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, msg, formatContext(ctx));
}

void CombatLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel CombatLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount) {
        return LogLevel::Off;
    }
    return impl_->categoryLevels[idx].load(std::memory_order_acquire);
}

bool CombatLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

void CombatLogger::resetLevels() {
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        impl_->categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_release);
    }
}

GameResult<void> CombatLogger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    if (!logger) {
        return GameResult<void>::ok();
    }
    auto result = logger->flush();
    if (result.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GameResult<void>::ok();
}

CombatLogger& CombatLogger::instance() {
    static CombatLogger inst;
    return inst;
}

} // namespace ctc::foundation