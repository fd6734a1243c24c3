#pragma once

/// @file audit_config.hpp
/// @brief Audit verbosity levels and buffer/flush settings.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace ctc::audit {

/// How much the audit records. Ordered: a higher level records everything
/// a lower one does.
enum class AuditLevel : uint8_t {
    None     = 0,
    /// Swings and spells.
    Standard = 1,
    /// Adds bandages, wands and anomaly warnings.
    Detailed = 2,
    /// Adds shadow comparison entries.
    Debug    = 3
};

constexpr std::string_view auditLevelName(AuditLevel level) {
    switch (level) {
        case AuditLevel::None:     return "None";
        case AuditLevel::Standard: return "Standard";
        case AuditLevel::Detailed: return "Detailed";
        case AuditLevel::Debug:    return "Debug";
    }
    return "Unknown";
}

/// Case-insensitive parse of a level name.
std::optional<AuditLevel> parseAuditLevel(std::string_view name);

struct AuditConfig {
    bool enabled = true;
    AuditLevel level = AuditLevel::Standard;
    std::filesystem::path outputDirectory = "logs/combat-audit";
    std::size_t bufferSize = 10000;
    int flushIntervalMs = 5000;

    bool shadowMode = false;
    /// Compare every Nth swing.
    int shadowSampleEvery = 1;

    /// 0 keeps every file.
    int retentionDays = 7;
    /// 0 disables size rotation.
    int maxFileSizeMB = 100;
    int maxEntriesPerTick = 250;
    /// 0 disables auto-throttle.
    double autoThrottleThresholdMs = 10.0;

    bool actorHistory = true;
    std::size_t actorHistorySize = 100;

    /// Clamp every field into its supported range.
    void validate();
};

} // namespace ctc::audit