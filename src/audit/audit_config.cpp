/// @file audit_config.cpp
/// @brief AuditConfig validation and level parsing.

#include "ctc/audit/audit_config.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace ctc::audit {

std::optional<AuditLevel> parseAuditLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "none") {
        return AuditLevel::None;
    }
    if (lower == "standard") {
        return AuditLevel::Standard;
    }
    if (lower == "detailed") {
        return AuditLevel::Detailed;
    }
    if (lower == "debug") {
        return AuditLevel::Debug;
    }
    return std::nullopt;
}

void AuditConfig::validate() {
    bufferSize = std::clamp<std::size_t>(bufferSize, 100, 100000);
    flushIntervalMs = std::clamp(flushIntervalMs, 1000, 60000);
    if (outputDirectory.empty()) {
        outputDirectory = "logs/combat-audit";
    }
    retentionDays = std::max(retentionDays, 0);
    maxFileSizeMB = std::clamp(maxFileSizeMB, 0, 1000);
    maxEntriesPerTick = std::clamp(maxEntriesPerTick, 10, 1000);
    autoThrottleThresholdMs = std::clamp(autoThrottleThresholdMs, 0.0, 100.0);
    actorHistorySize = std::clamp<std::size_t>(actorHistorySize, 10, 1000);
    shadowSampleEvery = std::max(shadowSampleEvery, 1);
}

} // namespace ctc::audit