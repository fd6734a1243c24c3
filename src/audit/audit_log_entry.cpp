/// @file audit_log_entry.cpp
/// @brief AuditLogEntry serialization.

#include "ctc/audit/audit_log_entry.hpp"

#include <cmath>
#include <cstdio>

#include "ctc/foundation/json_writer.hpp"

namespace ctc::audit {

std::string formatSerial(foundation::ActorId id) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%08llX", static_cast<unsigned long long>(id.value()));
    return buf;
}

void AuditLogEntry::addDetail(std::string key, std::string value) {
    for (auto& [k, v] : details) {
        if (k == key) {
            v = std::move(value);
            return;
        }
    }
    details.emplace_back(std::move(key), std::move(value));
}

std::optional<std::string> AuditLogEntry::detail(std::string_view key) const {
    for (const auto& [k, v] : details) {
        if (k == key) {
            return v;
        }
    }
    return std::nullopt;
}

bool AuditLogEntry::isAnomaly(double thresholdMs) const {
    return std::abs(varianceMs) > thresholdMs;
}

std::string AuditLogEntry::toJson() const {
    foundation::JsonObjectWriter json;
    json.field("timestamp", timestampMs)
        .field("serial", formatSerial(actorId))
        .field("name", actorName)
        .field("actionType", actionType)
        .field("timingProvider", timingProvider)
        .field("expectedDelayMs", expectedDelayMs)
        .field("actualDelayMs", actualDelayMs)
        .field("varianceMs", varianceMs)
        .field("weaponId", weaponId)
        .field("weaponName", weaponName)
        .field("dexterity", dexterity)
        .object("details", details)
        .field("auditLevel", auditLevelName(auditLevel));
    return json.finish();
}

std::string AuditLogEntry::toString() const {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "%.1fms (expected %.1fms, %+.1fms)", actualDelayMs,
                  expectedDelayMs, varianceMs);
    return "[" + std::to_string(timestampMs) + "] " + actorName + " (" + formatSerial(actorId) +
           ") - " + actionType + ": " + buf;
}

} // namespace ctc::audit