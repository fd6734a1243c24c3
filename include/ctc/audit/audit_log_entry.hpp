#pragma once

/// @file audit_log_entry.hpp
/// @brief One audited action, serialized as a single NDJSON line.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ctc/audit/audit_config.hpp"
#include "ctc/foundation/time_source.hpp"
#include "ctc/foundation/types.hpp"

namespace ctc::audit {

/// Action type tags written to the `actionType` field.
namespace action_types {
inline constexpr std::string_view kSwingStart = "SwingStart";
inline constexpr std::string_view kSwingComplete = "SwingComplete";
inline constexpr std::string_view kHitResolution = "HitResolution";
inline constexpr std::string_view kSwingCancelled = "SwingCancelled";
inline constexpr std::string_view kSpellCastStart = "SpellCastStart";
inline constexpr std::string_view kSpellCastComplete = "SpellCastComplete";
inline constexpr std::string_view kSpellCastCancelled = "SpellCastCancelled";
inline constexpr std::string_view kBandageStart = "BandageStart";
inline constexpr std::string_view kBandageComplete = "BandageComplete";
inline constexpr std::string_view kBandageCancelled = "BandageCancelled";
inline constexpr std::string_view kWandStart = "WandStart";
inline constexpr std::string_view kWandComplete = "WandComplete";
inline constexpr std::string_view kWandCancelled = "WandCancelled";
inline constexpr std::string_view kShadowComparison = "ShadowComparison";
} // namespace action_types
/// |variance| above this is a timing anomaly.
inline constexpr double kAnomalyThresholdMs = 50.0;

/// Actor serial as the host prints it ("0x0000002A").
std::string formatSerial(foundation::ActorId id);

struct AuditLogEntry {
    /// Buffer position; assigned on record.
    uint64_t sequence = 0;
    /// Wall clock, Unix milliseconds.
    int64_t timestampMs = 0;
    /// Steady clock, for history windows.
    foundation::TimePoint recordedAt{};

    foundation::ActorId actorId;
    std::string actorName;
    std::string actionType;
    std::string timingProvider;

    double expectedDelayMs = 0.0;
    double actualDelayMs = 0.0;
    /// actual - expected
    double varianceMs = 0.0;

    int weaponId = 0;
    std::string weaponName;
    int dexterity = 0;

    std::vector<std::pair<std::string, std::string>> details;
    AuditLevel auditLevel = AuditLevel::Standard;

    /// Set or replace a detail.
    void addDetail(std::string key, std::string value);
    [[nodiscard]] std::optional<std::string> detail(std::string_view key) const;

    [[nodiscard]] bool isAnomaly(double thresholdMs = kAnomalyThresholdMs) const;

    /// One NDJSON line, without the trailing newline.
    [[nodiscard]] std::string toJson() const;

    /// Human readable one-liner for log warnings.
    [[nodiscard]] std::string toString() const;
};

} // namespace ctc::audit