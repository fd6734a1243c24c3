/// @file legacy_timing_provider.cpp
/// @brief LegacyTimingProvider implementation.

#include "ctc/combat/legacy_timing_provider.hpp"

#include <algorithm>

namespace ctc::combat {

int LegacyTimingProvider::computeLegacyDelayMs(double baseSpeedSeconds, int dexterity) {
    if (baseSpeedSeconds <= 0.0) {
        return kNoDataIntervalMs;
    }
    double scaled = baseSpeedSeconds / (1.0 + (dexterity - kDexBaseline) * 0.002);
    scaled = std::clamp(scaled, baseSpeedSeconds * 0.5, baseSpeedSeconds * 2.0);
    return static_cast<int>(scaled * 1000.0);
}

int LegacyTimingProvider::attackIntervalMs(const IActor& attacker,
                                           const WeaponDescriptor* weapon) const {
    if (weapon == nullptr) {
        return kNoDataIntervalMs;
    }
    return computeLegacyDelayMs(weapon->legacySpeedSeconds, attacker.dexterity());
}

int LegacyTimingProvider::hitOffsetMs(const WeaponDescriptor* weapon) const {
    return defaults_.classDefault(classifyWeapon(weapon)).hitOffsetMs;
}

int LegacyTimingProvider::animationDurationMs(const WeaponDescriptor* weapon) const {
    return defaults_.classDefault(classifyWeapon(weapon)).animationMs;
}

} // namespace ctc::combat