/// @file weapon_timing_provider.cpp
/// @brief WeaponTimingProvider implementation.

#include "ctc/combat/weapon_timing_provider.hpp"

#include <algorithm>
#include <cmath>

namespace ctc::combat {

WeaponTimingProvider::WeaponTimingProvider(std::shared_ptr<const WeaponTimingTable> table)
    : table_(table ? std::move(table)
                   : std::make_shared<const WeaponTimingTable>(WeaponTimingTable::withBuiltins())) {}

int WeaponTimingProvider::computeIntervalMs(int speed, int dexterity, bool isPlayer) {
    const double baseMs = static_cast<double>(speed) * 40.0;

    int bonus = 0;
    if (isPlayer) {
        bonus = std::clamp(dexterity - kDexBaseline, kMinDexBonus, kMaxDexBonus);
    }

    double multiplier = 1.0;
    if (bonus > 0) {
        multiplier = 1.0 - bonus * 0.008;
    } else if (bonus < 0) {
        multiplier = 1.0 - bonus * 0.004;
    }

    // Nearest tick, halves away from zero.
    const auto ticks = std::lround(baseMs * multiplier / kTickMs);
    const auto rounded = static_cast<int>(ticks) * kTickMs;
    return std::clamp(rounded, kMinAttackIntervalMs, kMaxAttackIntervalMs);
}

int WeaponTimingProvider::attackIntervalMs(const IActor& attacker,
                                           const WeaponDescriptor* weapon) const {
    const auto& entry = table_->lookup(weapon);
    return computeIntervalMs(entry.speed, attacker.dexterity(), attacker.isPlayer());
}

int WeaponTimingProvider::hitOffsetMs(const WeaponDescriptor* weapon) const {
    return table_->lookup(weapon).hitOffsetMs;
}

int WeaponTimingProvider::animationDurationMs(const WeaponDescriptor* weapon) const {
    return table_->lookup(weapon).animationMs;
}

} // namespace ctc::combat