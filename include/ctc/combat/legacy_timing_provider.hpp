#pragma once

/// @file legacy_timing_provider.hpp
/// @brief Reference provider reproducing the legacy speed formula.

#include "ctc/combat/timing_provider.hpp"
#include "ctc/combat/weapon_timing_table.hpp"

namespace ctc::combat {

/// Legacy per-weapon delay used as the shadow-mode reference.
///
/// delay = baseSpeedSeconds / (1 + (dex - 50) * 0.002), clamped to
/// [0.5, 2.0] x base, in milliseconds and without tick rounding. Weapons
/// without legacy speed data, and unarmed swings, get 1500 ms. Hit offset
/// and animation duration come from class defaults only.
class LegacyTimingProvider final : public ITimingProvider {
public:
    static constexpr int kDexBaseline = 50;
    static constexpr int kNoDataIntervalMs = 1500;

    LegacyTimingProvider() = default;

    [[nodiscard]] std::string_view name() const noexcept override {
        return "LegacySphereTimingAdapter";
    }

    [[nodiscard]] int attackIntervalMs(const IActor& attacker,
                                       const WeaponDescriptor* weapon) const override;
    [[nodiscard]] int hitOffsetMs(const WeaponDescriptor* weapon) const override;
    [[nodiscard]] int animationDurationMs(const WeaponDescriptor* weapon) const override;

    [[nodiscard]] static int computeLegacyDelayMs(double baseSpeedSeconds, int dexterity);

private:
    // Class defaults only; never filled with per-item entries.
    WeaponTimingTable defaults_;
};

} // namespace ctc::combat