#pragma once

/// @file weapon_timing_provider.hpp
/// @brief Primary, table-driven timing provider with tick rounding.

#include <memory>

#include "ctc/combat/timing_provider.hpp"
#include "ctc/combat/weapon_timing_table.hpp"

namespace ctc::combat {

/// Table-driven provider.
///
/// interval = round((speed * 40) * multiplier / 50) * 50, clamped to
/// [200, 4000] ms. The multiplier comes from a dexterity bonus relative to
/// 100, clamped to [-50, +25], that only players receive:
/// 1 - bonus * 0.008 above the baseline, 1 - bonus * 0.004 below it.
class WeaponTimingProvider final : public ITimingProvider {
public:
    static constexpr int kDexBaseline = 100;
    static constexpr int kMinDexBonus = -50;
    static constexpr int kMaxDexBonus = 25;

    explicit WeaponTimingProvider(std::shared_ptr<const WeaponTimingTable> table);

    [[nodiscard]] std::string_view name() const noexcept override { return "WeaponTimingProvider"; }

    [[nodiscard]] int attackIntervalMs(const IActor& attacker,
                                       const WeaponDescriptor* weapon) const override;
    [[nodiscard]] int hitOffsetMs(const WeaponDescriptor* weapon) const override;
    [[nodiscard]] int animationDurationMs(const WeaponDescriptor* weapon) const override;

    /// The formula itself, exposed for verification tooling.
    [[nodiscard]] static int computeIntervalMs(int speed, int dexterity, bool isPlayer);

    [[nodiscard]] const WeaponTimingTable& table() const noexcept { return *table_; }

private:
    std::shared_ptr<const WeaponTimingTable> table_;
};

} // namespace ctc::combat