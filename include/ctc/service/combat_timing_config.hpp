#pragma once

/// @file combat_timing_config.hpp
/// @brief Validated configuration of the combat timing service, read from YAML.

#include <memory>

#include "ctc/audit/audit_config.hpp"
#include "ctc/combat/action_coordinator.hpp"
#include "ctc/combat/actor_timer_state.hpp"
#include "ctc/combat/combat_pulse.hpp"
#include "ctc/combat/weapon_timing_table.hpp"
#include "ctc/foundation/config_manager.hpp"
#include "ctc/foundation/game_result.hpp"

namespace ctc::service {

// -- Rule switches ------------------------------------------------------------

/// Block and cancel behaviour between action categories.
struct CombatRuleFlags {
    bool spellCancelSwing = true;
    bool swingCancelSpell = true;
    /// Bandaging cancels a pending swing and an active cast.
    bool bandageCancelActions = true;
    /// Wand use cancels a pending swing and an active cast.
    bool wandCancelActions = true;
    bool disableSwingDuringCast = true;
    bool disableSwingDuringCastDelay = true;

    bool removePostCastRecovery = false;
    bool instantWandCast = false;
    bool independentBandageTimer = true;

    /// Block/cancel matrices for the timer states.
    [[nodiscard]] combat::TimerRules toTimerRules() const;

    [[nodiscard]] combat::CoordinatorOptions coordinatorOptions() const;
};

// -- Configuration ------------------------------------------------------------

struct CombatTimingConfig {
    combat::PulseSettings pulse;

    /// Per-category timers in the core; false uses the actor's shared cooldowns.
    bool independentTimers = true;
    bool logCancellations = false;

    CombatRuleFlags rules;
    audit::AuditConfig auditSettings;

    /// Weapon timings; null means the built-in table.
    std::shared_ptr<const combat::WeaponTimingTable> weapons;

    /// Clamp every value into its supported range.
    void validate();
};

/// Map the `combat.*`, `audit.*` and `weapons.*` keys of @p config.
///
/// Missing keys keep their defaults. A weapon table that fails to load is
/// logged and replaced by the built-in table.
/// @return The validated config, or ConfigTypeMismatch for a malformed value.
[[nodiscard]] foundation::GameResult<CombatTimingConfig> loadCombatTimingConfig(
    const foundation::ConfigManager& config);

} // namespace ctc::service