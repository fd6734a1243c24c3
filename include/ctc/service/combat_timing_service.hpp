#pragma once

/// @file combat_timing_service.hpp
/// @brief Facade composing the combat timing core for a host simulation.
///
/// Owns the timer states, the pulse, the swing and action orchestrators,
/// the audit and the shadow verifier, and wires their events together.

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ctc/audit/combat_audit.hpp"
#include "ctc/audit/shadow_verifier.hpp"
#include "ctc/combat/action_coordinator.hpp"
#include "ctc/combat/actor_state_registry.hpp"
#include "ctc/combat/attack_routine.hpp"
#include "ctc/combat/combat_events.hpp"
#include "ctc/combat/combat_handler.hpp"
#include "ctc/combat/combat_pulse.hpp"
#include "ctc/combat/timing_provider.hpp"
#include "ctc/foundation/game_result.hpp"
#include "ctc/foundation/time_source.hpp"
#include "ctc/foundation/timer_service.hpp"
#include "ctc/service/combat_timing_config.hpp"

namespace ctc::service {

/// Entry point of the combat timing core.
///
/// Usage:
/// @code
///   auto config = loadCombatTimingConfig(configManager);
///   CombatTimingService timing(config.value(), handler);
///
///   ThreadTimerService timers;
///   (void)timers.start();
///   (void)timing.start(timers);
///
///   timing.requestSwing(attacker, defender, weapon);
///   ...
///   timing.stop();
/// @endcode
class CombatTimingService {
public:
    /// @param clock Time source; null uses the steady clock.
    CombatTimingService(CombatTimingConfig config, combat::ICombatHandler& handler,
                        std::shared_ptr<const foundation::TimeSource> clock = nullptr);
    ~CombatTimingService();

    CombatTimingService(const CombatTimingService&) = delete;
    CombatTimingService& operator=(const CombatTimingService&) = delete;

    // -- Lifecycle ------------------------------------------------------------

    /// Start the pulse (probing @p timers until ready) and the audit flush timer.
    [[nodiscard]] foundation::GameResult<void> start(foundation::ITimerService& timers);

    /// Stop the pulse and flush the audit.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept;

    /// Execute one tick by hand (tests, harnesses without a timer service).
    combat::TickReport tick();

    // -- Swings ---------------------------------------------------------------

    [[nodiscard]] foundation::GameResult<combat::ScheduledAttack> requestSwing(
        const std::shared_ptr<combat::IActor>& attacker,
        const std::shared_ptr<combat::IActor>& defender,
        const std::optional<combat::WeaponDescriptor>& weapon);

    [[nodiscard]] bool canAttack(const combat::IActor& actor) const;

    bool cancelSwing(foundation::ActorId actor, std::string_view reason);

    // -- Spells, bandages, wands ----------------------------------------------

    [[nodiscard]] foundation::GameResult<void> beginSpell(
        const std::shared_ptr<combat::IActor>& caster, std::string spellName,
        std::optional<foundation::ActorId> target, std::chrono::milliseconds castTime);
    [[nodiscard]] foundation::GameResult<void> enterCastDelay(foundation::ActorId caster,
                                                              std::chrono::milliseconds delay);
    [[nodiscard]] foundation::GameResult<void> completeSpell(
        const std::shared_ptr<combat::IActor>& caster, std::chrono::milliseconds recovery);

    [[nodiscard]] foundation::GameResult<void> beginBandage(
        const std::shared_ptr<combat::IActor>& healer, std::optional<foundation::ActorId> patient,
        std::chrono::milliseconds healTime);
    [[nodiscard]] foundation::GameResult<void> completeBandage(
        const std::shared_ptr<combat::IActor>& healer, std::chrono::milliseconds delay);

    [[nodiscard]] foundation::GameResult<void> beginWand(
        const std::shared_ptr<combat::IActor>& user, std::string wandName,
        std::optional<foundation::ActorId> target, std::chrono::milliseconds useTime);
    [[nodiscard]] foundation::GameResult<void> completeWand(
        const std::shared_ptr<combat::IActor>& user, std::chrono::milliseconds delay);

    bool cancelAction(foundation::ActorId actor, combat::ActionCategory category,
                      std::string_view reason);

    [[nodiscard]] bool canPerform(const combat::IActor& actor,
                                  combat::ActionCategory category) const;

    /// Forget everything about an actor the host deleted.
    void onActorRemoved(foundation::ActorId actor);

    // -- Providers ------------------------------------------------------------

    /// Swap the active provider. Null is ignored.
    void setActiveProvider(std::shared_ptr<const combat::ITimingProvider> provider);
    [[nodiscard]] std::shared_ptr<const combat::ITimingProvider> activeProvider() const;

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] combat::TickStats performance() const;
    [[nodiscard]] std::string stateSummary(foundation::ActorId actor) const;

    [[nodiscard]] std::vector<audit::AuditLogEntry> auditSnapshot() const;
    [[nodiscard]] std::vector<audit::AuditLogEntry> actorHistory(
        foundation::ActorId actor,
        std::optional<std::chrono::milliseconds> window = std::nullopt) const;
    [[nodiscard]] foundation::GameResult<std::size_t> flushAudit();
    void clearAudit();
    [[nodiscard]] audit::AuditStats auditStats() const;

    /// Empty report with a message when shadow mode is off.
    [[nodiscard]] audit::ShadowReport shadowReport(
        std::optional<std::chrono::milliseconds> window = std::nullopt) const;

    /// Export to @p directory, or to the audit output directory.
    [[nodiscard]] foundation::GameResult<std::filesystem::path> exportShadowCsv(
        const std::optional<std::filesystem::path>& directory = std::nullopt) const;

    // -- Components -----------------------------------------------------------

    [[nodiscard]] combat::CombatEvents& events() noexcept;
    [[nodiscard]] combat::CombatPulse& pulse() noexcept;
    [[nodiscard]] combat::ActorStateRegistry& states() noexcept;
    [[nodiscard]] audit::CombatAudit& auditTrail() noexcept;
    /// Null unless shadow mode is enabled.
    [[nodiscard]] audit::ShadowVerifier* shadow() noexcept;

    [[nodiscard]] const CombatTimingConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ctc::service