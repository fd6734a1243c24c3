#pragma once

/// @file attack_routine.hpp
/// @brief Swing orchestration: animation now, hit resolution later.

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "ctc/combat/actor_state_registry.hpp"
#include "ctc/combat/combat_events.hpp"
#include "ctc/combat/combat_handler.hpp"
#include "ctc/combat/combat_pulse.hpp"
#include "ctc/combat/timing_provider.hpp"
#include "ctc/foundation/game_result.hpp"

namespace ctc::combat {

/// What executeAttack() scheduled.
struct ScheduledAttack {
    int intervalMs = 0;
    int hitOffsetMs = 0;
    int animationMs = 0;
    foundation::TimePoint resolveAt{};
    foundation::TimePoint nextSwingAt{};
    uint64_t resolutionSequence = 0;
    std::string providerName;
    /// The provider threw and fallback timings were used.
    bool usedFallback = false;
};

/// Bridges a swing's animation and its delayed outcome.
///
/// executeAttack() validates, starts the swing, plays the animation,
/// schedules the hit on the pulse and stamps the next eligible swing
/// time. The pulse later calls resolveScheduledHit(), which re-validates
/// both parties before asking the handler for hit and damage.
class AttackRoutine {
public:
    AttackRoutine(ActorStateRegistry& states, CombatPulse& pulse, TimingProviderSlot& providers,
                  ICombatHandler& handler, CombatEvents& events,
                  const foundation::TimeSource& clock);
    ~AttackRoutine();

    AttackRoutine(const AttackRoutine&) = delete;
    AttackRoutine& operator=(const AttackRoutine&) = delete;

    /// Start a swing timed by the active provider.
    /// @return The schedule, or InvalidActor / ActionNotPermitted / ParticipantNotFound.
    foundation::GameResult<ScheduledAttack> executeAttack(
        const std::shared_ptr<IActor>& attacker, const std::shared_ptr<IActor>& defender,
        const std::optional<WeaponDescriptor>& weapon);

    /// Start a swing timed by an explicit provider.
    foundation::GameResult<ScheduledAttack> executeAttack(
        const std::shared_ptr<IActor>& attacker, const std::shared_ptr<IActor>& defender,
        const std::optional<WeaponDescriptor>& weapon, const ITimingProvider& provider);

    /// Resolve a due hit. Never throws.
    void resolveScheduledHit(const std::shared_ptr<IActor>& attacker,
                             const PendingResolution& pending);

    /// Global-pulse swing at the handler's current combatant.
    void autoSwing(const std::shared_ptr<IActor>& attacker);

    /// True when the actor may start a swing now. Unknown actors may.
    [[nodiscard]] bool canAttack(const IActor& actor) const;

    /// Cancel the pending swing and drop its scheduled hits.
    bool cancelPendingAttack(ActorId actor, std::string_view reason);

    /// Route pulse resolutions and auto actions to this routine.
    void attachToPulse();

private:
    foundation::GameResult<ScheduledAttack> rejectSwing(const IActor& attacker,
                                                        foundation::ErrorCode code,
                                                        std::string reason);

    ActorStateRegistry& states_;
    CombatPulse& pulse_;
    TimingProviderSlot& providers_;
    ICombatHandler& handler_;
    CombatEvents& events_;
    const foundation::TimeSource& clock_;

    bool attached_ = false;
    foundation::ScopedConnection<const CancellationNotice&> cancellationLink_;
};

} // namespace ctc::combat