#pragma once

/// @file action_coordinator.hpp
/// @brief Begin/complete/cancel flow for spells, bandages and wands.

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "ctc/combat/actor_state_registry.hpp"
#include "ctc/combat/combat_events.hpp"
#include "ctc/foundation/game_result.hpp"
#include "ctc/foundation/signal.hpp"

namespace ctc::combat {

/// Timer stamping switches applied on completion.
struct CoordinatorOptions {
    /// Spells leave no recovery: no next-cast time, no post-cast delay.
    bool removePostCastRecovery = false;
    /// Wand completion stamps no next-use time.
    bool instantWandCast = false;
    /// Bandage completion stamps its own next-use time.
    bool independentBandageTimer = true;
};

/// Non-swing actions. Durations come from the host (cast time, heal
/// time); the coordinator tracks busy phases, applies the cancel rules
/// through the timer state and stamps next-eligible times.
class ActionCoordinator {
public:
    ActionCoordinator(ActorStateRegistry& states, CombatEvents& events,
                      const foundation::TimeSource& clock, CoordinatorOptions options = {});

    ActionCoordinator(const ActionCoordinator&) = delete;
    ActionCoordinator& operator=(const ActionCoordinator&) = delete;

    foundation::GameResult<void> beginSpell(const std::shared_ptr<IActor>& caster,
                                            std::string spellName,
                                            std::optional<ActorId> target,
                                            std::chrono::milliseconds castTime);

    /// Move a casting actor into post-cast delay without completing the cast.
    foundation::GameResult<void> enterCastDelay(ActorId caster, std::chrono::milliseconds delay);

    /// Finish the cast; @p recovery becomes the post-cast delay and next-cast time.
    foundation::GameResult<void> completeSpell(const std::shared_ptr<IActor>& caster,
                                               std::chrono::milliseconds recovery);

    foundation::GameResult<void> beginBandage(const std::shared_ptr<IActor>& healer,
                                              std::optional<ActorId> patient,
                                              std::chrono::milliseconds healTime);
    foundation::GameResult<void> completeBandage(const std::shared_ptr<IActor>& healer,
                                                 std::chrono::milliseconds delay);

    foundation::GameResult<void> beginWand(const std::shared_ptr<IActor>& user,
                                           std::string wandName,
                                           std::optional<ActorId> target,
                                           std::chrono::milliseconds useTime);
    foundation::GameResult<void> completeWand(const std::shared_ptr<IActor>& user,
                                              std::chrono::milliseconds delay);

    /// @return true if an action of @p category was in progress.
    bool cancel(ActorId actor, ActionCategory category, std::string_view reason);

    [[nodiscard]] bool canPerform(const IActor& actor, ActionCategory category) const;

    [[nodiscard]] const CoordinatorOptions& options() const noexcept { return options_; }

private:
    foundation::GameResult<void> begin(const std::shared_ptr<IActor>& actor,
                                       ActionCategory category, std::string label,
                                       std::optional<ActorId> target,
                                       std::chrono::milliseconds expected);

    foundation::GameResult<void> complete(const std::shared_ptr<IActor>& actor,
                                          ActionCategory category,
                                          std::optional<std::chrono::milliseconds> nextDelay,
                                          std::chrono::milliseconds castDelay);

    ActorStateRegistry& states_;
    CombatEvents& events_;
    const foundation::TimeSource& clock_;
    CoordinatorOptions options_;

    foundation::ScopedConnection<const CancellationNotice&> cancellationLink_;
};

} // namespace ctc::combat