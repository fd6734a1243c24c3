#pragma once

/// @file actor_state_registry.hpp
/// @brief ActorId -> ActorTimerState map holding only weak actor references.

#include <memory>
#include <mutex>
#include <unordered_map>

#include "ctc/combat/actor_timer_state.hpp"
#include "ctc/foundation/signal.hpp"

namespace ctc::combat {

/// Owns the timer state of every actor that has acted.
///
/// Entries are keyed by stable ActorId and never keep the actor alive.
/// They disappear on remove() (actor-removed notification) or once
/// pruneExpired() sees the actor is gone.
class ActorStateRegistry {
public:
    ActorStateRegistry(TimerMode mode, TimerRules rules, const foundation::TimeSource& clock);

    ActorStateRegistry(const ActorStateRegistry&) = delete;
    ActorStateRegistry& operator=(const ActorStateRegistry&) = delete;

    /// State for @p actor, created on first use. Null for a null actor.
    std::shared_ptr<ActorTimerState> getOrCreate(const std::shared_ptr<IActor>& actor);

    [[nodiscard]] std::shared_ptr<ActorTimerState> find(ActorId id) const;

    bool remove(ActorId id);

    /// Drop states whose actor has been destroyed.
    /// @return Number of states removed.
    std::size_t pruneExpired();

    [[nodiscard]] std::size_t size() const;

    /// Every cancellation of every actor is re-published here.
    foundation::Signal<const CancellationNotice&>& cancellations() noexcept { return cancellations_; }

    /// Applies to existing and future states.
    void setLogCancellations(bool enabled);

private:
    TimerMode mode_;
    TimerRules rules_;
    const foundation::TimeSource& clock_;
    bool logCancellations_ = false;

    mutable std::mutex mutex_;
    std::unordered_map<ActorId, std::shared_ptr<ActorTimerState>> states_;
    foundation::Signal<const CancellationNotice&> cancellations_;
};

} // namespace ctc::combat