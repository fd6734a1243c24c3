#pragma once

/// @file combat_pulse.hpp
/// @brief Global fixed-rate tick scheduler for active combatants.
///
/// CombatPulse owns the set of active participants and their deferred hit
/// resolutions. One periodic timer callback drives tick(); registration,
/// activity updates and scheduling may come from any thread. Game logic is
/// always called back without the participant lock held.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

#include "ctc/combat/actor.hpp"
#include "ctc/combat/tick_performance.hpp"
#include "ctc/combat/weapon.hpp"
#include "ctc/foundation/game_result.hpp"
#include "ctc/foundation/signal.hpp"
#include "ctc/foundation/time_source.hpp"
#include "ctc/foundation/timer_service.hpp"

namespace ctc::combat {

/// Tick and startup parameters.
struct PulseSettings {
    std::chrono::milliseconds tickInterval{50};
    std::chrono::milliseconds idleTimeout{5000};
    double slowTickWarnMs = 10.0;
    /// Trigger each participant's next swing from the tick.
    bool globalPulse = false;
    std::size_t performanceWindow = TickPerformance::kDefaultWindow;

    /// Readiness probing of the timer subsystem.
    std::chrono::milliseconds startupInitialDelay{100};
    std::chrono::milliseconds startupMaxDelay{2000};
    int startupMaxAttempts = 20;
};

/// Hit waiting for its resolve time.
struct PendingResolution {
    uint64_t sequence = 0;
    std::weak_ptr<IActor> target;
    std::optional<WeaponDescriptor> weapon;
    foundation::TimePoint scheduledAt{};
    foundation::TimePoint resolveAt{};
    int hitOffsetMs = 0;
};

/// Outcome of one tick.
struct TickReport {
    std::size_t participants = 0;
    std::size_t resolved = 0;
    std::size_t failedResolutions = 0;
    /// Due resolutions left queued because no resolution handler is set.
    std::size_t heldResolutions = 0;
    std::size_t removedInvalid = 0;
    std::size_t evictedIdle = 0;
    std::size_t autoActions = 0;
    double durationMs = 0.0;
};

enum class PulseState : uint8_t {
    Stopped,
    Probing,
    Running,
    Failed
};

/// Called for each due resolution. Exceptions are caught per entry.
using ResolutionHandler =
    std::function<void(const std::shared_ptr<IActor>& attacker, const PendingResolution& pending)>;

/// Called in global-pulse mode when a participant's next action time passed.
using AutoActionHandler = std::function<void(const std::shared_ptr<IActor>& actor)>;

class CombatPulse {
public:
    CombatPulse(PulseSettings settings, const foundation::TimeSource& clock);
    ~CombatPulse();

    CombatPulse(const CombatPulse&) = delete;
    CombatPulse& operator=(const CombatPulse&) = delete;

    void setResolutionHandler(ResolutionHandler handler);
    void setAutoActionHandler(AutoActionHandler handler);

    /// Install the periodic tick on @p timers once they report ready.
    ///
    /// Ready timers are used immediately; otherwise readiness is probed on
    /// a background thread with exponential backoff. Calling again while
    /// probing or running is a no-op, so the callback is never installed
    /// twice. A failed probe may be retried.
    foundation::GameResult<void> initialize(foundation::ITimerService& timers);

    /// Cancel the periodic callback, stop probing and drop all participants.
    void shutdown();

    [[nodiscard]] PulseState state() const noexcept { return state_.load(); }
    [[nodiscard]] bool isRunning() const noexcept { return state() == PulseState::Running; }

    /// Block until running or @p timeout elapses (startup harnesses, tests).
    bool waitUntilRunning(std::chrono::milliseconds timeout);

    // --- Participants -------------------------------------------------------

    /// @return true if newly registered, false if already present or invalid.
    bool registerParticipant(const std::shared_ptr<IActor>& actor);

    /// Remove a participant with all its pending resolutions.
    bool unregisterParticipant(ActorId id);

    void updateActivity(ActorId id);
    void updateNextActionTime(ActorId id, foundation::TimePoint nextAction);

    /// Queue a resolution at now + @p delay, after earlier ones of this actor.
    foundation::GameResult<uint64_t> scheduleResolution(ActorId attacker,
                                                        const std::shared_ptr<IActor>& target,
                                                        std::optional<WeaponDescriptor> weapon,
                                                        std::chrono::milliseconds delay);

    /// @return Number of pending resolutions dropped.
    std::size_t cancelPendingResolutions(ActorId id);

    [[nodiscard]] bool isParticipant(ActorId id) const;
    [[nodiscard]] std::size_t participantCount() const;
    [[nodiscard]] std::size_t pendingCount(ActorId id) const;
    [[nodiscard]] std::optional<foundation::TimePoint> nextActionTime(ActorId id) const;

    // --- Tick ---------------------------------------------------------------

    /// Run one tick now. Driven by the timer, or directly by tests.
    TickReport tick();

    [[nodiscard]] TickStats performance() const { return performance_.snapshot(); }
    void resetPerformance() { performance_.reset(); }

    /// Emitted after every tick with its duration in milliseconds.
    foundation::Signal<double>& tickCompleted() noexcept { return tickCompleted_; }

    [[nodiscard]] const PulseSettings& settings() const noexcept { return settings_; }

private:
    struct Participant {
        std::weak_ptr<IActor> actor;
        foundation::TimePoint lastActivity{};
        std::optional<foundation::TimePoint> nextAction;
        std::deque<PendingResolution> pending;
    };

    void probeLoop(foundation::ITimerService* timers);
    bool installTick(foundation::ITimerService& timers);

    PulseSettings settings_;
    const foundation::TimeSource& clock_;

    mutable std::mutex mutex_;
    std::unordered_map<ActorId, Participant> participants_;
    uint64_t nextSequence_ = 1;

    std::mutex handlerMutex_;
    ResolutionHandler resolutionHandler_;
    AutoActionHandler autoActionHandler_;

    // Startup / timer ownership
    std::mutex lifecycleMutex_;
    std::condition_variable lifecycleCv_;
    std::atomic<PulseState> state_{PulseState::Stopped};
    bool stopProbing_ = false;
    std::thread probeThread_;
    foundation::ITimerService* timers_ = nullptr;
    std::optional<foundation::TimerHandle> tickHandle_;

    TickPerformance performance_;
    foundation::Signal<double> tickCompleted_;
};

} // namespace ctc::combat