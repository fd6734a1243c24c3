/// @file combat_pulse.cpp
/// @brief CombatPulse implementation.

#include "ctc/combat/combat_pulse.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "ctc/foundation/combat_logger.hpp"

namespace ctc::combat {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

CombatPulse::CombatPulse(PulseSettings settings, const foundation::TimeSource& clock)
    : settings_(settings), clock_(clock), performance_(settings.performanceWindow) {
    if (settings_.tickInterval.count() <= 0) {
        settings_.tickInterval = std::chrono::milliseconds(50);
    }
}

CombatPulse::~CombatPulse() {
    shutdown();
}

void CombatPulse::setResolutionHandler(ResolutionHandler handler) {
    std::lock_guard lock(handlerMutex_);
    resolutionHandler_ = std::move(handler);
}

void CombatPulse::setAutoActionHandler(AutoActionHandler handler) {
    std::lock_guard lock(handlerMutex_);
    autoActionHandler_ = std::move(handler);
}

// ---------------------------------------------------------------------------
// Startup / shutdown
// ---------------------------------------------------------------------------
GameResult<void> CombatPulse::initialize(foundation::ITimerService& timers) {
    std::unique_lock lock(lifecycleMutex_);

    auto current = state_.load();
    if (current == PulseState::Probing || current == PulseState::Running) {
        CTC_LOG_DEBUG(LogCategory::Pulse, "initialize ignored: pulse already started");
        return GameResult<void>::ok();
    }

    // A previous probe thread has already given up; reap it.
    if (probeThread_.joinable()) {
        probeThread_.join();
    }

    timers_ = &timers;
    stopProbing_ = false;

    if (timers.isReady() && installTick(timers)) {
        return GameResult<void>::ok();
    }

    state_.store(PulseState::Probing);
    CTC_LOG_INFO(LogCategory::Pulse, "Timer service not ready, probing in background");
    probeThread_ = std::thread([this, &timers] { probeLoop(&timers); });
    return GameResult<void>::ok();
}

bool CombatPulse::installTick(foundation::ITimerService& timers) {
    auto handle = timers.schedulePeriodic(settings_.tickInterval, [this] { (void)tick(); });
    if (!handle) {
        CTC_LOG_WARN(LogCategory::Pulse,
                     "Failed to install tick: " + std::string(handle.error().message()));
        return false;
    }
    tickHandle_ = handle.value();
    state_.store(PulseState::Running);
    lifecycleCv_.notify_all();
    CTC_LOG_INFO(LogCategory::Pulse,
                 "Combat pulse running every " +
                     std::to_string(settings_.tickInterval.count()) + "ms");
    return true;
}

void CombatPulse::probeLoop(foundation::ITimerService* timers) {
    auto delay = settings_.startupInitialDelay.count() > 0 ? settings_.startupInitialDelay
                                                           : std::chrono::milliseconds(1);
    const int attempts = std::max(1, settings_.startupMaxAttempts);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        std::unique_lock lock(lifecycleMutex_);
        if (lifecycleCv_.wait_for(lock, delay, [this] { return stopProbing_; })) {
            return;
        }
        if (timers->isReady() && installTick(*timers)) {
            return;
        }
        CTC_LOG_DEBUG(LogCategory::Pulse,
                      "Timer service probe " + std::to_string(attempt) + "/" +
                          std::to_string(attempts) + " not ready");
        delay = std::min(delay * 2, std::max(settings_.startupMaxDelay, delay));
    }

    std::lock_guard lock(lifecycleMutex_);
    state_.store(PulseState::Failed);
    lifecycleCv_.notify_all();
    CTC_LOG_ERROR(LogCategory::Pulse,
                  "Timer service never became ready after " + std::to_string(attempts) +
                      " attempts; combat pulse not started");
}

bool CombatPulse::waitUntilRunning(std::chrono::milliseconds timeout) {
    std::unique_lock lock(lifecycleMutex_);
    lifecycleCv_.wait_for(lock, timeout, [this] { return state_.load() != PulseState::Probing; });
    return state_.load() == PulseState::Running;
}

void CombatPulse::shutdown() {
    {
        std::lock_guard lock(lifecycleMutex_);
        stopProbing_ = true;
    }
    lifecycleCv_.notify_all();
    if (probeThread_.joinable() && probeThread_.get_id() != std::this_thread::get_id()) {
        probeThread_.join();
    }

    {
        std::lock_guard lock(lifecycleMutex_);
        if (tickHandle_ && timers_ != nullptr) {
            auto cancelled = timers_->cancel(*tickHandle_);
            if (!cancelled) {
                CTC_LOG_WARN(LogCategory::Pulse,
                             "Failed to cancel tick timer: " +
                                 std::string(cancelled.error().message()));
            }
        }
        tickHandle_.reset();
        timers_ = nullptr;
        if (state_.exchange(PulseState::Stopped) == PulseState::Running) {
            CTC_LOG_INFO(LogCategory::Pulse, "Combat pulse stopped");
        }
    }

    std::lock_guard lock(mutex_);
    participants_.clear();
}

// ---------------------------------------------------------------------------
// Participants
// ---------------------------------------------------------------------------
bool CombatPulse::registerParticipant(const std::shared_ptr<IActor>& actor) {
    if (!actor || actor->isDeleted()) {
        return false;
    }

    std::lock_guard lock(mutex_);
    auto [it, inserted] = participants_.try_emplace(actor->id());
    if (inserted) {
        it->second.actor = actor;
        it->second.lastActivity = clock_.now();
        return true;
    }
    if (it->second.actor.expired()) {
        // Same serial, new instance: the old entry's work belongs to a dead actor.
        it->second = Participant{};
        it->second.actor = actor;
        it->second.lastActivity = clock_.now();
    }
    return false;
}

bool CombatPulse::unregisterParticipant(ActorId id) {
    std::lock_guard lock(mutex_);
    return participants_.erase(id) > 0;
}

void CombatPulse::updateActivity(ActorId id) {
    std::lock_guard lock(mutex_);
    auto it = participants_.find(id);
    if (it != participants_.end()) {
        it->second.lastActivity = clock_.now();
    }
}

void CombatPulse::updateNextActionTime(ActorId id, foundation::TimePoint nextAction) {
    std::lock_guard lock(mutex_);
    auto it = participants_.find(id);
    if (it != participants_.end()) {
        it->second.nextAction = nextAction;
    }
}

GameResult<uint64_t> CombatPulse::scheduleResolution(ActorId attacker,
                                                     const std::shared_ptr<IActor>& target,
                                                     std::optional<WeaponDescriptor> weapon,
                                                     std::chrono::milliseconds delay) {
    if (delay.count() < 0) {
        return GameResult<uint64_t>::err(
            GameError(ErrorCode::InvalidArgument, "resolution delay must not be negative", attacker));
    }

    std::lock_guard lock(mutex_);
    auto it = participants_.find(attacker);
    if (it == participants_.end()) {
        return GameResult<uint64_t>::err(
            GameError(ErrorCode::ParticipantNotFound, "attacker is not an active participant",
                      attacker));
    }

    auto now = clock_.now();
    PendingResolution pending;
    pending.sequence = nextSequence_++;
    pending.target = target;
    pending.weapon = std::move(weapon);
    pending.scheduledAt = now;
    pending.resolveAt = now + delay;
    pending.hitOffsetMs = static_cast<int>(delay.count());
    it->second.pending.push_back(std::move(pending));
    return GameResult<uint64_t>::ok(it->second.pending.back().sequence);
}

std::size_t CombatPulse::cancelPendingResolutions(ActorId id) {
    std::lock_guard lock(mutex_);
    auto it = participants_.find(id);
    if (it == participants_.end()) {
        return 0;
    }
    auto dropped = it->second.pending.size();
    it->second.pending.clear();
    return dropped;
}

bool CombatPulse::isParticipant(ActorId id) const {
    std::lock_guard lock(mutex_);
    return participants_.count(id) > 0;
}

std::size_t CombatPulse::participantCount() const {
    std::lock_guard lock(mutex_);
    return participants_.size();
}

std::size_t CombatPulse::pendingCount(ActorId id) const {
    std::lock_guard lock(mutex_);
    auto it = participants_.find(id);
    return it != participants_.end() ? it->second.pending.size() : 0;
}

std::optional<foundation::TimePoint> CombatPulse::nextActionTime(ActorId id) const {
    std::lock_guard lock(mutex_);
    auto it = participants_.find(id);
    if (it == participants_.end()) {
        return std::nullopt;
    }
    return it->second.nextAction;
}

// ---------------------------------------------------------------------------
// tick()
// ---------------------------------------------------------------------------
TickReport CombatPulse::tick() {
    const auto started = std::chrono::steady_clock::now();
    const auto now = clock_.now();

    struct DueResolution {
        std::shared_ptr<IActor> attacker;
        PendingResolution pending;
    };

    ResolutionHandler onResolve;
    AutoActionHandler onAutoAction;
    {
        std::lock_guard lock(handlerMutex_);
        onResolve = resolutionHandler_;
        onAutoAction = autoActionHandler_;
    }

    TickReport report;
    std::vector<DueResolution> due;
    std::vector<std::shared_ptr<IActor>> autoActors;

    {
        std::lock_guard lock(mutex_);
        report.participants = participants_.size();

        std::vector<ActorId> removals;
        for (auto& [id, participant] : participants_) {
            auto actor = participant.actor.lock();
            if (!actor || actor->isDeleted()) {
                removals.push_back(id);
                ++report.removedInvalid;
                continue;
            }

            // Without a handler due entries stay queued for a later tick.
            auto& queue = participant.pending;
            for (auto it = queue.begin(); it != queue.end();) {
                if (it->resolveAt > now) {
                    ++it;
                } else if (!onResolve) {
                    ++report.heldResolutions;
                    ++it;
                } else {
                    due.push_back(DueResolution{actor, std::move(*it)});
                    it = queue.erase(it);
                }
            }

            if (queue.empty() && now - participant.lastActivity > settings_.idleTimeout) {
                removals.push_back(id);
                ++report.evictedIdle;
                continue;
            }

            if (settings_.globalPulse && queue.empty() && participant.nextAction &&
                now >= *participant.nextAction) {
                autoActors.push_back(actor);
            }
        }

        for (auto id : removals) {
            participants_.erase(id);
        }
    }

    if (report.heldResolutions > 0) {
        CTC_LOG_DEBUG(LogCategory::Pulse,
                      std::to_string(report.heldResolutions) +
                          " due resolutions held: no resolution handler set");
    }

    for (const auto& work : due) {
        try {
            onResolve(work.attacker, work.pending);
            ++report.resolved;
        } catch (const std::exception& e) {
            ++report.failedResolutions;
            CTC_LOG_ERROR(LogCategory::Pulse,
                          "Hit resolution for actor " + std::to_string(work.attacker->id().value()) +
                              " threw: " + e.what());
        } catch (...) {
            ++report.failedResolutions;
            CTC_LOG_ERROR(LogCategory::Pulse,
                          "Hit resolution for actor " + std::to_string(work.attacker->id().value()) +
                              " threw a non-standard exception");
        }
    }

    for (const auto& actor : autoActors) {
        if (!onAutoAction) {
            break;
        }
        try {
            onAutoAction(actor);
            ++report.autoActions;
        } catch (const std::exception& e) {
            CTC_LOG_ERROR(LogCategory::Pulse,
                          "Auto action for actor " + std::to_string(actor->id().value()) +
                              " threw: " + e.what());
        } catch (...) {
            CTC_LOG_ERROR(LogCategory::Pulse,
                          "Auto action for actor " + std::to_string(actor->id().value()) +
                              " threw a non-standard exception");
        }
    }

    report.durationMs =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    performance_.record(report.durationMs);

    if (report.durationMs > settings_.slowTickWarnMs) {
        CTC_LOG_WARN(LogCategory::Pulse,
                     "Slow combat tick: " + std::to_string(report.durationMs) + "ms with " +
                         std::to_string(report.participants) + " participants");
    }

    tickCompleted_.emit(report.durationMs);
    return report;
}

}  // namespace ctc::combat