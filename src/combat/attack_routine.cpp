/// @file attack_routine.cpp
/// @brief AttackRoutine implementation.

#include "ctc/combat/attack_routine.hpp"

#include <string>

#include "ctc/foundation/combat_logger.hpp"

namespace ctc::combat {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogLevel;

namespace {

const WeaponDescriptor* weaponPtr(const std::optional<WeaponDescriptor>& weapon) {
    return weapon ? &*weapon : nullptr;
}

std::string weaponLabel(const std::optional<WeaponDescriptor>& weapon) {
    return weapon ? weapon->name : std::string("Fists");
}

ActionEvent makeSwingEvent(ActionEventKind kind, const IActor& attacker,
                           const std::shared_ptr<IActor>& attackerRef) {
    ActionEvent event;
    event.kind = kind;
    event.category = ActionCategory::Swing;
    event.actorId = attacker.id();
    event.actorName = attacker.name();
    event.actor = attackerRef;
    event.dexterity = attacker.dexterity();
    return event;
}

}  // anonymous namespace
AttackRoutine::AttackRoutine(ActorStateRegistry& states, CombatPulse& pulse,
                             TimingProviderSlot& providers, ICombatHandler& handler,
                             CombatEvents& events, const foundation::TimeSource& clock)
    : states_(states),
      pulse_(pulse),
      providers_(providers),
      handler_(handler),
      events_(events),
      clock_(clock),
      cancellationLink_(states.cancellations(), [this](const CancellationNotice& notice) {
          if (notice.category != ActionCategory::Swing) {
              return;
          }
          pulse_.cancelPendingResolutions(notice.actorId);

          ActionEvent event;
          event.kind = ActionEventKind::Cancelled;
          event.category = ActionCategory::Swing;
          event.actorId = notice.actorId;
          event.actorName = notice.actorName;
          event.targetId = notice.action.target;
          event.weapon = notice.action.weapon;
          event.label = notice.action.label;
          event.expectedDelayMs = notice.action.expectedDelayMs;
          event.startedAt = notice.action.startedAt;
          event.at = clock_.now();
          event.reason = notice.reason;
          events_.actionEnded.emit(event);
      }) {}

AttackRoutine::~AttackRoutine() {
    if (attached_) {
        pulse_.setResolutionHandler(nullptr);
        pulse_.setAutoActionHandler(nullptr);
    }
}

void AttackRoutine::attachToPulse() {
    pulse_.setResolutionHandler(
        [this](const std::shared_ptr<IActor>& attacker, const PendingResolution& pending) {
            resolveScheduledHit(attacker, pending);
        });
    pulse_.setAutoActionHandler([this](const std::shared_ptr<IActor>& actor) { autoSwing(actor); });
    attached_ = true;
}

GameResult<ScheduledAttack> AttackRoutine::rejectSwing(const IActor& attacker, ErrorCode code,
                                                       std::string reason) {
    foundation::LogContext ctx;
    ctx.actorId = attacker.id();
    ctx.action = "swing";
    ctx.extra["reason"] = reason;
    foundation::CombatLogger::instance().logWithContext(
        LogLevel::Debug, LogCategory::Combat, "Swing rejected", ctx);
    return GameResult<ScheduledAttack>::err(GameError(code, std::move(reason), attacker.id()));
}

// ---------------------------------------------------------------------------
// executeAttack()
// ---------------------------------------------------------------------------
GameResult<ScheduledAttack> AttackRoutine::executeAttack(
    const std::shared_ptr<IActor>& attacker, const std::shared_ptr<IActor>& defender,
    const std::optional<WeaponDescriptor>& weapon) {
    auto provider = providers_.current();
    if (!provider) {
        return GameResult<ScheduledAttack>::err(
            GameError(ErrorCode::ProviderFailed, "no timing provider installed"));
    }
    return executeAttack(attacker, defender, weapon, *provider);
}

GameResult<ScheduledAttack> AttackRoutine::executeAttack(
    const std::shared_ptr<IActor>& attacker, const std::shared_ptr<IActor>& defender,
    const std::optional<WeaponDescriptor>& weapon, const ITimingProvider& provider) {
    if (!attacker || !defender) {
        return GameResult<ScheduledAttack>::err(
            GameError(ErrorCode::InvalidActor, "swing needs both an attacker and a defender"));
    }
    if (!isActorUsable(*attacker)) {
        return rejectSwing(*attacker, ErrorCode::InvalidActor, "attacker cannot act");
    }
    if (!isActorUsable(*defender)) {
        return rejectSwing(*attacker, ErrorCode::InvalidActor, "defender is not a valid target");
    }

    auto state = states_.getOrCreate(attacker);
    if (!state->canPerform(ActionCategory::Swing)) {
        return rejectSwing(*attacker, ErrorCode::ActionNotPermitted, "swing not ready");
    }

    const auto* weaponData = weaponPtr(weapon);
    const auto id = attacker->id();

    ScheduledAttack scheduled;
    scheduled.providerName = std::string(provider.name());
    try {
        scheduled.intervalMs = provider.attackIntervalMs(*attacker, weaponData);
        scheduled.hitOffsetMs = provider.hitOffsetMs(weaponData);
        scheduled.animationMs = provider.animationDurationMs(weaponData);
    } catch (const std::exception& e) {
        scheduled.usedFallback = true;
        CTC_LOG_WARN(LogCategory::Timing,
                     std::string(provider.name()) + " failed for actor " +
                         std::to_string(id.value()) + ": " + e.what() + "; using fallback timing");
    } catch (...) {
        scheduled.usedFallback = true;
        CTC_LOG_WARN(LogCategory::Timing,
                     std::string(provider.name()) + " failed for actor " +
                         std::to_string(id.value()) + "; using fallback timing");
    }
    if (scheduled.usedFallback || scheduled.intervalMs <= 0) {
        scheduled.usedFallback = true;
        scheduled.intervalMs = kFallbackAttackIntervalMs;
        scheduled.hitOffsetMs = kFallbackHitOffsetMs;
        scheduled.animationMs = kFallbackAnimationMs;
    }
    if (scheduled.hitOffsetMs < 0) {
        scheduled.hitOffsetMs = 0;
    }

    const auto now = clock_.now();

    InFlightAction action;
    action.category = ActionCategory::Swing;
    action.label = weaponLabel(weapon);
    action.target = defender->id();
    action.weapon = weapon;
    action.startedAt = now;
    action.expectedDelayMs = scheduled.hitOffsetMs;
    // The early check above is advisory; a concurrent request may have
    // started a swing while the provider was consulted.
    if (!state->tryBeginAction(std::move(action))) {
        return rejectSwing(*attacker, ErrorCode::ActionNotPermitted, "swing already started");
    }

    pulse_.registerParticipant(attacker);
    pulse_.updateActivity(id);

    try {
        handler_.playSwingAnimation(*attacker, *defender, weaponData, scheduled.animationMs);
    } catch (const std::exception& e) {
        CTC_LOG_ERROR(LogCategory::Combat,
                      "Swing animation failed for actor " + std::to_string(id.value()) + ": " +
                          e.what());
    } catch (...) {
        CTC_LOG_ERROR(LogCategory::Combat,
                      "Swing animation failed for actor " + std::to_string(id.value()));
    }

    auto sequence = pulse_.scheduleResolution(id, defender, weapon,
                                              std::chrono::milliseconds(scheduled.hitOffsetMs));
    if (!sequence) {
        state->completeAction(ActionCategory::Swing);
        return GameResult<ScheduledAttack>::err(sequence.error());
    }
    scheduled.resolutionSequence = sequence.value();
    scheduled.resolveAt = now + std::chrono::milliseconds(scheduled.hitOffsetMs);

    state->setNextTime(ActionCategory::Swing, std::chrono::milliseconds(scheduled.intervalMs));
    scheduled.nextSwingAt = now + std::chrono::milliseconds(scheduled.intervalMs);
    pulse_.updateNextActionTime(id, scheduled.nextSwingAt);

    foundation::LogContext ctx;
    ctx.actorId = id;
    ctx.targetId = defender->id();
    ctx.action = "swing";
    ctx.extra["interval_ms"] = std::to_string(scheduled.intervalMs);
    ctx.extra["hit_offset_ms"] = std::to_string(scheduled.hitOffsetMs);
    foundation::CombatLogger::instance().logWithContext(
        LogLevel::Trace, LogCategory::Combat, "Swing scheduled", ctx);

    auto event = makeSwingEvent(ActionEventKind::Begin, *attacker, attacker);
    event.targetId = defender->id();
    event.weapon = weapon;
    event.label = weaponLabel(weapon);
    event.expectedDelayMs = scheduled.intervalMs;
    event.providerName = scheduled.providerName;
    event.at = now;
    event.usedFallback = scheduled.usedFallback;
    events_.actionBegan.emit(event);

    return GameResult<ScheduledAttack>::ok(std::move(scheduled));
}

// ---------------------------------------------------------------------------
// resolveScheduledHit()
// ---------------------------------------------------------------------------
void AttackRoutine::resolveScheduledHit(const std::shared_ptr<IActor>& attacker,
                                        const PendingResolution& pending) {
    if (!attacker) {
        return;
    }
    const auto now = clock_.now();
    const auto id = attacker->id();
    auto defender = pending.target.lock();
    const auto* weaponData = weaponPtr(pending.weapon);

    auto state = states_.find(id);
    auto finishSwing = [&]() {
        // Leave a newer swing's context alone.
        if (state) {
            auto inFlight = state->inFlight(ActionCategory::Swing);
            if (inFlight && inFlight->startedAt <= pending.scheduledAt) {
                state->completeAction(ActionCategory::Swing);
            }
        }
    };

    auto event = makeSwingEvent(ActionEventKind::Resolved, *attacker, attacker);
    event.weapon = pending.weapon;
    event.label = weaponLabel(pending.weapon);
    event.expectedDelayMs = pending.hitOffsetMs;
    event.startedAt = pending.scheduledAt;
    event.at = now;
    if (auto provider = providers_.current()) {
        event.providerName = std::string(provider->name());
    }

    if (!defender || !isActorUsable(*defender) || !isActorUsable(*attacker)) {
        finishSwing();
        event.kind = ActionEventKind::Cancelled;
        event.reason = "Target no longer valid";
        if (defender) {
            event.targetId = defender->id();
        }
        CTC_LOG_DEBUG(LogCategory::Combat,
                      "Dropped hit for actor " + std::to_string(id.value()) + ": party no longer valid");
        events_.actionEnded.emit(event);
        return;
    }
    event.targetId = defender->id();

    bool hit = false;
    try {
        hit = handler_.checkHit(*attacker, *defender, weaponData);
        if (hit) {
            handler_.onHit(*attacker, *defender, weaponData);
        } else {
            handler_.onMiss(*attacker, *defender, weaponData);
        }
    } catch (const std::exception& e) {
        CTC_LOG_ERROR(LogCategory::Combat,
                      "Hit resolution failed for actor " + std::to_string(id.value()) + ": " +
                          e.what());
        event.reason = e.what();
    } catch (...) {
        CTC_LOG_ERROR(LogCategory::Combat,
                      "Hit resolution failed for actor " + std::to_string(id.value()));
        event.reason = "non-standard exception";
    }

    finishSwing();
    event.hit = hit;
    events_.actionEnded.emit(event);
}

void AttackRoutine::autoSwing(const std::shared_ptr<IActor>& attacker) {
    if (!attacker || !canAttack(*attacker)) {
        return;
    }
    auto target = handler_.currentCombatant(*attacker);
    if (!target) {
        return;
    }
    auto result = executeAttack(attacker, target, handler_.equippedWeapon(*attacker));
    if (!result) {
        CTC_LOG_DEBUG(LogCategory::Pulse,
                      "Auto swing skipped for actor " + std::to_string(attacker->id().value()) +
                          ": " + std::string(result.error().message()));
    }
}

bool AttackRoutine::canAttack(const IActor& actor) const {
    if (!isActorUsable(actor)) {
        return false;
    }
    auto state = states_.find(actor.id());
    return !state || state->canPerform(ActionCategory::Swing);
}

bool AttackRoutine::cancelPendingAttack(ActorId actor, std::string_view reason) {
    bool cancelled = false;
    if (auto state = states_.find(actor)) {
        cancelled = state->cancel(ActionCategory::Swing, reason);
    }
    auto dropped = pulse_.cancelPendingResolutions(actor);
    return cancelled || dropped > 0;
}

}  // namespace ctc::combat