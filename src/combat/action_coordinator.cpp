/// @file action_coordinator.cpp
/// @brief ActionCoordinator implementation.

#include "ctc/combat/action_coordinator.hpp"

#include <algorithm>
#include <cstdint>

#include "ctc/foundation/combat_logger.hpp"

namespace ctc::combat {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogLevel;

namespace {

/// Provider tag for actions timed by the host rather than a timing provider.
constexpr std::string_view kHostTimingName = "HostTiming";

} // anonymous namespace
ActionCoordinator::ActionCoordinator(ActorStateRegistry& states, CombatEvents& events,
                                     const foundation::TimeSource& clock,
                                     CoordinatorOptions options)
    : states_(states),
      events_(events),
      clock_(clock),
      options_(options),
      cancellationLink_(states.cancellations(), [this](const CancellationNotice& notice) {
          // Swing cancellations are reported by the attack routine.
          if (notice.category == ActionCategory::Swing) {
              return;
          }
          ActionEvent event;
          event.kind = ActionEventKind::Cancelled;
          event.category = notice.category;
          event.actorId = notice.actorId;
          event.actorName = notice.actorName;
          event.targetId = notice.action.target;
          event.label = notice.action.label;
          event.expectedDelayMs = notice.action.expectedDelayMs;
          event.providerName = std::string(kHostTimingName);
          event.startedAt = notice.action.startedAt;
          event.at = clock_.now();
          event.reason = notice.reason;
          events_.actionEnded.emit(event);
      }) {}

GameResult<void> ActionCoordinator::begin(const std::shared_ptr<IActor>& actor,
                                          ActionCategory category, std::string label,
                                          std::optional<ActorId> target,
                                          std::chrono::milliseconds expected) {
    if (!actor) {
        return GameResult<void>::err(GameError(ErrorCode::InvalidActor, "actor is required"));
    }
    if (!isActorUsable(*actor)) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidActor, "actor cannot act", actor->id()));
    }

    auto state = states_.getOrCreate(actor);
    const auto now = clock_.now();
    InFlightAction action;
    action.category = category;
    action.label = label;
    action.target = target;
    action.startedAt = now;
    action.expectedDelayMs = static_cast<int>(std::max<int64_t>(expected.count(), 0));
    const int expectedDelayMs = action.expectedDelayMs;

    if (!state->tryBeginAction(std::move(action))) {
        foundation::LogContext ctx;
        ctx.actorId = actor->id();
        ctx.action = std::string(actionCategoryName(category));
        ctx.extra["reason"] = "Timer not ready";
        foundation::CombatLogger::instance().logWithContext(
            LogLevel::Debug, LogCategory::Combat, actor->name() + " action rejected", ctx);
        return GameResult<void>::err(GameError(
            ErrorCode::ActionNotPermitted,
            std::string(actionCategoryName(category)) + " not ready", actor->id()));
    }

    ActionEvent event;
    event.kind = ActionEventKind::Begin;
    event.category = category;
    event.actorId = actor->id();
    event.actorName = actor->name();
    event.actor = actor;
    event.dexterity = actor->dexterity();
    event.targetId = target;
    event.label = std::move(label);
    event.expectedDelayMs = expectedDelayMs;
    event.providerName = std::string(kHostTimingName);
    event.at = now;
    events_.actionBegan.emit(event);
    return GameResult<void>::ok();
}

GameResult<void> ActionCoordinator::complete(const std::shared_ptr<IActor>& actor,
                                             ActionCategory category,
                                             std::optional<std::chrono::milliseconds> nextDelay,
                                             std::chrono::milliseconds castDelay) {
    if (!actor) {
        return GameResult<void>::err(GameError(ErrorCode::InvalidActor, "actor is required"));
    }
    auto state = states_.find(actor->id());
    if (!state || state->phase(category) != ActionPhase::Busy) {
        return GameResult<void>::err(GameError(
            ErrorCode::NoActionInProgress,
            std::string("no ") + std::string(actionCategoryName(category)) + " in progress",
            actor->id()));
    }

    if (nextDelay) {
        state->setNextTime(category, *nextDelay);
    }

    std::optional<InFlightAction> finished;
    if (category == ActionCategory::Spell && castDelay.count() > 0) {
        finished = state->inFlight(category);
        state->enterCastDelay(castDelay);
    } else {
        finished = state->completeAction(category);
    }

    ActionEvent event;
    event.kind = ActionEventKind::Complete;
    event.category = category;
    event.actorId = actor->id();
    event.actorName = actor->name();
    event.actor = actor;
    event.dexterity = actor->dexterity();
    event.providerName = std::string(kHostTimingName);
    event.at = clock_.now();
    if (finished) {
        event.targetId = finished->target;
        event.label = finished->label;
        event.expectedDelayMs = finished->expectedDelayMs;
        event.startedAt = finished->startedAt;
    }
    events_.actionEnded.emit(event);
    return GameResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Spells
// ---------------------------------------------------------------------------
GameResult<void> ActionCoordinator::beginSpell(const std::shared_ptr<IActor>& caster,
                                               std::string spellName,
                                               std::optional<ActorId> target,
                                               std::chrono::milliseconds castTime) {
    return begin(caster, ActionCategory::Spell, std::move(spellName), target, castTime);
}

GameResult<void> ActionCoordinator::enterCastDelay(ActorId caster,
                                                   std::chrono::milliseconds delay) {
    auto state = states_.find(caster);
    if (!state || state->phase(ActionCategory::Spell) != ActionPhase::Busy) {
        return GameResult<void>::err(
            GameError(ErrorCode::NoActionInProgress, "no spell in progress", caster));
    }
    state->enterCastDelay(delay);
    return GameResult<void>::ok();
}

GameResult<void> ActionCoordinator::completeSpell(const std::shared_ptr<IActor>& caster,
                                                  std::chrono::milliseconds recovery) {
    if (options_.removePostCastRecovery) {
        if (caster) {
            CTC_LOG_DEBUG(LogCategory::Combat, caster->name() + " post-cast recovery removed");
        }
        return complete(caster, ActionCategory::Spell, std::nullopt,
                        std::chrono::milliseconds(0));
    }
    return complete(caster, ActionCategory::Spell, recovery, recovery);
}

// ---------------------------------------------------------------------------
// Bandages
// ---------------------------------------------------------------------------
GameResult<void> ActionCoordinator::beginBandage(const std::shared_ptr<IActor>& healer,
                                                 std::optional<ActorId> patient,
                                                 std::chrono::milliseconds healTime) {
    return begin(healer, ActionCategory::Bandage, "Bandage", patient, healTime);
}

GameResult<void> ActionCoordinator::completeBandage(const std::shared_ptr<IActor>& healer,
                                                    std::chrono::milliseconds delay) {
    std::optional<std::chrono::milliseconds> next;
    if (options_.independentBandageTimer) {
        next = delay;
    }
    return complete(healer, ActionCategory::Bandage, next, std::chrono::milliseconds(0));
}

// ---------------------------------------------------------------------------
// Wands
// ---------------------------------------------------------------------------
GameResult<void> ActionCoordinator::beginWand(const std::shared_ptr<IActor>& user,
                                              std::string wandName,
                                              std::optional<ActorId> target,
                                              std::chrono::milliseconds useTime) {
    return begin(user, ActionCategory::Wand, std::move(wandName), target, useTime);
}

GameResult<void> ActionCoordinator::completeWand(const std::shared_ptr<IActor>& user,
                                                 std::chrono::milliseconds delay) {
    std::optional<std::chrono::milliseconds> next;
    if (options_.instantWandCast) {
        if (user) {
            CTC_LOG_DEBUG(LogCategory::Combat, user->name() + " wand instant cast applied");
        }
    } else {
        next = delay;
    }
    return complete(user, ActionCategory::Wand, next, std::chrono::milliseconds(0));
}

bool ActionCoordinator::cancel(ActorId actor, ActionCategory category, std::string_view reason) {
    auto state = states_.find(actor);
    return state && state->cancel(category, reason);
}

bool ActionCoordinator::canPerform(const IActor& actor, ActionCategory category) const {
    if (!isActorUsable(actor)) {
        return false;
    }
    auto state = states_.find(actor.id());
    return !state || state->canPerform(category);
}

} // namespace ctc::combat