/// @file actor_timer_state.cpp
/// @brief ActorTimerState implementation.

#include "ctc/combat/actor_timer_state.hpp"

#include <algorithm>
#include <sstream>

#include "ctc/foundation/combat_logger.hpp"

namespace ctc::combat {

using foundation::TimePoint;

namespace {

constexpr std::size_t idx(ActionCategory cat) {
    return static_cast<std::size_t>(cat);
}

SharedCooldown sharedSlotFor(ActionCategory cat) {
    switch (cat) {
        case ActionCategory::Swing: return SharedCooldown::Combat;
        case ActionCategory::Spell: return SharedCooldown::Spell;
        case ActionCategory::Bandage:
        case ActionCategory::Wand:  return SharedCooldown::Skill;
    }
    return SharedCooldown::Combat;
}

std::string_view phaseName(ActionPhase phase) {
    switch (phase) {
        case ActionPhase::Idle:      return "Idle";
        case ActionPhase::Busy:      return "Busy";
        case ActionPhase::CastDelay: return "CastDelay";
    }
    return "?";
}

void publish(const std::vector<CancellationNotice>& notices,
             const CancellationObserver& observer, bool logCancellations) {
    for (const auto& notice : notices) {
        if (logCancellations) {
            foundation::LogContext ctx;
            ctx.actorId = notice.actorId;
            ctx.action = std::string(actionCategoryName(notice.category));
            ctx.extra["reason"] = notice.reason;
            if (!notice.action.label.empty()) {
                ctx.extra["label"] = notice.action.label;
            }
            foundation::CombatLogger::instance().logWithContext(
                foundation::LogLevel::Info, foundation::LogCategory::Combat,
                notice.actorName + " action cancelled", ctx);
        }
        if (observer) {
            observer(notice);
        }
    }
}

} // anonymous namespace
TimerRules TimerRules::defaults() {
    TimerRules rules;
    for (std::size_t i = 0; i < kActionCategoryCount; ++i) {
        rules.busyBlocks[i][i] = true;
    }
    rules.busyBlocks[idx(ActionCategory::Spell)][idx(ActionCategory::Swing)] = true;
    rules.castDelayBlocks[idx(ActionCategory::Swing)] = true;

    rules.cancelsOnStart[idx(ActionCategory::Spell)][idx(ActionCategory::Swing)] = true;
    rules.cancelsOnStart[idx(ActionCategory::Swing)][idx(ActionCategory::Spell)] = true;
    for (auto starter : {ActionCategory::Bandage, ActionCategory::Wand}) {
        rules.cancelsOnStart[idx(starter)][idx(ActionCategory::Swing)] = true;
        rules.cancelsOnStart[idx(starter)][idx(ActionCategory::Spell)] = true;
    }
    return rules;
}

ActorTimerState::ActorTimerState(std::weak_ptr<IActor> actor, ActorId id, TimerMode mode,
                                 TimerRules rules, const foundation::TimeSource& clock)
    : actor_(std::move(actor)), id_(id), mode_(mode), rules_(rules), clock_(clock) {}

// ---------------------------------------------------------------------------
// Lock-held helpers
// ---------------------------------------------------------------------------
ActionPhase ActorTimerState::phaseLocked(ActionCategory category, TimePoint now) const {
    const auto& slot = slots_[idx(category)];
    if (slot.phase == ActionPhase::CastDelay && now >= slot.castDelayEnd) {
        return ActionPhase::Idle;
    }
    return slot.phase;
}

TimePoint ActorTimerState::nextTimeLocked(ActionCategory category) const {
    if (mode_ == TimerMode::Shared) {
        if (auto actor = actor_.lock()) {
            return actor->sharedCooldown(sharedSlotFor(category));
        }
    }
    return slots_[idx(category)].nextTime;
}

void ActorTimerState::storeNextTimeLocked(ActionCategory category, TimePoint at) {
    slots_[idx(category)].nextTime = at;
    if (mode_ == TimerMode::Shared) {
        if (auto actor = actor_.lock()) {
            actor->setSharedCooldown(sharedSlotFor(category), at);
        }
    }
}

bool ActorTimerState::isActiveLocked(ActionCategory category, TimePoint now) const {
    if (phaseLocked(category, now) != ActionPhase::Idle) {
        return true;
    }
    return category == ActionCategory::Swing && slots_[idx(category)].action.has_value();
}

std::optional<CancellationNotice> ActorTimerState::cancelLocked(ActionCategory category,
                                                                std::string_view reason,
                                                                TimePoint now) {
    if (!isActiveLocked(category, now)) {
        return std::nullopt;
    }
    auto& slot = slots_[idx(category)];

    CancellationNotice notice;
    notice.actorId = id_;
    if (auto actor = actor_.lock()) {
        notice.actorName = actor->name();
    }
    notice.category = category;
    notice.reason = reason.empty() ? std::string("Cancelled") : std::string(reason);
    if (slot.action) {
        notice.action = *slot.action;
    } else {
        notice.action.category = category;
    }

    slot.phase = ActionPhase::Idle;
    slot.action.reset();
    slot.castDelayEnd = TimePoint{};
    return notice;
}

// ---------------------------------------------------------------------------
// Transitions
// ---------------------------------------------------------------------------
std::vector<ActionCategory> ActorTimerState::beginLocked(InFlightAction action, TimePoint now,
                                                         std::vector<CancellationNotice>& notices) {
    std::vector<ActionCategory> cancelled;
    const auto starter = action.category;

    for (std::size_t b = 0; b < kActionCategoryCount; ++b) {
        auto other = static_cast<ActionCategory>(b);
        if (other == starter || !rules_.cancelsOnStart[idx(starter)][b]) {
            continue;
        }
        auto reason = std::string("Interrupted by ") + std::string(actionCategoryName(starter));
        if (auto notice = cancelLocked(other, reason, now)) {
            cancelled.push_back(other);
            notices.push_back(std::move(*notice));
        }
    }

    if (action.startedAt == TimePoint{}) {
        action.startedAt = now;
    }
    auto& slot = slots_[idx(starter)];
    slot.phase = ActionPhase::Busy;
    slot.castDelayEnd = TimePoint{};
    slot.action = std::move(action);
    return cancelled;
}

std::vector<ActionCategory> ActorTimerState::beginAction(InFlightAction action) {
    std::vector<ActionCategory> cancelled;
    std::vector<CancellationNotice> notices;
    CancellationObserver observer;
    bool logCancellations = false;
    {
        std::lock_guard lock(mutex_);
        cancelled = beginLocked(std::move(action), clock_.now(), notices);
        observer = observer_;
        logCancellations = logCancellations_;
    }
    publish(notices, observer, logCancellations);
    return cancelled;
}

std::optional<std::vector<ActionCategory>> ActorTimerState::tryBeginAction(
    InFlightAction action) {
    std::vector<ActionCategory> cancelled;
    std::vector<CancellationNotice> notices;
    CancellationObserver observer;
    bool logCancellations = false;
    {
        std::lock_guard lock(mutex_);
        auto now = clock_.now();
        if (!canPerformLocked(action.category, now)) {
            return std::nullopt;
        }
        cancelled = beginLocked(std::move(action), now, notices);
        observer = observer_;
        logCancellations = logCancellations_;
    }
    publish(notices, observer, logCancellations);
    return cancelled;
}

void ActorTimerState::setNextTime(ActionCategory category, std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds(0);
    }
    storeNextTimeLocked(category, clock_.now() + delay);
    if (category == ActionCategory::Swing) {
        slots_[idx(category)].phase = ActionPhase::Idle;
    }
}

bool ActorTimerState::cancel(ActionCategory category, std::string_view reason) {
    std::vector<CancellationNotice> notices;
    CancellationObserver observer;
    bool logCancellations = false;
    {
        std::lock_guard lock(mutex_);
        if (auto notice = cancelLocked(category, reason, clock_.now())) {
            notices.push_back(std::move(*notice));
        }
        observer = observer_;
        logCancellations = logCancellations_;
    }
    publish(notices, observer, logCancellations);
    return !notices.empty();
}

bool ActorTimerState::canPerformLocked(ActionCategory category, TimePoint now) const {
    if (now < nextTimeLocked(category)) {
        return false;
    }
    if (phaseLocked(category, now) != ActionPhase::Idle) {
        return false;
    }
    for (std::size_t b = 0; b < kActionCategoryCount; ++b) {
        auto other = static_cast<ActionCategory>(b);
        if (other == category) {
            continue;
        }
        auto otherPhase = phaseLocked(other, now);
        if (otherPhase == ActionPhase::Busy && rules_.busyBlocks[b][idx(category)]) {
            return false;
        }
        if (otherPhase == ActionPhase::CastDelay && rules_.castDelayBlocks[idx(category)]) {
            return false;
        }
    }
    return true;
}

bool ActorTimerState::canPerform(ActionCategory category) const {
    std::lock_guard lock(mutex_);
    return canPerformLocked(category, clock_.now());
}

void ActorTimerState::enterCastDelay(std::chrono::milliseconds duration) {
    std::lock_guard lock(mutex_);
    auto& slot = slots_[idx(ActionCategory::Spell)];
    if (slot.phase != ActionPhase::Busy) {
        return;
    }
    if (duration.count() <= 0) {
        slot.phase = ActionPhase::Idle;
        slot.action.reset();
        return;
    }
    slot.phase = ActionPhase::CastDelay;
    slot.castDelayEnd = clock_.now() + duration;
}

std::optional<InFlightAction> ActorTimerState::completeAction(ActionCategory category) {
    std::lock_guard lock(mutex_);
    auto& slot = slots_[idx(category)];
    auto completed = std::move(slot.action);
    slot.action.reset();
    slot.phase = ActionPhase::Idle;
    slot.castDelayEnd = TimePoint{};
    return completed;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
std::chrono::milliseconds ActorTimerState::remaining(ActionCategory category) const {
    std::lock_guard lock(mutex_);
    auto now = clock_.now();
    auto next = nextTimeLocked(category);
    if (next <= now) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
}

std::chrono::milliseconds ActorTimerState::remainingCastDelay() const {
    std::lock_guard lock(mutex_);
    auto now = clock_.now();
    const auto& slot = slots_[idx(ActionCategory::Spell)];
    if (phaseLocked(ActionCategory::Spell, now) != ActionPhase::CastDelay) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(slot.castDelayEnd - now);
}

ActionPhase ActorTimerState::phase(ActionCategory category) const {
    std::lock_guard lock(mutex_);
    return phaseLocked(category, clock_.now());
}

bool ActorTimerState::hasPendingSwing() const {
    std::lock_guard lock(mutex_);
    return isActiveLocked(ActionCategory::Swing, clock_.now());
}

std::optional<InFlightAction> ActorTimerState::inFlight(ActionCategory category) const {
    std::lock_guard lock(mutex_);
    return slots_[idx(category)].action;
}

void ActorTimerState::clearAll() {
    std::lock_guard lock(mutex_);
    for (std::size_t i = 0; i < kActionCategoryCount; ++i) {
        slots_[i] = Slot{};
    }
}

std::string ActorTimerState::stateSummary() const {
    std::lock_guard lock(mutex_);
    auto now = clock_.now();

    std::ostringstream oss;
    oss << "actor=" << id_.value()
        << " mode=" << (mode_ == TimerMode::Shared ? "shared" : "independent");
    for (std::size_t i = 0; i < kActionCategoryCount; ++i) {
        auto cat = static_cast<ActionCategory>(i);
        auto next = nextTimeLocked(cat);
        auto wait = next > now ? foundation::millisBetween(now, next) : 0;
        oss << ' ' << actionCategoryName(cat) << '=' << phaseName(phaseLocked(cat, now))
            << '(' << wait << "ms";
        if (slots_[i].action) {
            oss << ",inflight";
        }
        oss << ')';
    }
    return oss.str();
}

void ActorTimerState::setCancellationObserver(CancellationObserver observer) {
    std::lock_guard lock(mutex_);
    observer_ = std::move(observer);
}

void ActorTimerState::setLogCancellations(bool enabled) {
    std::lock_guard lock(mutex_);
    logCancellations_ = enabled;
}

} // namespace ctc::combat