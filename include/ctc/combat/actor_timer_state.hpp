#pragma once

/// @file actor_timer_state.hpp
/// @brief Per-actor action timers, busy phases and cancel-on-start rules.

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ctc/combat/actor.hpp"
#include "ctc/combat/weapon.hpp"
#include "ctc/foundation/time_source.hpp"

namespace ctc::combat {

/// Independent action families, each with its own eligibility timer.
enum class ActionCategory : uint8_t {
    Swing   = 0,
    Spell   = 1,
    Bandage = 2,
    Wand    = 3
};

inline constexpr std::size_t kActionCategoryCount = 4;

constexpr std::string_view actionCategoryName(ActionCategory cat) {
    switch (cat) {
        case ActionCategory::Swing:   return "swing";
        case ActionCategory::Spell:   return "spell";
        case ActionCategory::Bandage: return "bandage";
        case ActionCategory::Wand:    return "wand";
    }
    return "unknown";
}

/// Where next-eligible times are stored.
enum class TimerMode : uint8_t {
    /// Per-category timers kept by the core.
    Independent,
    /// The host engine's shared cooldowns on the actor
    /// (swing -> combat, spell -> spell, bandage and wand -> skill).
    Shared
};

enum class ActionPhase : uint8_t {
    Idle,
    Busy,
    CastDelay
};

/// Context of the action currently in flight for one category.
struct InFlightAction {
    ActionCategory category = ActionCategory::Swing;
    /// Spell or wand name, or the weapon name for swings.
    std::string label;
    std::optional<ActorId> target;
    std::optional<WeaponDescriptor> weapon;
    foundation::TimePoint startedAt{};
    /// Expected time until the action completes or resolves.
    int expectedDelayMs = 0;
};

/// Which categories block or cancel which.
///
/// Index [a][b] reads "category a affects category b".
struct TimerRules {
    using Matrix = std::array<std::array<bool, kActionCategoryCount>, kActionCategoryCount>;

    /// a in progress (Busy) blocks starting b.
    Matrix busyBlocks{};
    /// A spell in post-cast delay blocks starting b.
    std::array<bool, kActionCategoryCount> castDelayBlocks{};
    /// Starting a cancels an in-flight b.
    Matrix cancelsOnStart{};

    /// Casting and post-cast delay block swings; spells cancel pending
    /// swings and vice versa; bandages and wands cancel both.
    static TimerRules defaults();
};

/// Report of one cancellation, delivered outside the state's lock.
struct CancellationNotice {
    ActorId actorId;
    std::string actorName;
    ActionCategory category = ActionCategory::Swing;
    std::string reason;
    InFlightAction action;
};

using CancellationObserver = std::function<void(const CancellationNotice&)>;

/// Timers and phases of one actor.
///
/// All methods lock the state's own mutex, so a state may be touched from
/// the game thread and the tick thread at once. A swing stays "pending"
/// from beginAction() until its hit resolves (completeAction) or it is
/// cancelled, even though setNextTime() already returned its phase to Idle.
class ActorTimerState {
public:
    ActorTimerState(std::weak_ptr<IActor> actor, ActorId id, TimerMode mode,
                    TimerRules rules, const foundation::TimeSource& clock);

    ActorTimerState(const ActorTimerState&) = delete;
    ActorTimerState& operator=(const ActorTimerState&) = delete;

    /// Idle -> Busy. Cancels in-flight actions of the categories the rules
    /// say this one overrides.
    /// @return The categories that were cancelled.
    std::vector<ActionCategory> beginAction(InFlightAction action);

    /// canPerform() and beginAction() under one lock acquisition, so two
    /// callers racing for the same category cannot both start it.
    /// @return The cancelled categories, or std::nullopt when refused.
    std::optional<std::vector<ActionCategory>> tryBeginAction(InFlightAction action);

    /// next-eligible = now + @p delay. A swing returns to Idle here.
    void setNextTime(ActionCategory category, std::chrono::milliseconds delay);

    /// Busy/CastDelay/pending -> Idle. No-op when already idle.
    /// @return true if something was cancelled.
    bool cancel(ActionCategory category, std::string_view reason);

    [[nodiscard]] bool canPerform(ActionCategory category) const;

    /// Spell Busy -> CastDelay for @p duration; a zero duration ends the cast.
    void enterCastDelay(std::chrono::milliseconds duration);

    /// Busy/CastDelay -> Idle, clearing the in-flight context.
    /// @return The action that completed, if one was in flight.
    std::optional<InFlightAction> completeAction(ActionCategory category);

    /// Time until next-eligible (zero when already eligible).
    [[nodiscard]] std::chrono::milliseconds remaining(ActionCategory category) const;

    [[nodiscard]] std::chrono::milliseconds remainingCastDelay() const;

    [[nodiscard]] ActionPhase phase(ActionCategory category) const;

    [[nodiscard]] bool hasPendingSwing() const;

    [[nodiscard]] std::optional<InFlightAction> inFlight(ActionCategory category) const;

    /// Reset every category to Idle and eligible, without notifications.
    void clearAll();

    /// One-line human readable dump for diagnostics commands.
    [[nodiscard]] std::string stateSummary() const;

    [[nodiscard]] ActorId actorId() const noexcept { return id_; }
    [[nodiscard]] TimerMode mode() const noexcept { return mode_; }
    [[nodiscard]] bool isExpired() const { return actor_.expired(); }

    void setCancellationObserver(CancellationObserver observer);
    void setLogCancellations(bool enabled);

private:
    struct Slot {
        ActionPhase phase = ActionPhase::Idle;
        foundation::TimePoint nextTime{};
        foundation::TimePoint castDelayEnd{};
        std::optional<InFlightAction> action;
    };

    // Callers hold mutex_.
    [[nodiscard]] ActionPhase phaseLocked(ActionCategory category,
                                          foundation::TimePoint now) const;
    [[nodiscard]] foundation::TimePoint nextTimeLocked(ActionCategory category) const;
    void storeNextTimeLocked(ActionCategory category, foundation::TimePoint at);
    [[nodiscard]] bool isActiveLocked(ActionCategory category, foundation::TimePoint now) const;
    [[nodiscard]] bool canPerformLocked(ActionCategory category, foundation::TimePoint now) const;
    std::vector<ActionCategory> beginLocked(InFlightAction action, foundation::TimePoint now,
                                            std::vector<CancellationNotice>& notices);
    std::optional<CancellationNotice> cancelLocked(ActionCategory category,
                                                   std::string_view reason,
                                                   foundation::TimePoint now);

    std::weak_ptr<IActor> actor_;
    ActorId id_;
    TimerMode mode_;
    TimerRules rules_;
    const foundation::TimeSource& clock_;

    mutable std::mutex mutex_;
    std::array<Slot, kActionCategoryCount> slots_{};
    CancellationObserver observer_;
    bool logCancellations_ = false;
};

} // namespace ctc::combat