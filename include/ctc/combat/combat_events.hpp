#pragma once

/// @file combat_events.hpp
/// @brief Begin/end notifications published by the orchestrators.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "ctc/combat/actor_timer_state.hpp"
#include "ctc/foundation/signal.hpp"

namespace ctc::combat {

enum class ActionEventKind : uint8_t {
    /// Action accepted and started.
    Begin,
    /// Spell, bandage or wand finished.
    Complete,
    /// Deferred swing hit resolved.
    Resolved,
    Cancelled
};

/// Snapshot of one action transition.
///
/// Carries values rather than live references so observers (audit,
/// shadow verification) never race the game thread.
struct ActionEvent {
    ActionEventKind kind = ActionEventKind::Begin;
    ActionCategory category = ActionCategory::Swing;

    ActorId actorId;
    std::string actorName;
    std::weak_ptr<IActor> actor;
    int dexterity = 0;

    std::optional<ActorId> targetId;
    std::optional<WeaponDescriptor> weapon;
    /// Spell/wand name or weapon name.
    std::string label;

    /// Begin of a swing: attack interval. Resolved: hit offset.
    /// Other kinds: the delay the caller announced.
    int expectedDelayMs = 0;
    std::string providerName;

    foundation::TimePoint at{};
    /// When the action began; set for Complete, Resolved and Cancelled.
    std::optional<foundation::TimePoint> startedAt;

    std::optional<bool> hit;
    std::string reason;
    bool usedFallback = false;
};

/// Observer hooks of the timing core.
struct CombatEvents {
    foundation::Signal<const ActionEvent&> actionBegan;
    foundation::Signal<const ActionEvent&> actionEnded;
};

} // namespace ctc::combat