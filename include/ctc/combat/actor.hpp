#pragma once

/// @file actor.hpp
/// @brief Read/notify surface the timing core needs from a simulation actor.

#include <cstdint>
#include <string>

#include "ctc/foundation/time_source.hpp"
#include "ctc/foundation/types.hpp"

namespace ctc::combat {

using foundation::ActorId;
using foundation::TimePoint;

/// Cooldown slots the host engine keeps on every actor. Used in
/// shared-timer mode instead of the core's own per-category timers.
enum class SharedCooldown : uint8_t {
    Combat = 0,
    Spell  = 1,
    Skill  = 2
};

/// An actor (player character or NPC) owned by the host simulation.
///
/// The core never owns actors: it holds std::weak_ptr and re-checks
/// validity before acting on one. Implementations must be safe to query
/// from the tick thread.
class IActor {
public:
    virtual ~IActor() = default;

    [[nodiscard]] virtual ActorId id() const = 0;
    [[nodiscard]] virtual std::string name() const = 0;

    /// Removed from the world. Deleted actors are dropped from scheduling.
    [[nodiscard]] virtual bool isDeleted() const = 0;

    [[nodiscard]] virtual bool isAlive() const = 0;

    /// Players receive a dexterity bonus; NPCs always swing at base speed.
    [[nodiscard]] virtual bool isPlayer() const = 0;

    /// Speed attribute feeding the interval formula.
    [[nodiscard]] virtual int dexterity() const = 0;

    [[nodiscard]] virtual TimePoint sharedCooldown(SharedCooldown slot) const = 0;
    virtual void setSharedCooldown(SharedCooldown slot, TimePoint readyAt) = 0;
};

/// True when the actor still exists and may act.
inline bool isActorUsable(const IActor& actor) {
    return !actor.isDeleted() && actor.isAlive();
}

} // namespace ctc::combat