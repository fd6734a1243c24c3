#pragma once

/// @file combat_handler.hpp
/// @brief Callbacks into host game logic (animation, hit check, damage).

#include <memory>
#include <optional>

#include "ctc/combat/actor.hpp"
#include "ctc/combat/weapon.hpp"

namespace ctc::combat {

/// Game-domain collaborator. The core decides *when*; the handler decides
/// *what happens*. Any method may throw; the core logs and carries on.
class ICombatHandler {
public:
    virtual ~ICombatHandler() = default;

    /// Start the swing animation. Called synchronously when the swing begins.
    virtual void playSwingAnimation(IActor& attacker, IActor& defender,
                                    const WeaponDescriptor* weapon, int animationMs) = 0;

    /// Roll the hit. Called from the tick when the hit offset elapsed.
    virtual bool checkHit(IActor& attacker, IActor& defender, const WeaponDescriptor* weapon) = 0;

    virtual void onHit(IActor& attacker, IActor& defender, const WeaponDescriptor* weapon) = 0;
    virtual void onMiss(IActor& attacker, IActor& defender, const WeaponDescriptor* weapon) = 0;

    /// Current opponent, used by global-pulse auto swings.
    [[nodiscard]] virtual std::shared_ptr<IActor> currentCombatant(const IActor& actor) = 0;

    /// Weapon in hand, or nullopt when unarmed.
    [[nodiscard]] virtual std::optional<WeaponDescriptor> equippedWeapon(const IActor& actor) = 0;
};

} // namespace ctc::combat