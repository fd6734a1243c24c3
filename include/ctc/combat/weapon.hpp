#pragma once

/// @file weapon.hpp
/// @brief Weapon descriptors, weapon classes and timing table entries.

#include <cstdint>
#include <string>
#include <string_view>

#include "ctc/foundation/types.hpp"

namespace ctc::combat {

/// Swing animation family reported by the host item data.
enum class WeaponAnimation : uint8_t {
    Wrestle,
    Slash1H,
    Pierce1H,
    Bash1H,
    Slash2H,
    Pierce2H,
    Bash2H,
    ShootBow,
    ShootCrossbow
};

/// Damage style of a weapon.
enum class WeaponType : uint8_t {
    Slashing,
    Piercing,
    Bashing,
    Ranged,
    Fists
};

/// Class used to pick default timings for weapons missing from the table.
enum class WeaponClass : uint8_t {
    Default,
    Dagger,
    OneHanded,
    TwoHanded,
    Bow,
    Crossbow
};

constexpr std::string_view weaponClassName(WeaponClass cls) {
    switch (cls) {
        case WeaponClass::Default:   return "Default";
        case WeaponClass::Dagger:    return "Dagger";
        case WeaponClass::OneHanded: return "OneHandedSword";
        case WeaponClass::TwoHanded: return "TwoHanded";
        case WeaponClass::Bow:       return "Bow";
        case WeaponClass::Crossbow:  return "Crossbow";
    }
    return "Default";
}

/// What the host tells the core about the weapon used for an action.
struct WeaponDescriptor {
    foundation::ItemSerial serial;
    /// Item kind (graphic id); the weapon timing table is keyed by it.
    uint32_t itemId = 0;
    std::string name;
    WeaponAnimation animation = WeaponAnimation::Slash1H;
    WeaponType type = WeaponType::Slashing;
    bool twoHanded = false;
    bool ranged = false;
    /// Base swing time in seconds from the legacy item data; 0 when unknown.
    double legacySpeedSeconds = 0.0;
};

/// Immutable timing parameters for one weapon kind.
struct WeaponTimingEntry {
    uint32_t itemId = 0;
    std::string name;
    /// Higher is slower; the base interval is speed * 40 ms.
    int speed = 50;
    int baseMs = 1600;
    int hitOffsetMs = 300;
    int animationMs = 600;
};

/// Classify a weapon for default lookup.
///
/// Order: no weapon, ranged (crossbow or bow), two-handed, piercing
/// one-handed (dagger), other one-handed.
WeaponClass classifyWeapon(const WeaponDescriptor* weapon);

}  // namespace ctc::combat