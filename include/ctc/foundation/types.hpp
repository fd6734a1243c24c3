#pragma once

/// @file types.hpp
/// @brief Strong identifier types shared across the combat timing core.

#include <compare>
#include <cstdint>
#include <functional>

namespace ctc::foundation {

/// Tag-based strong typedef for identifiers.
///
/// Keeps actor serials and item serials from being mixed up at compile
/// time while sharing the same underlying representation.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct ActorIdTag {};
struct ItemSerialTag {};

/// Stable serial of an actor (player or NPC) in the host simulation.
using ActorId = StrongId<ActorIdTag>;

/// Serial of a concrete item instance (a particular weapon).
using ItemSerial = StrongId<ItemSerialTag>;

} // namespace ctc::foundation
template <typename Tag, typename T>
struct std::hash<ctc::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const ctc::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
