#pragma once

/// @file weapon_timing_table.hpp
/// @brief Weapon kind -> timing entry lookup with class and global defaults.

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <unordered_map>

#include "ctc/combat/weapon.hpp"
#include "ctc/foundation/game_result.hpp"

namespace YAML {
class Node;
}

namespace ctc::combat {

/// Timing data for every known weapon kind.
///
/// Lookup order: exact item id, then the weapon's class default, then the
/// global default. A lookup never fails. The table is filled once at
/// startup and shared read-only between providers afterwards.
///
/// YAML layout accepted by loadFromYaml()/loadFromFile():
/// @code
///   - item_id: 0x13FF
///     name: Katana
///     speed: 46
///     base_ms: 1600        # optional, default 1600
///     hit_offset_ms: 300   # optional, class default
///     animation_ms: 600    # optional, class default
/// @endcode
class WeaponTimingTable {
public:
    /// Empty table: class and global defaults only.
    WeaponTimingTable();

    /// Table preloaded with the built-in compatibility entries
    /// (Katana, Longsword, Halberd, Bow).
    [[nodiscard]] static WeaponTimingTable withBuiltins();

    [[nodiscard]] const WeaponTimingEntry& lookup(const WeaponDescriptor* weapon) const;

    [[nodiscard]] std::optional<WeaponTimingEntry> find(uint32_t itemId) const;

    [[nodiscard]] const WeaponTimingEntry& classDefault(WeaponClass cls) const;

    /// Insert or replace one entry.
    void upsert(WeaponTimingEntry entry);

    /// Parse a YAML sequence of entries. All-or-nothing: on any invalid
    /// entry the table is left unchanged.
    /// @return Number of entries added or replaced, or WeaponTableLoadFailed.
    foundation::GameResult<std::size_t> loadFromYaml(const YAML::Node& entries);

    foundation::GameResult<std::size_t> loadFromFile(const std::filesystem::path& path);

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    std::unordered_map<uint32_t, WeaponTimingEntry> entries_;
    std::array<WeaponTimingEntry, 6> classDefaults_;
};

} // namespace ctc::combat