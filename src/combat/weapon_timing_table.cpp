/// @file weapon_timing_table.cpp
/// @brief WeaponTimingTable defaults and YAML loading.

#include "ctc/combat/weapon_timing_table.hpp"

#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "ctc/foundation/combat_logger.hpp"

namespace ctc::combat {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

WeaponClass classifyWeapon(const WeaponDescriptor* weapon) {
    if (weapon == nullptr) {
        return WeaponClass::Default;
    }
    if (weapon->ranged || weapon->type == WeaponType::Ranged) {
        return weapon->animation == WeaponAnimation::ShootCrossbow ? WeaponClass::Crossbow
                                                                   : WeaponClass::Bow;
    }
    if (weapon->twoHanded) {
        return WeaponClass::TwoHanded;
    }
    if (weapon->type == WeaponType::Piercing) {
        return WeaponClass::Dagger;
    }
    return WeaponClass::OneHanded;
}

WeaponTimingTable::WeaponTimingTable()
    : classDefaults_{{
          {0, "Default", 50, 1600, 300, 600},
          {0, "Dagger", 20, 1600, 200, 400},
          {0, "OneHandedSword", 35, 1600, 300, 600},
          {0, "TwoHanded", 75, 1900, 400, 800},
          {0, "Bow", 45, 2000, 500, 900},
          {0, "Crossbow", 50, 2000, 600, 1100},
      }} {}

WeaponTimingTable WeaponTimingTable::withBuiltins() {
    WeaponTimingTable table;
    table.upsert({0x13FF, "Katana", 46, 1600, 300, 600});
    table.upsert({0x13B8, "Longsword", 30, 1600, 300, 600});
    table.upsert({0x143E, "Halberd", 25, 1900, 400, 800});
    table.upsert({0x13B1, "Bow", 30, 2000, 500, 900});
    return table;
}

const WeaponTimingEntry& WeaponTimingTable::lookup(const WeaponDescriptor* weapon) const {
    if (weapon != nullptr) {
        auto it = entries_.find(weapon->itemId);
        if (it != entries_.end()) {
            return it->second;
        }
    }
    return classDefault(classifyWeapon(weapon));
}

std::optional<WeaponTimingEntry> WeaponTimingTable::find(uint32_t itemId) const {
    auto it = entries_.find(itemId);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const WeaponTimingEntry& WeaponTimingTable::classDefault(WeaponClass cls) const {
    auto idx = static_cast<std::size_t>(cls);
    return idx < classDefaults_.size() ? classDefaults_[idx] : classDefaults_[0];
}

void WeaponTimingTable::upsert(WeaponTimingEntry entry) {
    auto id = entry.itemId;
    entries_[id] = std::move(entry);
}

GameResult<std::size_t> WeaponTimingTable::loadFromYaml(const YAML::Node& entries) {
    if (!entries.IsSequence()) {
        return GameResult<std::size_t>::err(
            GameError(ErrorCode::WeaponTableLoadFailed, "weapon table must be a YAML sequence"));
    }

    const auto& fallback = classDefault(WeaponClass::Default);
    std::vector<WeaponTimingEntry> parsed;
    parsed.reserve(entries.size());

    try {
        for (std::size_t i = 0; i < entries.size(); ++i) {
            const auto& node = entries[i];
            if (!node["item_id"] || !node["speed"]) {
                return GameResult<std::size_t>::err(
                    GameError(ErrorCode::WeaponTableLoadFailed,
                              "weapon entry " + std::to_string(i) + " needs item_id and speed"));
            }

            WeaponTimingEntry entry;
            entry.itemId = node["item_id"].as<uint32_t>();
            entry.name = node["name"] ? node["name"].as<std::string>()
                                      : "item_" + std::to_string(entry.itemId);
            entry.speed = node["speed"].as<int>();
            entry.baseMs = node["base_ms"] ? node["base_ms"].as<int>() : fallback.baseMs;
            entry.hitOffsetMs =
                node["hit_offset_ms"] ? node["hit_offset_ms"].as<int>() : fallback.hitOffsetMs;
            entry.animationMs =
                node["animation_ms"] ? node["animation_ms"].as<int>() : fallback.animationMs;

            if (entry.speed <= 0 || entry.hitOffsetMs < 0 || entry.animationMs < 0) {
                return GameResult<std::size_t>::err(
                    GameError(ErrorCode::WeaponTableLoadFailed,
                              "weapon entry '" + entry.name + "' has out-of-range timing values"));
            }
            parsed.push_back(std::move(entry));
        }
    } catch (const YAML::Exception& e) {
        return GameResult<std::size_t>::err(
            GameError(ErrorCode::WeaponTableLoadFailed,
                      std::string("invalid weapon table: ") + e.what()));
    }

    for (auto& entry : parsed) {
        upsert(std::move(entry));
    }

    CTC_LOG_INFO(foundation::LogCategory::Timing,
                 "Loaded " + std::to_string(parsed.size()) + " weapon timing entries");
    return GameResult<std::size_t>::ok(parsed.size());
}

GameResult<std::size_t> WeaponTimingTable::loadFromFile(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return GameResult<std::size_t>::err(
            GameError(ErrorCode::WeaponTableLoadFailed,
                      "failed to read weapon table " + path.string() + ": " + e.what()));
    }
    // Accept either a bare sequence or a document with a top-level "weapons" key.
    if (root.IsMap() && root["weapons"]) {
        return loadFromYaml(root["weapons"]);
    }
    return loadFromYaml(root);
}

}  // namespace ctc::combat