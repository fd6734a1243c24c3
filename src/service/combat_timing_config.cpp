/// @file combat_timing_config.cpp
/// @brief Mapping of YAML keys onto CombatTimingConfig.

#include "ctc/service/combat_timing_config.hpp"

#include <algorithm>
#include <string>

#include <yaml-cpp/yaml.h>

#include "ctc/foundation/combat_logger.hpp"

namespace ctc::service {

using combat::ActionCategory;
using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr std::size_t idx(ActionCategory cat) {
    return static_cast<std::size_t>(cat);
}

/// Reads optional keys and keeps the first failure.
class KeyReader {
public:
    explicit KeyReader(const ConfigManager& config) : config_(config) {}

    template <typename T>
    void read(std::string_view key, T& target) {
        if (failed_) {
            return;
        }
        auto value = config_.getOr<T>(key, target);
        if (!value) {
            failed_ = value.error();
            return;
        }
        target = value.value();
    }

    void readMs(std::string_view key, std::chrono::milliseconds& target) {
        auto ms = static_cast<int>(target.count());
        read(key, ms);
        target = std::chrono::milliseconds(ms);
    }

    void fail(GameError error) {
        if (!failed_) {
            failed_ = std::move(error);
        }
    }

    [[nodiscard]] const std::optional<GameError>& failure() const noexcept { return failed_; }

private:
    const ConfigManager& config_;
    std::optional<GameError> failed_;
};

std::shared_ptr<const combat::WeaponTimingTable> loadWeapons(const ConfigManager& config) {
    auto table = std::make_shared<combat::WeaponTimingTable>(
        combat::WeaponTimingTable::withBuiltins());

    GameResult<std::size_t> loaded = GameResult<std::size_t>::ok(0);
    std::string source;
    if (config.hasKey("weapons.table")) {
        auto node = config.node("weapons.table");
        if (!node) {
            loaded = GameResult<std::size_t>::err(node.error());
        } else {
            loaded = table->loadFromYaml(node.value());
        }
        source = "weapons.table";
    } else if (config.hasKey("weapons.table_path")) {
        auto path = config.get<std::string>("weapons.table_path");
        if (!path) {
            loaded = GameResult<std::size_t>::err(path.error());
        } else {
            loaded = table->loadFromFile(path.value());
            source = path.value();
        }
    } else {
        return table;
    }

    if (!loaded) {
        CTC_LOG_WARN(LogCategory::Config,
                     "Weapon table not loaded (" + std::string(loaded.error().message()) +
                         "); using built-in timings");
        return std::make_shared<combat::WeaponTimingTable>(
            combat::WeaponTimingTable::withBuiltins());
    }
    CTC_LOG_INFO(LogCategory::Config, "Loaded " + std::to_string(loaded.value()) +
                                          " weapon timings from " + source);
    return table;
}

}  // anonymous namespace
// -- CombatRuleFlags ----------------------------------------------------------

combat::TimerRules CombatRuleFlags::toTimerRules() const {
    combat::TimerRules rules;
    for (std::size_t i = 0; i < combat::kActionCategoryCount; ++i) {
        rules.busyBlocks[i][i] = true;
    }
    if (disableSwingDuringCast) {
        rules.busyBlocks[idx(ActionCategory::Spell)][idx(ActionCategory::Swing)] = true;
    }
    if (disableSwingDuringCastDelay) {
        rules.castDelayBlocks[idx(ActionCategory::Swing)] = true;
    }
    if (spellCancelSwing) {
        rules.cancelsOnStart[idx(ActionCategory::Spell)][idx(ActionCategory::Swing)] = true;
    }
    if (swingCancelSpell) {
        rules.cancelsOnStart[idx(ActionCategory::Swing)][idx(ActionCategory::Spell)] = true;
    }
    if (bandageCancelActions) {
        rules.cancelsOnStart[idx(ActionCategory::Bandage)][idx(ActionCategory::Swing)] = true;
        rules.cancelsOnStart[idx(ActionCategory::Bandage)][idx(ActionCategory::Spell)] = true;
    }
    if (wandCancelActions) {
        rules.cancelsOnStart[idx(ActionCategory::Wand)][idx(ActionCategory::Swing)] = true;
        rules.cancelsOnStart[idx(ActionCategory::Wand)][idx(ActionCategory::Spell)] = true;
    }
    return rules;
}

combat::CoordinatorOptions CombatRuleFlags::coordinatorOptions() const {
    combat::CoordinatorOptions options;
    options.removePostCastRecovery = removePostCastRecovery;
    options.instantWandCast = instantWandCast;
    options.independentBandageTimer = independentBandageTimer;
    return options;
}

// -- CombatTimingConfig -------------------------------------------------------

void CombatTimingConfig::validate() {
    using std::chrono::milliseconds;

    pulse.tickInterval = std::clamp(pulse.tickInterval, milliseconds(10), milliseconds(1000));
    pulse.idleTimeout = std::max(pulse.idleTimeout, pulse.tickInterval);
    pulse.slowTickWarnMs = std::max(pulse.slowTickWarnMs, 0.0);
    pulse.performanceWindow = std::max<std::size_t>(pulse.performanceWindow, 10);
    pulse.startupInitialDelay = std::max(pulse.startupInitialDelay, milliseconds(1));
    pulse.startupMaxDelay = std::max(pulse.startupMaxDelay, pulse.startupInitialDelay);
    pulse.startupMaxAttempts = std::max(pulse.startupMaxAttempts, 1);

    auditSettings.validate();

    if (!weapons) {
        weapons = std::make_shared<combat::WeaponTimingTable>(
            combat::WeaponTimingTable::withBuiltins());
    }
}

GameResult<CombatTimingConfig> loadCombatTimingConfig(const ConfigManager& config) {
    CombatTimingConfig result;
    KeyReader reader(config);

    reader.readMs("combat.tick_ms", result.pulse.tickInterval);
    reader.readMs("combat.idle_timeout_ms", result.pulse.idleTimeout);
    reader.read("combat.slow_tick_ms", result.pulse.slowTickWarnMs);
    reader.read("combat.use_global_pulse", result.pulse.globalPulse);
    reader.read("combat.independent_timers", result.independentTimers);
    reader.read("combat.log_cancellations", result.logCancellations);

    reader.readMs("combat.startup.initial_delay_ms", result.pulse.startupInitialDelay);
    reader.readMs("combat.startup.max_delay_ms", result.pulse.startupMaxDelay);
    reader.read("combat.startup.max_attempts", result.pulse.startupMaxAttempts);

    auto& rules = result.rules;
    reader.read("combat.rules.spell_cancel_swing", rules.spellCancelSwing);
    reader.read("combat.rules.swing_cancel_spell", rules.swingCancelSpell);
    reader.read("combat.rules.bandage_cancel_actions", rules.bandageCancelActions);
    reader.read("combat.rules.wand_cancel_actions", rules.wandCancelActions);
    reader.read("combat.rules.disable_swing_during_cast", rules.disableSwingDuringCast);
    reader.read("combat.rules.disable_swing_during_cast_delay",
                rules.disableSwingDuringCastDelay);
    reader.read("combat.rules.remove_post_cast_recovery", rules.removePostCastRecovery);
    reader.read("combat.rules.instant_wand_cast", rules.instantWandCast);
    reader.read("combat.rules.independent_bandage_timer", rules.independentBandageTimer);

    auto& auditCfg = result.auditSettings;
    reader.read("audit.enabled", auditCfg.enabled);
    std::string level(audit::auditLevelName(auditCfg.level));
    reader.read("audit.level", level);
    if (auto parsed = audit::parseAuditLevel(level)) {
        auditCfg.level = *parsed;
    } else {
        reader.fail(GameError(ErrorCode::ConfigTypeMismatch, "unknown audit.level: " + level));
    }
    std::string directory = auditCfg.outputDirectory.string();
    reader.read("audit.output_directory", directory);
    auditCfg.outputDirectory = directory;
    reader.read("audit.buffer_size", auditCfg.bufferSize);
    reader.read("audit.flush_interval_ms", auditCfg.flushIntervalMs);
    reader.read("audit.shadow_mode", auditCfg.shadowMode);
    reader.read("audit.shadow_sample_every", auditCfg.shadowSampleEvery);
    reader.read("audit.retention_days", auditCfg.retentionDays);
    reader.read("audit.max_file_size_mb", auditCfg.maxFileSizeMB);
    reader.read("audit.max_entries_per_tick", auditCfg.maxEntriesPerTick);
    reader.read("audit.auto_throttle_threshold_ms", auditCfg.autoThrottleThresholdMs);
    reader.read("audit.actor_history", auditCfg.actorHistory);
    reader.read("audit.actor_history_size", auditCfg.actorHistorySize);

    if (reader.failure()) {
        CTC_LOG_ERROR(LogCategory::Config, "Invalid combat timing config: " +
                                               std::string(reader.failure()->message()));
        return GameResult<CombatTimingConfig>::err(*reader.failure());
    }

    result.weapons = loadWeapons(config);
    result.validate();
    return GameResult<CombatTimingConfig>::ok(std::move(result));
}

}  // namespace ctc::service