/// @file combat_timing_config_test.cpp
/// @brief Unit tests for loadCombatTimingConfig and CombatRuleFlags.

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>

#include "ctc/service/combat_timing_config.hpp"

using namespace ctc::service;
using namespace ctc::combat;
using namespace ctc::foundation;
using namespace std::chrono_literals;

namespace {

constexpr std::size_t idx(ActionCategory cat) {
    return static_cast<std::size_t>(cat);
}

GameResult<CombatTimingConfig> loadYaml(const std::string& yaml) {
    ConfigManager manager;
    auto parsed = manager.loadFromString(yaml);
    if (!parsed) {
        return GameResult<CombatTimingConfig>::err(parsed.error());
    }
    return loadCombatTimingConfig(manager);
}

} // anonymous namespace
// ============================================================================
// Defaults and mapping
// ============================================================================

TEST(CombatTimingConfigTest, EmptyDocumentGivesDefaults) {
    auto result = loadYaml("{}");
    ASSERT_TRUE(result.hasValue());
    const auto& config = result.value();

    EXPECT_EQ(config.pulse.tickInterval, 50ms);
    EXPECT_EQ(config.pulse.idleTimeout, 5000ms);
    EXPECT_FALSE(config.pulse.globalPulse);
    EXPECT_EQ(config.pulse.startupMaxAttempts, 20);
    EXPECT_TRUE(config.independentTimers);
    EXPECT_FALSE(config.logCancellations);
    EXPECT_TRUE(config.rules.spellCancelSwing);
    EXPECT_TRUE(config.rules.independentBandageTimer);
    EXPECT_TRUE(config.auditSettings.enabled);
    EXPECT_EQ(config.auditSettings.level, ctc::audit::AuditLevel::Standard);
    EXPECT_FALSE(config.auditSettings.shadowMode);

    ASSERT_NE(config.weapons, nullptr);
    auto katana = config.weapons->find(0x13FF);
    ASSERT_TRUE(katana.has_value());
    EXPECT_EQ(katana->speed, 46);
}

TEST(CombatTimingConfigTest, MapsEveryGroup) {
    auto result = loadYaml(R"(
combat:
  tick_ms: 100
  idle_timeout_ms: 8000
  slow_tick_ms: 25.5
  use_global_pulse: true
  independent_timers: false
  log_cancellations: true
  rules:
    spell_cancel_swing: false
    remove_post_cast_recovery: true
    instant_wand_cast: true
    independent_bandage_timer: false
  startup:
    initial_delay_ms: 50
    max_delay_ms: 400
    max_attempts: 5
audit:
  enabled: false
  level: debug
  output_directory: /var/log/combat
  buffer_size: 500
  flush_interval_ms: 2000
  shadow_mode: true
  shadow_sample_every: 4
  retention_days: 30
  max_file_size_mb: 10
  max_entries_per_tick: 50
  auto_throttle_threshold_ms: 20.0
  actor_history: false
  actor_history_size: 20
)");
    ASSERT_TRUE(result.hasValue());
    const auto& config = result.value();

    EXPECT_EQ(config.pulse.tickInterval, 100ms);
    EXPECT_EQ(config.pulse.idleTimeout, 8000ms);
    EXPECT_DOUBLE_EQ(config.pulse.slowTickWarnMs, 25.5);
    EXPECT_TRUE(config.pulse.globalPulse);
    EXPECT_FALSE(config.independentTimers);
    EXPECT_TRUE(config.logCancellations);
    EXPECT_EQ(config.pulse.startupInitialDelay, 50ms);
    EXPECT_EQ(config.pulse.startupMaxDelay, 400ms);
    EXPECT_EQ(config.pulse.startupMaxAttempts, 5);

    EXPECT_FALSE(config.rules.spellCancelSwing);
    EXPECT_TRUE(config.rules.swingCancelSpell);
    EXPECT_TRUE(config.rules.removePostCastRecovery);
    EXPECT_TRUE(config.rules.instantWandCast);
    EXPECT_FALSE(config.rules.independentBandageTimer);

    const auto& audit = config.auditSettings;
    EXPECT_FALSE(audit.enabled);
    EXPECT_EQ(audit.level, ctc::audit::AuditLevel::Debug);
    EXPECT_EQ(audit.outputDirectory.string(), "/var/log/combat");
    EXPECT_EQ(audit.bufferSize, 500u);
    EXPECT_EQ(audit.flushIntervalMs, 2000);
    EXPECT_TRUE(audit.shadowMode);
    EXPECT_EQ(audit.shadowSampleEvery, 4);
    EXPECT_EQ(audit.retentionDays, 30);
    EXPECT_EQ(audit.maxFileSizeMB, 10);
    EXPECT_EQ(audit.maxEntriesPerTick, 50);
    EXPECT_DOUBLE_EQ(audit.autoThrottleThresholdMs, 20.0);
    EXPECT_FALSE(audit.actorHistory);
    EXPECT_EQ(audit.actorHistorySize, 20u);
}

TEST(CombatTimingConfigTest, OutOfRangeValuesAreClamped) {
    auto result = loadYaml(R"(
combat:
  tick_ms: 1
  idle_timeout_ms: 0
  startup:
    max_attempts: 0
audit:
  buffer_size: 5
  flush_interval_ms: 100
)");
    ASSERT_TRUE(result.hasValue());
    const auto& config = result.value();
    EXPECT_EQ(config.pulse.tickInterval, 10ms);
    EXPECT_EQ(config.pulse.idleTimeout, 10ms);
    EXPECT_EQ(config.pulse.startupMaxAttempts, 1);
    EXPECT_EQ(config.auditSettings.bufferSize, 100u);
    EXPECT_EQ(config.auditSettings.flushIntervalMs, 1000);
}

// ============================================================================
// Errors
// ============================================================================

TEST(CombatTimingConfigTest, UnknownAuditLevelIsRejected) {
    auto result = loadYaml("audit:\n  level: loud\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(CombatTimingConfigTest, MalformedValueIsRejected) {
    auto result = loadYaml("combat:\n  tick_ms: fast\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(CombatTimingConfigTest, MalformedBooleanIsRejected) {
    auto result = loadYaml("combat:\n  rules:\n    instant_wand_cast: sometimes\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

// ============================================================================
// Weapon table
// ============================================================================

TEST(CombatTimingConfigTest, InlineWeaponTableExtendsBuiltins) {
    auto result = loadYaml(R"(
weapons:
  table:
    - { item_id: 0x1234, name: Test Blade, speed: 40 }
)");
    ASSERT_TRUE(result.hasValue());
    const auto& weapons = result.value().weapons;

    auto blade = weapons->find(0x1234);
    ASSERT_TRUE(blade.has_value());
    EXPECT_EQ(blade->name, "Test Blade");
    EXPECT_EQ(blade->speed, 40);
    EXPECT_TRUE(weapons->find(0x13FF).has_value());
}

TEST(CombatTimingConfigTest, InvalidWeaponTableFallsBackToBuiltins) {
    auto result = loadYaml(R"(
weapons:
  table:
    - { item_id: 0x1234, name: Test Blade }
)");
    ASSERT_TRUE(result.hasValue());
    const auto& weapons = result.value().weapons;
    EXPECT_FALSE(weapons->find(0x1234).has_value());
    EXPECT_TRUE(weapons->find(0x143E).has_value());
}

TEST(CombatTimingConfigTest, MissingWeaponFileFallsBackToBuiltins) {
    auto result = loadYaml("weapons:\n  table_path: /nonexistent/weapons.yaml\n");
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().weapons->find(0x13B1).has_value());
}

TEST(CombatTimingConfigTest, ShippedConfigLoads) {
    ConfigManager manager;
    ASSERT_TRUE(manager.load(std::filesystem::path(CTC_SOURCE_DIR) / "config" /
                             "combat_timing.yaml")
                    .hasValue());
    auto result = loadCombatTimingConfig(manager);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().pulse.tickInterval, 50ms);
    EXPECT_EQ(result.value().auditSettings.outputDirectory.string(), "logs/combat-audit");
    EXPECT_EQ(result.value().weapons->find(0x143E)->hitOffsetMs, 400);
}

// ============================================================================
// CombatRuleFlags
// ============================================================================

TEST(CombatRuleFlagsTest, DefaultsMatchDefaultTimerRules) {
    CombatRuleFlags flags;
    auto rules = flags.toTimerRules();
    auto expected = TimerRules::defaults();

    for (std::size_t a = 0; a < kActionCategoryCount; ++a) {
        EXPECT_EQ(rules.castDelayBlocks[a], expected.castDelayBlocks[a]);
        for (std::size_t b = 0; b < kActionCategoryCount; ++b) {
            EXPECT_EQ(rules.busyBlocks[a][b], expected.busyBlocks[a][b]);
            EXPECT_EQ(rules.cancelsOnStart[a][b], expected.cancelsOnStart[a][b]);
        }
    }
}

TEST(CombatRuleFlagsTest, SwitchesClearTheirCells) {
    CombatRuleFlags flags;
    flags.spellCancelSwing = false;
    flags.bandageCancelActions = false;
    flags.disableSwingDuringCast = false;
    flags.disableSwingDuringCastDelay = false;
    auto rules = flags.toTimerRules();

    EXPECT_FALSE(rules.cancelsOnStart[idx(ActionCategory::Spell)][idx(ActionCategory::Swing)]);
    EXPECT_TRUE(rules.cancelsOnStart[idx(ActionCategory::Swing)][idx(ActionCategory::Spell)]);
    EXPECT_FALSE(rules.cancelsOnStart[idx(ActionCategory::Bandage)][idx(ActionCategory::Swing)]);
    EXPECT_TRUE(rules.cancelsOnStart[idx(ActionCategory::Wand)][idx(ActionCategory::Spell)]);
    EXPECT_FALSE(rules.busyBlocks[idx(ActionCategory::Spell)][idx(ActionCategory::Swing)]);
    EXPECT_FALSE(rules.castDelayBlocks[idx(ActionCategory::Swing)]);
    EXPECT_TRUE(rules.busyBlocks[idx(ActionCategory::Swing)][idx(ActionCategory::Swing)]);
}

TEST(CombatRuleFlagsTest, CoordinatorOptions) {
    CombatRuleFlags flags;
    flags.removePostCastRecovery = true;
    flags.instantWandCast = true;
    flags.independentBandageTimer = false;
    auto options = flags.coordinatorOptions();
    EXPECT_TRUE(options.removePostCastRecovery);
    EXPECT_TRUE(options.instantWandCast);
    EXPECT_FALSE(options.independentBandageTimer);
}
