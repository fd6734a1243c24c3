#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ctc/audit/combat_audit.hpp"

using namespace ctc::audit;
using namespace ctc::combat;
using namespace ctc::foundation;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

/// 2026-03-14T09:26:53.589Z
const WallTimePoint kWallOrigin{std::chrono::milliseconds(1773480413589LL)};

class FakeActor final : public IActor {
public:
    explicit FakeActor(uint64_t serial) : id_(serial) {}

    ActorId id() const override { return id_; }
    std::string name() const override { return "Tester"; }
    bool isDeleted() const override { return false; }
    bool isAlive() const override { return true; }
    bool isPlayer() const override { return true; }
    int dexterity() const override { return 100; }
    TimePoint sharedCooldown(SharedCooldown slot) const override {
        return cooldowns_[static_cast<std::size_t>(slot)];
    }
    void setSharedCooldown(SharedCooldown slot, TimePoint readyAt) override {
        cooldowns_[static_cast<std::size_t>(slot)] = readyAt;
    }

private:
    ActorId id_;
    std::array<TimePoint, 3> cooldowns_{};
};

class FakeTimerService final : public ITimerService {
public:
    bool isReady() const override { return true; }

    GameResult<TimerHandle> schedulePeriodic(std::chrono::milliseconds interval,
                                             TimerCallback callback) override {
        TimerHandle handle = 0;
        {
            std::lock_guard lock(mutex_);
            handle = nextHandle_++;
            callbacks_[handle] = callback;
            lastInterval = interval;
        }
        if (fireOnSchedule) {
            callback();
        }
        return GameResult<TimerHandle>::ok(handle);
    }

    GameResult<void> cancel(TimerHandle handle) override {
        std::lock_guard lock(mutex_);
        if (callbacks_.erase(handle) == 0) {
            return GameResult<void>::err(GameError(ErrorCode::TimerNotFound, "unknown"));
        }
        return GameResult<void>::ok();
    }

    void fireAll() {
        std::vector<TimerCallback> snapshot;
        {
            std::lock_guard lock(mutex_);
            for (auto& [handle, cb] : callbacks_) {
                snapshot.push_back(cb);
            }
        }
        for (auto& cb : snapshot) {
            cb();
        }
    }

    std::size_t active() const {
        std::lock_guard lock(mutex_);
        return callbacks_.size();
    }

    std::chrono::milliseconds lastInterval{0};
    /// Run the callback once before schedulePeriodic() returns, as a timer
    /// thread may do.
    bool fireOnSchedule = false;

private:
    mutable std::mutex mutex_;
    std::map<TimerHandle, TimerCallback> callbacks_;
    TimerHandle nextHandle_ = 1;
};

AuditLogEntry entryFor(uint64_t actor, double varianceMs = 0.0) {
    AuditLogEntry entry;
    entry.actorId = ActorId(actor);
    entry.actorName = "Tester";
    entry.actionType = std::string(action_types::kSwingStart);
    entry.timingProvider = "WeaponTiming";
    entry.varianceMs = varianceMs;
    return entry;
}

std::vector<std::string> readLines(const fs::path& file) {
    std::vector<std::string> lines;
    std::ifstream in(file);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

WeaponDescriptor katana() {
    WeaponDescriptor weapon;
    weapon.itemId = 0x13FF;
    weapon.name = "Katana";
    return weapon;
}

} // anonymous namespace
class CombatAuditTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("ctc_audit_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        config_.outputDirectory = dir_;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    ActionEvent swingEvent(ActionEventKind kind, int expectedMs) const {
        ActionEvent event;
        event.kind = kind;
        event.category = ActionCategory::Swing;
        event.actorId = ActorId(7);
        event.actorName = "Alice";
        event.dexterity = 125;
        event.targetId = ActorId(2);
        event.weapon = katana();
        event.label = "Katana";
        event.expectedDelayMs = expectedMs;
        event.providerName = "WeaponTiming";
        event.at = clock_.now();
        return event;
    }

    fs::path todayFile() const { return dir_ / "combat-audit-2026-03-14.jsonl"; }

    ManualTimeSource clock_{kWallOrigin};
    AuditConfig config_;
    fs::path dir_;
};

// ---------------------------------------------------------------------------
// Buffering
// ---------------------------------------------------------------------------

TEST_F(CombatAuditTest, BufferKeepsNewestEntries) {
    config_.bufferSize = 100;
    config_.maxEntriesPerTick = 1000;
    CombatAudit audit(config_, clock_);

    for (int i = 0; i < 150; ++i) {
        ASSERT_TRUE(audit.record(entryFor(1)));
    }

    auto entries = audit.snapshot();
    ASSERT_EQ(entries.size(), 100u);
    EXPECT_EQ(entries.front().sequence, 51u);
    EXPECT_EQ(entries.back().sequence, 150u);

    auto stats = audit.stats();
    EXPECT_EQ(stats.totalRecorded, 150u);
    EXPECT_EQ(stats.droppedByOverflow, 50u);
    EXPECT_EQ(stats.bufferCount, 100u);
}

TEST_F(CombatAuditTest, RecordStampsClocks) {
    CombatAudit audit(config_, clock_);
    ASSERT_TRUE(audit.record(entryFor(1)));
    auto entry = audit.snapshot().front();
    EXPECT_EQ(entry.timestampMs, 1773480413589LL);
    EXPECT_EQ(entry.recordedAt, clock_.now());
}

TEST_F(CombatAuditTest, TickCapRefusesExtraEntries) {
    config_.maxEntriesPerTick = 10;
    CombatAudit audit(config_, clock_);

    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(audit.record(entryFor(1)));
    }
    EXPECT_FALSE(audit.record(entryFor(1)));
    EXPECT_FALSE(audit.record(entryFor(1)));
    EXPECT_EQ(audit.stats().droppedByTickCap, 2u);

    audit.onTickCompleted(1.0);
    EXPECT_TRUE(audit.record(entryFor(1)));
    EXPECT_EQ(audit.bufferCount(), 11u);
}

TEST_F(CombatAuditTest, DisabledRecordsNothing) {
    config_.enabled = false;
    CombatAudit audit(config_, clock_);
    EXPECT_FALSE(audit.record(entryFor(1)));
    EXPECT_EQ(audit.effectiveLevel(), AuditLevel::None);
    EXPECT_FALSE(audit.shouldRecord(AuditLevel::Standard));
}

TEST_F(CombatAuditTest, ClearDropsEverything) {
    CombatAudit audit(config_, clock_);
    ASSERT_TRUE(audit.record(entryFor(1)));
    audit.clear();
    EXPECT_EQ(audit.bufferCount(), 0u);
    EXPECT_TRUE(audit.actorHistory(ActorId(1)).empty());
}

// ---------------------------------------------------------------------------
// Event observation
// ---------------------------------------------------------------------------

TEST_F(CombatAuditTest, SwingStartMeasuresPreviousInterval) {
    CombatAudit audit(config_, clock_);

    audit.observe(swingEvent(ActionEventKind::Begin, 1450));
    clock_.advance(1475ms);
    audit.observe(swingEvent(ActionEventKind::Begin, 1450));

    auto entries = audit.snapshot();
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_EQ(entries[0].actionType, "SwingStart");
    EXPECT_DOUBLE_EQ(entries[0].expectedDelayMs, 1450.0);
    EXPECT_DOUBLE_EQ(entries[0].actualDelayMs, 0.0);
    EXPECT_FALSE(entries[0].detail("NextDelayMs").has_value());

    EXPECT_DOUBLE_EQ(entries[1].expectedDelayMs, 1450.0);
    EXPECT_DOUBLE_EQ(entries[1].actualDelayMs, 1475.0);
    EXPECT_DOUBLE_EQ(entries[1].varianceMs, 25.0);
    EXPECT_EQ(entries[1].detail("NextDelayMs"), "1450");
    EXPECT_EQ(entries[1].weaponId, 0x13FF);
    EXPECT_EQ(entries[1].weaponName, "Katana");
    EXPECT_EQ(entries[1].dexterity, 125);
    EXPECT_EQ(entries[1].timingProvider, "WeaponTiming");
    EXPECT_EQ(entries[1].detail("Defender"), "0x00000002");
}

TEST_F(CombatAuditTest, HitResolutionMeasuresFromSwingStart) {
    CombatAudit audit(config_, clock_);

    auto started = clock_.now();
    clock_.advance(300ms);
    auto event = swingEvent(ActionEventKind::Resolved, 300);
    event.startedAt = started;
    event.hit = true;
    audit.observe(event);

    auto entries = audit.snapshot();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].actionType, "HitResolution");
    EXPECT_DOUBLE_EQ(entries[0].actualDelayMs, 300.0);
    EXPECT_DOUBLE_EQ(entries[0].varianceMs, 0.0);
    EXPECT_EQ(entries[0].detail("Hit"), "true");
}

TEST_F(CombatAuditTest, CancellationCarriesReason) {
    CombatAudit audit(config_, clock_);

    auto started = clock_.now();
    clock_.advance(120ms);
    auto event = swingEvent(ActionEventKind::Cancelled, 1450);
    event.startedAt = started;
    event.reason = "Interrupted by spell";
    audit.observe(event);

    auto entry = audit.snapshot().front();
    EXPECT_EQ(entry.actionType, "SwingCancelled");
    EXPECT_DOUBLE_EQ(entry.actualDelayMs, 120.0);
    EXPECT_DOUBLE_EQ(entry.varianceMs, 0.0);
    EXPECT_EQ(entry.detail("Reason"), "Interrupted by spell");
}

TEST_F(CombatAuditTest, StandardLevelSkipsBandagesAndWands) {
    CombatAudit audit(config_, clock_);

    ActionEvent bandage;
    bandage.category = ActionCategory::Bandage;
    bandage.actorId = ActorId(7);
    bandage.at = clock_.now();
    audit.observe(bandage);
    EXPECT_EQ(audit.bufferCount(), 0u);

    ActionEvent spell;
    spell.category = ActionCategory::Spell;
    spell.actorId = ActorId(7);
    spell.label = "Fireball";
    spell.providerName = "HostTiming";
    spell.at = clock_.now();
    audit.observe(spell);

    auto entries = audit.snapshot();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].actionType, "SpellCastStart");
    EXPECT_EQ(entries[0].detail("SpellName"), "Fireball");
    EXPECT_EQ(entries[0].actorName, "Unknown");
}

TEST_F(CombatAuditTest, DetailedLevelRecordsBandagesAndWands) {
    config_.level = AuditLevel::Detailed;
    CombatAudit audit(config_, clock_);

    ActionEvent bandage;
    bandage.category = ActionCategory::Bandage;
    bandage.actorId = ActorId(7);
    bandage.targetId = ActorId(8);
    bandage.at = clock_.now();
    audit.observe(bandage);

    ActionEvent wand;
    wand.kind = ActionEventKind::Complete;
    wand.category = ActionCategory::Wand;
    wand.actorId = ActorId(7);
    wand.label = "Wand of Lightning";
    wand.at = clock_.now();
    audit.observe(wand);

    auto entries = audit.snapshot();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].actionType, "BandageStart");
    EXPECT_EQ(entries[0].detail("Patient"), "0x00000008");
    EXPECT_EQ(entries[0].auditLevel, AuditLevel::Detailed);
    EXPECT_EQ(entries[1].actionType, "WandComplete");
    EXPECT_EQ(entries[1].weaponName, "Wand of Lightning");
}

TEST_F(CombatAuditTest, LevelNoneRecordsNoEvents) {
    config_.level = AuditLevel::None;
    CombatAudit audit(config_, clock_);
    audit.observe(swingEvent(ActionEventKind::Begin, 1450));
    EXPECT_EQ(audit.bufferCount(), 0u);
}

// ---------------------------------------------------------------------------
// Auto-throttle
// ---------------------------------------------------------------------------

TEST_F(CombatAuditTest, ThrottleHysteresis) {
    config_.level = AuditLevel::Detailed;
    CombatAudit audit(config_, clock_);

    audit.onTickCompleted(12.0);
    EXPECT_TRUE(audit.isThrottled());
    EXPECT_EQ(audit.effectiveLevel(), AuditLevel::Standard);
    EXPECT_FALSE(audit.shouldRecord(AuditLevel::Detailed));
    EXPECT_TRUE(audit.shouldRecord(AuditLevel::Standard));

    // Between 80% and 100% of the threshold the state holds.
    audit.onTickCompleted(9.0);
    EXPECT_TRUE(audit.isThrottled());

    audit.onTickCompleted(7.0);
    EXPECT_FALSE(audit.isThrottled());
    EXPECT_EQ(audit.effectiveLevel(), AuditLevel::Detailed);
    EXPECT_FALSE(audit.stats().throttled);
}

TEST_F(CombatAuditTest, ThrottleDisabledByZeroThreshold) {
    config_.autoThrottleThresholdMs = 0.0;
    CombatAudit audit(config_, clock_);
    audit.onTickCompleted(500.0);
    EXPECT_FALSE(audit.isThrottled());
}

// ---------------------------------------------------------------------------
// Actor history
// ---------------------------------------------------------------------------

TEST_F(CombatAuditTest, ActorHistoryIsBounded) {
    config_.actorHistorySize = 10;
    CombatAudit audit(config_, clock_);

    for (int i = 0; i < 15; ++i) {
        ASSERT_TRUE(audit.record(entryFor(1)));
    }
    ASSERT_TRUE(audit.record(entryFor(2)));

    auto history = audit.actorHistory(ActorId(1));
    ASSERT_EQ(history.size(), 10u);
    EXPECT_EQ(history.front().sequence, 6u);
    EXPECT_EQ(history.back().sequence, 15u);
    EXPECT_EQ(audit.actorHistory(ActorId(2)).size(), 1u);
    EXPECT_TRUE(audit.actorHistory(ActorId(3)).empty());
}

TEST_F(CombatAuditTest, ActorHistoryWindow) {
    CombatAudit audit(config_, clock_);
    ASSERT_TRUE(audit.record(entryFor(1)));
    clock_.advance(5000ms);
    ASSERT_TRUE(audit.record(entryFor(1)));

    EXPECT_EQ(audit.actorHistory(ActorId(1)).size(), 2u);
    auto recent = audit.actorHistory(ActorId(1), 2000ms);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].sequence, 2u);
}

TEST_F(CombatAuditTest, ActorHistoryDisabled) {
    config_.actorHistory = false;
    CombatAudit audit(config_, clock_);
    ASSERT_TRUE(audit.record(entryFor(1)));
    EXPECT_TRUE(audit.actorHistory(ActorId(1)).empty());
    EXPECT_EQ(audit.bufferCount(), 1u);
}

TEST_F(CombatAuditTest, HistoryOfDestroyedActorIsDropped) {
    CombatAudit audit(config_, clock_);
    auto actor = std::make_shared<FakeActor>(9);
    ASSERT_TRUE(audit.record(entryFor(9), actor));
    EXPECT_EQ(audit.actorHistory(ActorId(9)).size(), 1u);

    actor.reset();
    EXPECT_TRUE(audit.actorHistory(ActorId(9)).empty());
    // The global buffer keeps the entry.
    EXPECT_EQ(audit.bufferCount(), 1u);
}

TEST_F(CombatAuditTest, ForgetActor) {
    CombatAudit audit(config_, clock_);
    ASSERT_TRUE(audit.record(entryFor(1)));
    audit.forgetActor(ActorId(1));
    EXPECT_TRUE(audit.actorHistory(ActorId(1)).empty());
}

// ---------------------------------------------------------------------------
// Flushing
// ---------------------------------------------------------------------------

TEST_F(CombatAuditTest, FlushWritesDatedFile) {
    CombatAudit audit(config_, clock_);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(audit.record(entryFor(1)));
    }

    auto written = audit.flush();
    ASSERT_TRUE(written.hasValue());
    EXPECT_EQ(written.value(), 3u);
    EXPECT_EQ(audit.bufferCount(), 0u);

    auto lines = readLines(todayFile());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].rfind("{\"timestamp\":1773480413589,\"serial\":\"0x00000001\"", 0), 0u);

    auto stats = audit.stats();
    EXPECT_EQ(stats.totalFlushed, 3u);
    ASSERT_TRUE(stats.lastFlush.has_value());
    EXPECT_EQ(*stats.lastFlush, kWallOrigin);

    auto again = audit.flush();
    ASSERT_TRUE(again.hasValue());
    EXPECT_EQ(again.value(), 0u);
}

TEST_F(CombatAuditTest, FlushAppendsToExistingFile) {
    CombatAudit audit(config_, clock_);
    ASSERT_TRUE(audit.record(entryFor(1)));
    ASSERT_TRUE(audit.flush().hasValue());
    ASSERT_TRUE(audit.record(entryFor(2)));
    ASSERT_TRUE(audit.flush().hasValue());
    EXPECT_EQ(readLines(todayFile()).size(), 2u);
}

TEST_F(CombatAuditTest, FailedFlushKeepsBuffer) {
    fs::create_directories(dir_);
    {
        std::ofstream blocker(dir_ / "blocker");
        blocker << "not a directory";
    }
    config_.outputDirectory = dir_ / "blocker" / "audit";
    CombatAudit audit(config_, clock_);
    ASSERT_TRUE(audit.record(entryFor(1)));
    ASSERT_TRUE(audit.record(entryFor(1)));

    auto result = audit.flush();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::AuditFlushFailed);
    EXPECT_EQ(audit.bufferCount(), 2u);
    EXPECT_EQ(audit.stats().failedFlushes, 1u);
    EXPECT_EQ(audit.stats().totalFlushed, 0u);
}

TEST_F(CombatAuditTest, SizeRotation) {
    config_.maxFileSizeMB = 1;
    fs::create_directories(dir_);
    {
        std::ofstream full(todayFile(), std::ios::binary);
        full << std::string(1024 * 1024 + 1, 'x');
    }

    CombatAudit audit(config_, clock_);
    ASSERT_TRUE(audit.record(entryFor(1)));
    ASSERT_TRUE(audit.flush().hasValue());

    EXPECT_EQ(fs::file_size(todayFile()), 1024u * 1024u + 1u);
    EXPECT_EQ(readLines(dir_ / "combat-audit-2026-03-14.1.jsonl").size(), 1u);
}

TEST_F(CombatAuditTest, RetentionRemovesExpiredFiles) {
    fs::create_directories(dir_);
    for (const char* name : {"combat-audit-2026-03-01.jsonl", "combat-audit-2026-03-01.1.jsonl",
                             "combat-audit-2026-03-10.jsonl", "notes.txt"}) {
        std::ofstream(dir_ / name) << "{}\n";
    }

    CombatAudit audit(config_, clock_);
    ASSERT_TRUE(audit.record(entryFor(1)));
    ASSERT_TRUE(audit.flush().hasValue());

    EXPECT_FALSE(fs::exists(dir_ / "combat-audit-2026-03-01.jsonl"));
    EXPECT_FALSE(fs::exists(dir_ / "combat-audit-2026-03-01.1.jsonl"));
    EXPECT_TRUE(fs::exists(dir_ / "combat-audit-2026-03-10.jsonl"));
    EXPECT_TRUE(fs::exists(dir_ / "notes.txt"));
    EXPECT_TRUE(fs::exists(todayFile()));
}

TEST_F(CombatAuditTest, ZeroRetentionKeepsEverything) {
    config_.retentionDays = 0;
    fs::create_directories(dir_);
    std::ofstream(dir_ / "combat-audit-2020-01-01.jsonl") << "{}\n";

    CombatAudit audit(config_, clock_);
    ASSERT_TRUE(audit.record(entryFor(1)));
    ASSERT_TRUE(audit.flush().hasValue());
    EXPECT_TRUE(fs::exists(dir_ / "combat-audit-2020-01-01.jsonl"));
}

TEST(CombatAuditFileNameTest, Names) {
    EXPECT_EQ(CombatAudit::fileNameFor("2026-03-14"), "combat-audit-2026-03-14.jsonl");
    EXPECT_EQ(CombatAudit::fileNameFor("2026-03-14", 2), "combat-audit-2026-03-14.2.jsonl");
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

TEST_F(CombatAuditTest, StartRejectedWhenDisabled) {
    config_.enabled = false;
    FakeTimerService timers;
    JobScheduler jobs(1);
    CombatAudit audit(config_, clock_);

    auto result = audit.start(timers, jobs);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::AuditDisabled);
    EXPECT_FALSE(audit.isRunning());
    EXPECT_EQ(timers.active(), 0u);
}

TEST_F(CombatAuditTest, PeriodicFlushAndFinalFlushOnStop) {
    FakeTimerService timers;
    JobScheduler jobs(1);
    CombatAudit audit(config_, clock_);

    ASSERT_TRUE(audit.start(timers, jobs).hasValue());
    EXPECT_TRUE(audit.isRunning());
    EXPECT_TRUE(fs::is_directory(dir_));
    EXPECT_EQ(timers.lastInterval, 5000ms);
    EXPECT_EQ(timers.active(), 1u);

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(audit.record(entryFor(1)));
    }
    timers.fireAll();
    ASSERT_TRUE(audit.record(entryFor(2)));

    audit.stop();
    EXPECT_FALSE(audit.isRunning());
    EXPECT_EQ(timers.active(), 0u);
    EXPECT_EQ(audit.bufferCount(), 0u);
    EXPECT_EQ(audit.stats().totalFlushed, 4u);
    EXPECT_EQ(readLines(todayFile()).size(), 4u);
}

TEST_F(CombatAuditTest, FlushTimerFiringDuringStartSchedulesFlush) {
    FakeTimerService timers;
    timers.fireOnSchedule = true;
    JobScheduler jobs(1);
    CombatAudit audit(config_, clock_);
    ASSERT_TRUE(audit.record(entryFor(1)));
    ASSERT_TRUE(audit.record(entryFor(2)));

    ASSERT_TRUE(audit.start(timers, jobs).hasValue());

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (audit.bufferCount() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(audit.bufferCount(), 0u);
    EXPECT_EQ(audit.stats().totalFlushed, 2u);
    EXPECT_EQ(readLines(todayFile()).size(), 2u);

    audit.stop();
}

TEST_F(CombatAuditTest, RequestFlushWithoutSchedulerIsRefused) {
    CombatAudit audit(config_, clock_);
    ASSERT_TRUE(audit.record(entryFor(1)));
    EXPECT_FALSE(audit.requestFlush());
    EXPECT_EQ(audit.bufferCount(), 1u);
}
