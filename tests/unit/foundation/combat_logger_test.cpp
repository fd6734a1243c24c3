#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "ctc/foundation/combat_logger.hpp"
#include "ctc/foundation/error_code.hpp"
#include "ctc/foundation/game_error.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace ctc::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

class CombatLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, CategoryNames) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Pulse), "Pulse");
    EXPECT_EQ(logCategoryName(LogCategory::Timing), "Timing");
    EXPECT_EQ(logCategoryName(LogCategory::Combat), "Combat");
    EXPECT_EQ(logCategoryName(LogCategory::Audit), "Audit");
    EXPECT_EQ(logCategoryName(LogCategory::Shadow), "Shadow");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(kLogCategoryCount, 7u);
}

TEST(LogLevelTest, LevelNames) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

TEST(LoggerErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    GameError err(ErrorCode::AuditFlushFailed, "disk full");
    EXPECT_EQ(err.subsystem(), "Audit");
}

// ---------------------------------------------------------------------------
// Levels
// ---------------------------------------------------------------------------

TEST(CombatLoggerBasicTest, DefaultCategoryLevels) {
    CombatLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Pulse), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Combat), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Shadow), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Audit), LogLevel::Info);
}

TEST(CombatLoggerBasicTest, SetAndResetLevels) {
    CombatLogger logger;
    logger.setCategoryLevel(LogCategory::Pulse, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Pulse));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Pulse));

    logger.resetLevels();
    EXPECT_TRUE(logger.isEnabled(LogLevel::Info, LogCategory::Pulse));
}

TEST(CombatLoggerBasicTest, OffIsNeverEnabled) {
    CombatLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Core));
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

TEST_F(CombatLoggerTest, MessageIsPrefixedWithCategory) {
    CombatLogger logger;
    logger.log(LogLevel::Info, LogCategory::Pulse, "tick installed");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Pulse] tick installed");
}

TEST_F(CombatLoggerTest, FilteredBelowCategoryLevel) {
    CombatLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Audit, "dropped");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(CombatLoggerTest, ContextIsAppended) {
    CombatLogger logger;
    LogContext ctx;
    ctx.actorId = ActorId(4021);
    ctx.targetId = ActorId(77);
    ctx.action = "swing";

    logger.logWithContext(LogLevel::Warning, LogCategory::Combat, "rejected", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_EQ(records[0].message, "[Combat] rejected {actor=4021, target=77, action=swing}");
}

TEST_F(CombatLoggerTest, InvalidIdsAreOmittedFromContext) {
    CombatLogger logger;
    LogContext ctx;
    ctx.actorId = ActorId();
    ctx.extra["interval_ms"] = "1450";

    logger.logWithContext(LogLevel::Info, LogCategory::Timing, "computed", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Timing] computed {interval_ms=1450}");
}

TEST_F(CombatLoggerTest, MacroRespectsSingletonLevels) {
    auto& logger = CombatLogger::instance();
    logger.setCategoryLevel(LogCategory::Config, LogLevel::Warning);

    CTC_LOG_INFO(LogCategory::Config, "ignored");
    CTC_LOG_WARN(LogCategory::Config, "kept");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Config] kept");

    logger.resetLevels();
}

TEST_F(CombatLoggerTest, FlushReachesBackend) {
    CombatLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}
