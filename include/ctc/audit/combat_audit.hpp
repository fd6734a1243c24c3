#pragma once

/// @file combat_audit.hpp
/// @brief Bounded audit trail of combat actions with dated NDJSON flushes.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ctc/audit/audit_config.hpp"
#include "ctc/audit/audit_log_entry.hpp"
#include "ctc/combat/combat_events.hpp"
#include "ctc/foundation/game_result.hpp"
#include "ctc/foundation/job_scheduler.hpp"
#include "ctc/foundation/time_source.hpp"
#include "ctc/foundation/timer_service.hpp"

namespace ctc::audit {

struct AuditStats {
    uint64_t totalRecorded = 0;
    uint64_t totalFlushed = 0;
    /// Oldest entries pushed out of the full buffer.
    uint64_t droppedByOverflow = 0;
    /// Entries refused by the per-tick cap.
    uint64_t droppedByTickCap = 0;
    uint64_t failedFlushes = 0;
    std::size_t bufferCount = 0;
    std::optional<foundation::WallTimePoint> lastFlush;
    bool throttled = false;
    AuditLevel effectiveLevel = AuditLevel::None;
};

/// Records every observed action into a bounded global buffer and an
/// optional bounded per-actor history, and appends the buffer to
/// `combat-audit-YYYY-MM-DD.jsonl` from a background job.
///
/// Entries leave the buffer only once they were written. A failed flush
/// keeps them for the next attempt.
///
/// @code
///   CombatAudit audit(config, clock);
///   events.actionBegan.connect([&](const ActionEvent& e) { audit.observe(e); });
///   (void)audit.start(timers, jobs);
/// @endcode
class CombatAudit {
public:
    CombatAudit(AuditConfig config, const foundation::TimeSource& clock);
    ~CombatAudit();

    CombatAudit(const CombatAudit&) = delete;
    CombatAudit& operator=(const CombatAudit&) = delete;

    /// Create the output directory and install the periodic flush timer.
    foundation::GameResult<void> start(foundation::ITimerService& timers,
                                       foundation::JobScheduler& jobs);

    /// Cancel the flush timer, wait for a running flush and flush the rest.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    /// Turn an action event into an entry, if the effective level covers it.
    void observe(const combat::ActionEvent& event);

    /// Append an entry. Subject to the per-tick cap and buffer bound.
    /// @return false if the entry was refused.
    bool record(AuditLogEntry entry, const std::shared_ptr<combat::IActor>& actor = nullptr);

    /// Tick duration feed: resets the per-tick cap and drives auto-throttle.
    void onTickCompleted(double tickMs);

    /// Write the buffer to today's file now.
    /// @return Number of entries written.
    foundation::GameResult<std::size_t> flush();

    /// Flush on the job scheduler. No-op while a flush job is in flight.
    bool requestFlush();

    [[nodiscard]] std::vector<AuditLogEntry> snapshot() const;

    /// Entries of one actor, optionally limited to the last @p window.
    [[nodiscard]] std::vector<AuditLogEntry> actorHistory(
        foundation::ActorId id,
        std::optional<std::chrono::milliseconds> window = std::nullopt) const;

    /// Drop the history and begin timestamps of a removed actor.
    void forgetActor(foundation::ActorId id);

    /// Drop buffered entries and histories without writing them.
    void clear();

    [[nodiscard]] AuditStats stats() const;
    [[nodiscard]] std::size_t bufferCount() const;

    /// Configured level, lowered to Standard while throttled.
    [[nodiscard]] AuditLevel effectiveLevel() const;
    [[nodiscard]] bool shouldRecord(AuditLevel required) const;
    [[nodiscard]] bool isThrottled() const noexcept { return throttled_.load(); }

    [[nodiscard]] const AuditConfig& config() const noexcept { return config_; }

    /// `combat-audit-<date>.jsonl`, or `combat-audit-<date>.<index>.jsonl`.
    static std::string fileNameFor(std::string_view date, int index = 0);

private:
    struct ActorHistory {
        std::weak_ptr<combat::IActor> actor;
        bool tied = false;
        std::deque<AuditLogEntry> entries;
    };

    struct BeginMark {
        foundation::TimePoint at{};
        int expectedDelayMs = 0;
    };

    struct ActorMarks {
        std::weak_ptr<combat::IActor> actor;
        bool tied = false;
        std::array<std::optional<BeginMark>, combat::kActionCategoryCount> begins{};
    };

    [[nodiscard]] std::filesystem::path targetFile(const std::string& date) const;
    void applyRetention(foundation::WallTimePoint now);
    void pruneExpiredLocked();

    AuditConfig config_;
    const foundation::TimeSource& clock_;

    mutable std::mutex mutex_;
    std::deque<AuditLogEntry> buffer_;
    std::unordered_map<foundation::ActorId, ActorHistory> histories_;
    std::unordered_map<foundation::ActorId, ActorMarks> marks_;
    uint64_t nextSequence_ = 0;
    int entriesThisTick_ = 0;
    AuditStats stats_;

    // Serializes file writes; never taken with mutex_ held.
    std::mutex flushMutex_;

    std::atomic<bool> throttled_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> flushInFlight_{false};

    foundation::ITimerService* timers_ = nullptr;
    foundation::JobScheduler* jobs_ = nullptr;
    std::optional<foundation::TimerHandle> flushTimer_;
    std::optional<foundation::JobScheduler::JobId> flushJob_;
    std::mutex jobMutex_;
};

} // namespace ctc::audit