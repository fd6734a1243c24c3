/// @file combat_audit.cpp
/// @brief CombatAudit implementation.

#include "ctc/audit/combat_audit.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <system_error>

#include "ctc/foundation/combat_logger.hpp"

namespace ctc::audit {

using combat::ActionCategory;
using combat::ActionEventKind;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kFilePrefix = "combat-audit-";
constexpr std::string_view kFileExtension = ".jsonl";

std::string_view actionTypeFor(ActionCategory category, ActionEventKind kind) {
    switch (category) {
        case ActionCategory::Swing:
            switch (kind) {
                case ActionEventKind::Begin:     return action_types::kSwingStart;
                case ActionEventKind::Complete:  return action_types::kSwingComplete;
                case ActionEventKind::Resolved:  return action_types::kHitResolution;
                case ActionEventKind::Cancelled: return action_types::kSwingCancelled;
            }
            break;
        case ActionCategory::Spell:
            switch (kind) {
                case ActionEventKind::Begin:     return action_types::kSpellCastStart;
                case ActionEventKind::Cancelled: return action_types::kSpellCastCancelled;
                default:                         return action_types::kSpellCastComplete;
            }
        case ActionCategory::Bandage:
            switch (kind) {
                case ActionEventKind::Begin:     return action_types::kBandageStart;
                case ActionEventKind::Cancelled: return action_types::kBandageCancelled;
                default:                         return action_types::kBandageComplete;
            }
        case ActionCategory::Wand:
            switch (kind) {
                case ActionEventKind::Begin:     return action_types::kWandStart;
                case ActionEventKind::Cancelled: return action_types::kWandCancelled;
                default:                         return action_types::kWandComplete;
            }
    }
    return "Unknown";
}

AuditLevel requiredLevelFor(ActionCategory category) {
    switch (category) {
        case ActionCategory::Swing:
        case ActionCategory::Spell:   return AuditLevel::Standard;
        case ActionCategory::Bandage:
        case ActionCategory::Wand:    return AuditLevel::Detailed;
    }
    return AuditLevel::Standard;
}

int64_t unixMillis(foundation::WallTimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

}  // anonymous namespace
CombatAudit::CombatAudit(AuditConfig config, const foundation::TimeSource& clock)
    : config_(std::move(config)), clock_(clock) {
    config_.validate();
}

CombatAudit::~CombatAudit() {
    stop();
}

std::string CombatAudit::fileNameFor(std::string_view date, int index) {
    std::string name(kFilePrefix);
    name += date;
    if (index > 0) {
        name += '.';
        name += std::to_string(index);
    }
    name += kFileExtension;
    return name;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
GameResult<void> CombatAudit::start(foundation::ITimerService& timers,
                                    foundation::JobScheduler& jobs) {
    if (!config_.enabled) {
        CTC_LOG_INFO(LogCategory::Audit, "Combat audit disabled by configuration");
        return GameResult<void>::err(
            GameError(ErrorCode::AuditDisabled, "combat audit is disabled"));
    }
    if (running_.load()) {
        return GameResult<void>::ok();
    }

    std::error_code ec;
    fs::create_directories(config_.outputDirectory, ec);
    if (ec) {
        CTC_LOG_ERROR(LogCategory::Audit, "Failed to create audit output directory " +
                                              config_.outputDirectory.string() + ": " +
                                              ec.message());
        return GameResult<void>::err(GameError(
            ErrorCode::AuditError,
            "cannot create audit directory " + config_.outputDirectory.string()));
    }

    // The callback may fire on the timer thread before schedulePeriodic returns.
    timers_ = &timers;
    jobs_ = &jobs;
    auto handle = timers.schedulePeriodic(std::chrono::milliseconds(config_.flushIntervalMs),
                                          [this] {
                                              if (bufferCount() > 0) {
                                                  requestFlush();
                                              }
                                          });
    if (!handle) {
        timers_ = nullptr;
        jobs_ = nullptr;
        return GameResult<void>::err(handle.error());
    }
    flushTimer_ = handle.value();
    running_.store(true);

    CTC_LOG_INFO(LogCategory::Audit,
                 "Combat audit started (level " + std::string(auditLevelName(config_.level)) +
                     ", buffer " + std::to_string(config_.bufferSize) + ", flush " +
                     std::to_string(config_.flushIntervalMs) + "ms)");
    return GameResult<void>::ok();
}

void CombatAudit::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (timers_ != nullptr && flushTimer_) {
        auto cancelled = timers_->cancel(*flushTimer_);
        if (!cancelled) {
            CTC_LOG_WARN(LogCategory::Audit, "Flush timer cancel failed: " +
                                                 std::string(cancelled.error().message()));
        }
    }
    flushTimer_.reset();

    std::optional<foundation::JobScheduler::JobId> pending;
    {
        std::lock_guard lock(jobMutex_);
        pending = std::exchange(flushJob_, std::nullopt);
    }
    if (pending && jobs_ != nullptr) {
        auto waited = jobs_->wait(*pending);
        if (!waited && waited.error().code() != ErrorCode::JobNotFound) {
            CTC_LOG_WARN(LogCategory::Audit, "Background flush ended with error: " +
                                                 std::string(waited.error().message()));
        }
    }

    auto flushed = flush();
    if (!flushed) {
        CTC_LOG_ERROR(LogCategory::Audit, "Final audit flush failed; " +
                                              std::to_string(bufferCount()) +
                                              " entries not written");
    }

    auto s = stats();
    CTC_LOG_INFO(LogCategory::Audit,
                 "Combat audit stopped (recorded " + std::to_string(s.totalRecorded) +
                     ", flushed " + std::to_string(s.totalFlushed) + ")");
}

// ---------------------------------------------------------------------------
// Recording
// ---------------------------------------------------------------------------
void CombatAudit::observe(const combat::ActionEvent& event) {
    if (!shouldRecord(requiredLevelFor(event.category))) {
        return;
    }

    AuditLogEntry entry;
    entry.actorId = event.actorId;
    entry.actorName = event.actorName.empty() ? std::string("Unknown") : event.actorName;
    entry.actionType = std::string(actionTypeFor(event.category, event.kind));
    entry.timingProvider = event.providerName;
    entry.expectedDelayMs = event.expectedDelayMs;
    entry.dexterity = event.dexterity;
    entry.auditLevel = effectiveLevel();

    if (event.weapon) {
        entry.weaponId = static_cast<int>(event.weapon->itemId);
        entry.weaponName = event.weapon->name;
    } else if (event.category == ActionCategory::Wand) {
        entry.weaponName = event.label;
    }
    if (event.targetId) {
        entry.addDetail(event.category == ActionCategory::Bandage ? "Patient" : "Defender",
                        formatSerial(*event.targetId));
    }
    if (event.category == ActionCategory::Spell && !event.label.empty()) {
        entry.addDetail("SpellName", event.label);
    }
    if (event.hit) {
        entry.addDetail("Hit", *event.hit ? "true" : "false");
    }
    if (!event.reason.empty()) {
        entry.addDetail("Reason", event.reason);
    }
    if (event.usedFallback) {
        entry.addDetail("Fallback", "true");
    }

    const auto catIndex = static_cast<std::size_t>(event.category);
    {
        std::lock_guard lock(mutex_);
        auto& marks = marks_[event.actorId];
        if (!event.actor.expired()) {
            marks.actor = event.actor;
            marks.tied = true;
        }
        if (event.kind == ActionEventKind::Begin) {
            if (const auto& previous = marks.begins[catIndex]) {
                entry.expectedDelayMs = previous->expectedDelayMs;
                entry.actualDelayMs =
                    static_cast<double>(foundation::millisBetween(previous->at, event.at));
                entry.varianceMs = entry.actualDelayMs - entry.expectedDelayMs;
                entry.addDetail("NextDelayMs", std::to_string(event.expectedDelayMs));
            }
            marks.begins[catIndex] = BeginMark{event.at, event.expectedDelayMs};
        } else if (event.startedAt) {
            entry.actualDelayMs =
                static_cast<double>(foundation::millisBetween(*event.startedAt, event.at));
            if (event.kind != ActionEventKind::Cancelled) {
                entry.varianceMs = entry.actualDelayMs - entry.expectedDelayMs;
            }
        }
    }

    record(std::move(entry), event.actor.lock());
}

bool CombatAudit::record(AuditLogEntry entry, const std::shared_ptr<combat::IActor>& actor) {
    if (!config_.enabled) {
        return false;
    }
    entry.timestampMs = unixMillis(clock_.wallNow());
    entry.recordedAt = clock_.now();

    const bool anomaly = entry.isAnomaly();
    std::string anomalyText;
    {
        std::lock_guard lock(mutex_);
        if (entriesThisTick_ >= config_.maxEntriesPerTick) {
            ++stats_.droppedByTickCap;
            return false;
        }
        ++entriesThisTick_;

        entry.sequence = ++nextSequence_;
        if (anomaly) {
            anomalyText = entry.toString();
        }

        if (config_.actorHistory && entry.actorId.isValid()) {
            auto& history = histories_[entry.actorId];
            if (actor) {
                history.actor = actor;
                history.tied = true;
            }
            history.entries.push_back(entry);
            while (history.entries.size() > config_.actorHistorySize) {
                history.entries.pop_front();
            }
        }

        buffer_.push_back(std::move(entry));
        ++stats_.totalRecorded;
        while (buffer_.size() > config_.bufferSize) {
            buffer_.pop_front();
            ++stats_.droppedByOverflow;
        }
    }

    if (anomaly && effectiveLevel() >= AuditLevel::Detailed) {
        CTC_LOG_WARN(LogCategory::Audit, "Timing anomaly detected: " + anomalyText);
    }
    return true;
}

void CombatAudit::onTickCompleted(double tickMs) {
    {
        std::lock_guard lock(mutex_);
        entriesThisTick_ = 0;
    }

    const double threshold = config_.autoThrottleThresholdMs;
    if (threshold <= 0.0) {
        return;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", tickMs);
    if (tickMs > threshold) {
        bool expected = false;
        if (throttled_.compare_exchange_strong(expected, true)) {
            CTC_LOG_WARN(LogCategory::Audit, "Audit throttle enabled (tick " + std::string(buf) +
                                                 "ms > " + std::to_string(threshold) + "ms)");
        }
    } else if (tickMs < threshold * 0.8) {
        bool expected = true;
        if (throttled_.compare_exchange_strong(expected, false)) {
            CTC_LOG_INFO(LogCategory::Audit,
                         "Audit throttle disabled (tick " + std::string(buf) + "ms)");
        }
    }
}

// ---------------------------------------------------------------------------
// Flushing
// ---------------------------------------------------------------------------
fs::path CombatAudit::targetFile(const std::string& date) const {
    auto candidate = config_.outputDirectory / fileNameFor(date);
    if (config_.maxFileSizeMB <= 0) {
        return candidate;
    }
    const auto limit = static_cast<std::uintmax_t>(config_.maxFileSizeMB) * 1024u * 1024u;
    for (int index = 1;; ++index) {
        std::error_code ec;
        if (!fs::exists(candidate, ec)) {
            return candidate;
        }
        auto size = fs::file_size(candidate, ec);
        if (ec || size < limit) {
            return candidate;
        }
        candidate = config_.outputDirectory / fileNameFor(date, index);
    }
}

GameResult<std::size_t> CombatAudit::flush() {
    std::lock_guard flushLock(flushMutex_);

    std::vector<AuditLogEntry> batch;
    {
        std::lock_guard lock(mutex_);
        if (buffer_.empty()) {
            return GameResult<std::size_t>::ok(0);
        }
        batch.assign(buffer_.begin(), buffer_.end());
    }

    const auto wallNow = clock_.wallNow();
    auto fail = [this, &batch](std::string reason) {
        {
            std::lock_guard lock(mutex_);
            ++stats_.failedFlushes;
        }
        CTC_LOG_ERROR(LogCategory::Audit, "Failed to flush " + std::to_string(batch.size()) +
                                              " audit entries: " + reason);
        return GameResult<std::size_t>::err(
            GameError(ErrorCode::AuditFlushFailed, std::move(reason)));
    };

    std::error_code ec;
    fs::create_directories(config_.outputDirectory, ec);
    if (ec) {
        return fail("cannot create " + config_.outputDirectory.string() + ": " + ec.message());
    }

    const auto path = targetFile(foundation::formatDate(wallNow));
    {
        std::ofstream out(path, std::ios::out | std::ios::app);
        if (!out) {
            return fail("cannot open " + path.string());
        }
        for (const auto& entry : batch) {
            out << entry.toJson() << '\n';
        }
        out.flush();
        if (!out) {
            return fail("write error on " + path.string());
        }
    }

    const auto lastWritten = batch.back().sequence;
    {
        std::lock_guard lock(mutex_);
        while (!buffer_.empty() && buffer_.front().sequence <= lastWritten) {
            buffer_.pop_front();
        }
        stats_.totalFlushed += batch.size();
        stats_.lastFlush = wallNow;
        pruneExpiredLocked();
    }

    if (config_.retentionDays > 0) {
        applyRetention(wallNow);
    }

    if (effectiveLevel() >= AuditLevel::Debug) {
        CTC_LOG_DEBUG(LogCategory::Audit, "Flushed " + std::to_string(batch.size()) +
                                              " entries to " + path.string());
    }
    return GameResult<std::size_t>::ok(batch.size());
}

bool CombatAudit::requestFlush() {
    if (jobs_ == nullptr) {
        return false;
    }
    bool expected = false;
    if (!flushInFlight_.compare_exchange_strong(expected, true)) {
        return false;
    }

    std::lock_guard lock(jobMutex_);
    auto job = jobs_->schedule(
        [this] {
            auto result = flush();
            if (!result) {
                CTC_LOG_DEBUG(LogCategory::Audit, "Background flush kept the buffer");
            }
            flushInFlight_.store(false);
        },
        foundation::JobPriority::Low);
    if (!job) {
        flushInFlight_.store(false);
        CTC_LOG_ERROR(LogCategory::Audit,
                      "Cannot schedule audit flush: " + std::string(job.error().message()));
        return false;
    }
    flushJob_ = job.value();
    return true;
}

void CombatAudit::applyRetention(foundation::WallTimePoint now) {
    const auto cutoff =
        foundation::formatDate(now - std::chrono::hours(24) * config_.retentionDays);

    std::error_code ec;
    fs::directory_iterator it(config_.outputDirectory, ec);
    if (ec) {
        CTC_LOG_WARN(LogCategory::Audit, "Retention scan failed: " + ec.message());
        return;
    }
    const auto dateLength = cutoff.size();
    for (const auto& file : it) {
        const auto name = file.path().filename().string();
        if (name.rfind(kFilePrefix, 0) != 0 ||
            name.size() < kFilePrefix.size() + dateLength + kFileExtension.size() ||
            file.path().extension() != kFileExtension) {
            continue;
        }
        const auto date = name.substr(kFilePrefix.size(), dateLength);
        if (date < cutoff) {
            std::error_code removeError;
            if (fs::remove(file.path(), removeError)) {
                CTC_LOG_INFO(LogCategory::Audit, "Removed expired audit file " + name);
            } else if (removeError) {
                CTC_LOG_WARN(LogCategory::Audit,
                             "Cannot remove " + name + ": " + removeError.message());
            }
        }
    }
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
std::vector<AuditLogEntry> CombatAudit::snapshot() const {
    std::lock_guard lock(mutex_);
    return {buffer_.begin(), buffer_.end()};
}

std::vector<AuditLogEntry> CombatAudit::actorHistory(
    foundation::ActorId id, std::optional<std::chrono::milliseconds> window) const {
    std::lock_guard lock(mutex_);
    auto it = histories_.find(id);
    if (it == histories_.end() || (it->second.tied && it->second.actor.expired())) {
        return {};
    }
    const auto& entries = it->second.entries;
    if (!window) {
        return {entries.begin(), entries.end()};
    }
    const auto cutoff = clock_.now() - *window;
    std::vector<AuditLogEntry> result;
    for (const auto& entry : entries) {
        if (entry.recordedAt >= cutoff) {
            result.push_back(entry);
        }
    }
    return result;
}

void CombatAudit::forgetActor(foundation::ActorId id) {
    std::lock_guard lock(mutex_);
    histories_.erase(id);
    marks_.erase(id);
}

void CombatAudit::pruneExpiredLocked() {
    // Entries recorded without an actor reference stay until forgetActor().
    std::erase_if(histories_, [](const auto& item) {
        return item.second.tied && item.second.actor.expired();
    });
    std::erase_if(marks_, [](const auto& item) {
        return item.second.tied && item.second.actor.expired();
    });
}

void CombatAudit::clear() {
    std::lock_guard lock(mutex_);
    buffer_.clear();
    histories_.clear();
    marks_.clear();
    entriesThisTick_ = 0;
}

std::size_t CombatAudit::bufferCount() const {
    std::lock_guard lock(mutex_);
    return buffer_.size();
}

AuditStats CombatAudit::stats() const {
    AuditStats result;
    {
        std::lock_guard lock(mutex_);
        result = stats_;
        result.bufferCount = buffer_.size();
    }
    result.throttled = isThrottled();
    result.effectiveLevel = effectiveLevel();
    return result;
}

AuditLevel CombatAudit::effectiveLevel() const {
    if (!config_.enabled) {
        return AuditLevel::None;
    }
    if (isThrottled()) {
        return std::min(config_.level, AuditLevel::Standard);
    }
    return config_.level;
}

bool CombatAudit::shouldRecord(AuditLevel required) const {
    return config_.enabled && required != AuditLevel::None && effectiveLevel() >= required;
}

}  // namespace ctc::audit