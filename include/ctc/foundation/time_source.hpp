#pragma once

/// @file time_source.hpp
/// @brief Injectable clocks for scheduling decisions and audit timestamps.
///
/// Scheduling uses a monotonic TimePoint; audit records and file names use
/// wall-clock time. Both come from the same TimeSource so tests can drive
/// them together with ManualTimeSource.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace ctc::foundation {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using WallClock = std::chrono::system_clock;
using WallTimePoint = WallClock::time_point;

/// Source of "now" for every time-dependent component.
class TimeSource {
public:
    virtual ~TimeSource() = default;

    /// Monotonic time used for all eligibility and resolve-time arithmetic.
    [[nodiscard]] virtual TimePoint now() const = 0;

    /// Wall-clock time used for audit timestamps and dated file names.
    [[nodiscard]] virtual WallTimePoint wallNow() const = 0;
};

/// Real clocks.
class SteadyTimeSource final : public TimeSource {
public:
    [[nodiscard]] TimePoint now() const override { return SteadyClock::now(); }
    [[nodiscard]] WallTimePoint wallNow() const override { return WallClock::now(); }
};

/// Manually advanced clock for deterministic tests and replay harnesses.
///
/// Both clocks start at their construction-time origins and move together
/// on advance(). Safe to advance from one thread while others read.
class ManualTimeSource final : public TimeSource {
public:
    explicit ManualTimeSource(WallTimePoint wallOrigin = WallClock::now())
        : steadyOrigin_(SteadyClock::now()), wallOrigin_(wallOrigin) {}

    [[nodiscard]] TimePoint now() const override {
        return steadyOrigin_ + std::chrono::milliseconds(offsetMs_.load(std::memory_order_acquire));
    }

    [[nodiscard]] WallTimePoint wallNow() const override {
        return wallOrigin_ + std::chrono::milliseconds(offsetMs_.load(std::memory_order_acquire));
    }

    void advance(std::chrono::milliseconds delta) {
        offsetMs_.fetch_add(delta.count(), std::memory_order_acq_rel);
    }

    /// Milliseconds elapsed since construction.
    [[nodiscard]] int64_t elapsedMs() const noexcept {
        return offsetMs_.load(std::memory_order_acquire);
    }

private:
    TimePoint steadyOrigin_;
    WallTimePoint wallOrigin_;
    std::atomic<int64_t> offsetMs_{0};
};

/// Format as "YYYY-MM-DD" (UTC).
std::string formatDate(WallTimePoint tp);

/// Format as "YYYY-MM-DD-HHMMSS" (UTC).
std::string formatCompactDateTime(WallTimePoint tp);

/// Format as ISO 8601 with millisecond precision, e.g. "2026-03-14T09:26:53.589Z".
std::string formatIsoTimestamp(WallTimePoint tp);

/// Milliseconds between two monotonic points (negative when @p to precedes @p from).
inline int64_t millisBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

} // namespace ctc::foundation