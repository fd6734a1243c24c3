#pragma once

/// @file timer_service.hpp
/// @brief Periodic timer abstraction and a dedicated-thread implementation.
///
/// The global tick and the audit flush timer are installed through
/// ITimerService so a host can drive them from its own event loop.
/// ThreadTimerService is the standalone fixed-rate driver.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "ctc/foundation/game_result.hpp"

namespace ctc::foundation {

using TimerHandle = uint64_t;
using TimerCallback = std::function<void()>;

/// Host timer subsystem.
class ITimerService {
public:
    virtual ~ITimerService() = default;

    /// True once periodic callbacks can be installed.
    [[nodiscard]] virtual bool isReady() const = 0;

    /// Install @p callback to run every @p interval.
    /// @return Handle for cancel(), or TimerServiceNotReady / InvalidArgument.
    virtual GameResult<TimerHandle> schedulePeriodic(std::chrono::milliseconds interval,
                                                     TimerCallback callback) = 0;

    /// Remove a periodic callback. Once this returns the callback is not
    /// running and will not run again (unless called from the callback itself).
    virtual GameResult<void> cancel(TimerHandle handle) = 0;
};

/// Fixed-rate timer driven by one dedicated thread.
///
/// Callbacks that overrun do not cause catch-up bursts: the next due time
/// is re-anchored to now. Exceptions thrown by callbacks are logged and the
/// timer keeps firing.
///
/// @code
///   ThreadTimerService timers;
///   (void)timers.start();
///   auto handle = timers.schedulePeriodic(50ms, [&] { pulse.tick(); });
///   // ...
///   timers.stop();
/// @endcode
class ThreadTimerService final : public ITimerService {
public:
    ThreadTimerService() = default;
    ~ThreadTimerService() override;

    ThreadTimerService(const ThreadTimerService&) = delete;
    ThreadTimerService& operator=(const ThreadTimerService&) = delete;

    /// @return false if already running.
    [[nodiscard]] bool start();

    /// Stop the thread. Installed callbacks are kept but no longer fire.
    void stop();

    [[nodiscard]] bool isReady() const override;

    GameResult<TimerHandle> schedulePeriodic(std::chrono::milliseconds interval,
                                             TimerCallback callback) override;

    GameResult<void> cancel(TimerHandle handle) override;

    [[nodiscard]] std::size_t timerCount() const;

    /// Total callback invocations since construction.
    [[nodiscard]] uint64_t firedCount() const noexcept;

private:
    struct Entry {
        std::chrono::milliseconds interval;
        std::chrono::steady_clock::time_point nextDue;
        std::shared_ptr<TimerCallback> callback;
    };

    void run();

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> fired_{0};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::map<TimerHandle, Entry> entries_;
    TimerHandle nextHandle_ = 1;

    // Held while callbacks run so cancel() can wait them out.
    std::mutex dispatchMutex_;
};

} // namespace ctc::foundation