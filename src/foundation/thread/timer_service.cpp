/// @file timer_service.cpp
/// @brief ThreadTimerService implementation.

#include "ctc/foundation/timer_service.hpp"

#include "ctc/foundation/combat_logger.hpp"

#include <string>
#include <utility>
#include <vector>

namespace ctc::foundation {

ThreadTimerService::~ThreadTimerService() {
    stop();
}

bool ThreadTimerService::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }
    thread_ = std::thread([this] { run(); });
    return true;
}

void ThreadTimerService::stop() {
    {
        std::lock_guard lock(mutex_);
        running_.store(false);
    }
    wakeup_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool ThreadTimerService::isReady() const {
    return running_.load();
}

GameResult<TimerHandle> ThreadTimerService::schedulePeriodic(std::chrono::milliseconds interval,
                                                             TimerCallback callback) {
    if (interval.count() <= 0 || !callback) {
        return GameResult<TimerHandle>::err(
            GameError(ErrorCode::InvalidArgument, "timer needs a positive interval and a callback"));
    }
    if (!running_.load()) {
        return GameResult<TimerHandle>::err(
            GameError(ErrorCode::TimerServiceNotReady, "timer thread is not running"));
    }

    TimerHandle handle = 0;
    {
        std::lock_guard lock(mutex_);
        handle = nextHandle_++;
        entries_.emplace(handle, Entry{interval,
                                       std::chrono::steady_clock::now() + interval,
                                       std::make_shared<TimerCallback>(std::move(callback))});
    }
    wakeup_.notify_all();
    return GameResult<TimerHandle>::ok(handle);
}

GameResult<void> ThreadTimerService::cancel(TimerHandle handle) {
    {
        std::lock_guard lock(mutex_);
        if (entries_.erase(handle) == 0) {
            return GameResult<void>::err(
                GameError(ErrorCode::TimerNotFound, "timer " + std::to_string(handle) + " not found"));
        }
    }
    if (std::this_thread::get_id() != thread_.get_id()) {
        // Wait for a dispatch batch that may still hold the callback.
        std::lock_guard dispatch(dispatchMutex_);
    }
    return GameResult<void>::ok();
}

std::size_t ThreadTimerService::timerCount() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

uint64_t ThreadTimerService::firedCount() const noexcept {
    return fired_.load();
}

void ThreadTimerService::run() {
    using Clock = std::chrono::steady_clock;

    while (running_.load()) {
        std::unique_lock dispatch(dispatchMutex_);
        std::vector<std::shared_ptr<TimerCallback>> due;
        {
            std::unique_lock lock(mutex_);
            auto now = Clock::now();
            auto wakeAt = now + std::chrono::milliseconds(100);
            for (auto& [handle, entry] : entries_) {
                if (entry.nextDue <= now) {
                    due.push_back(entry.callback);
                    entry.nextDue += entry.interval;
                    if (entry.nextDue <= now) {
                        // Overrun: re-anchor instead of firing a burst.
                        entry.nextDue = now + entry.interval;
                    }
                }
                if (entry.nextDue < wakeAt) {
                    wakeAt = entry.nextDue;
                }
            }

            if (due.empty()) {
                dispatch.unlock();
                wakeup_.wait_until(lock, wakeAt);
                continue;
            }
        }

        for (const auto& callback : due) {
            try {
                (*callback)();
            } catch (const std::exception& e) {
                CTC_LOG_ERROR(LogCategory::Core,
                              std::string("timer callback threw: ") + e.what());
            } catch (...) {
                CTC_LOG_ERROR(LogCategory::Core, "timer callback threw a non-standard exception");
            }
            fired_.fetch_add(1);
        }
    }
}

} // namespace ctc::foundation