#pragma once

/// @file job_scheduler.hpp
/// @brief JobScheduler wrapping kcenon thread_system for background work.

#include "ctc/foundation/game_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>

namespace ctc::foundation {

/// Priority of a background job.
///
/// Maps to kcenon::thread::job_priority internally.
enum class JobPriority { High, Normal, Low };

/// Background job runner for work that must stay off the tick thread,
/// such as audit flushes and CSV exports.
///
/// Uses PIMPL so thread_system headers stay out of the public API.
///
/// @code
///   JobScheduler jobs(1);
///   auto id = jobs.schedule([&] { (void)audit.flush(); }, JobPriority::Low);
///   (void)jobs.wait(id.value());
/// @endcode
class JobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    explicit JobScheduler(std::size_t numThreads = 1);
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;
    JobScheduler(JobScheduler&&) noexcept;
    JobScheduler& operator=(JobScheduler&&) noexcept;

    /// Enqueue a job.
    /// @return The JobId, or JobScheduleFailed when the pool refused it.
    GameResult<JobId> schedule(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Block until the job finishes. Forgets the job afterwards.
    /// @return Success, JobNotFound, or ThreadError when the job threw.
    GameResult<void> wait(JobId id);

    /// Skip a job that has not started yet.
    /// @return Success, JobNotFound, or JobCancelled if it already finished.
    GameResult<void> cancel(JobId id);

    /// Number of scheduled jobs not yet finished.
    [[nodiscard]] std::size_t pendingCount() const;

    /// Stop the pool after running jobs complete. Later schedule() calls fail.
    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace ctc::foundation