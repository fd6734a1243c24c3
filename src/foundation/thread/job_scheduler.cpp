/// @file job_scheduler.cpp
/// @brief JobScheduler implementation on kcenon thread_system.

#include "ctc/foundation/job_scheduler.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctc::foundation {

static kcenon::thread::job_priority mapPriority(JobPriority p) {
    switch (p) {
        case JobPriority::High:   return kcenon::thread::job_priority::high;
        case JobPriority::Normal: return kcenon::thread::job_priority::normal;
        case JobPriority::Low:    return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

// Finished jobs nobody waited for are forgotten once this many are tracked.
static constexpr std::size_t kPruneThreshold = 256;

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct JobScheduler::Impl {
    struct Tracked {
        std::shared_future<void> future;
        std::shared_ptr<std::atomic<bool>> cancelled;
    };

    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextJobId{1};
    std::atomic<bool> stopped{false};
    std::unordered_map<JobId, Tracked> jobs;
    mutable std::mutex mutex;

    void pruneFinished() {
        std::erase_if(jobs, [](const auto& entry) {
            return entry.second.future.wait_for(std::chrono::seconds(0)) ==
                   std::future_status::ready;
        });
    }
};

JobScheduler::JobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("ctc_jobs");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads > 0 ? numThreads : 1);
    for (std::size_t i = 0; i < (numThreads > 0 ? numThreads : 1); ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

JobScheduler::~JobScheduler() {
    shutdown();
}

JobScheduler::JobScheduler(JobScheduler&&) noexcept = default;
JobScheduler& JobScheduler::operator=(JobScheduler&&) noexcept = default;

GameResult<JobScheduler::JobId> JobScheduler::schedule(JobFunc job, JobPriority priority) {
    if (impl_->stopped.load(std::memory_order_acquire)) {
        return GameResult<JobId>::err(
            GameError(ErrorCode::JobScheduleFailed, "job scheduler is shut down"));
    }

    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto threadJob = kcenon::thread::job_builder()
        .name("ctc_job_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(job), cancelled, promise]() -> kcenon::common::VoidResult {
            try {
                if (!cancelled->load(std::memory_order_acquire)) {
                    fn();
                }
                promise->set_value();
            } catch (...) {
                // Surfaced to wait() as ThreadError.
                promise->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->jobs.size() >= kPruneThreshold) {
            impl_->pruneFinished();
        }
        impl_->jobs[id] = Impl::Tracked{future, cancelled};
    }

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        std::lock_guard lock(impl_->mutex);
        impl_->jobs.erase(id);
        return GameResult<JobId>::err(
            GameError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }
    return GameResult<JobId>::ok(id);
}

GameResult<void> JobScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->jobs.find(id);
        if (it == impl_->jobs.end()) {
            return GameResult<void>::err(GameError(ErrorCode::JobNotFound, "job not found"));
        }
        future = it->second.future;
    }

    bool failed = false;
    try {
        future.get();
    } catch (...) {
        failed = true;
    }

    {
        std::lock_guard lock(impl_->mutex);
        impl_->jobs.erase(id);
    }

    if (failed) {
        return GameResult<void>::err(GameError(ErrorCode::ThreadError, "job execution failed"));
    }
    return GameResult<void>::ok();
}

GameResult<void> JobScheduler::cancel(JobId id) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->jobs.find(id);
    if (it == impl_->jobs.end()) {
        return GameResult<void>::err(GameError(ErrorCode::JobNotFound, "job not found"));
    }
    if (it->second.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        return GameResult<void>::err(GameError(ErrorCode::JobCancelled, "job already completed"));
    }
    it->second.cancelled->store(true, std::memory_order_release);
    return GameResult<void>::ok();
}

std::size_t JobScheduler::pendingCount() const {
    std::lock_guard lock(impl_->mutex);
    std::size_t pending = 0;
    for (const auto& [id, tracked] : impl_->jobs) {
        if (tracked.future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++pending;
        }
    }
    return pending;
}

void JobScheduler::shutdown() {
    if (!impl_) {
        return;
    }
    if (impl_->stopped.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (impl_->pool) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

} // namespace ctc::foundation