/// @file tick_performance.cpp
/// @brief TickPerformance implementation.

#include "ctc/combat/tick_performance.hpp"

#include <algorithm>
#include <numeric>

namespace ctc::combat {

TickPerformance::TickPerformance(std::size_t window)
    : window_(window > 0 ? window : kDefaultWindow) {
    samples_.reserve(window_);
}

void TickPerformance::record(double durationMs) {
    std::lock_guard lock(mutex_);
    if (samples_.size() < window_) {
        samples_.push_back(durationMs);
    } else {
        samples_[next_] = durationMs;
    }
    next_ = (next_ + 1) % window_;
    ++tickCount_;
    lastMs_ = durationMs;
    peakMs_ = std::max(peakMs_, durationMs);
}

TickStats TickPerformance::snapshot() const {
    std::vector<double> sorted;
    TickStats stats;
    {
        std::lock_guard lock(mutex_);
        stats.tickCount = tickCount_;
        stats.sampleCount = samples_.size();
        stats.lastMs = lastMs_;
        stats.peakMs = peakMs_;
        sorted = samples_;
    }
    if (sorted.empty()) {
        return stats;
    }

    stats.averageMs = std::accumulate(sorted.begin(), sorted.end(), 0.0) /
                      static_cast<double>(sorted.size());
    std::sort(sorted.begin(), sorted.end());
    stats.maxMs = sorted.back();
    if (sorted.size() >= kMinSamplesForP99) {
        auto index = static_cast<std::size_t>(static_cast<double>(sorted.size()) * 0.99);
        stats.p99Ms = sorted[std::min(index, sorted.size() - 1)];
    }
    return stats;
}

void TickPerformance::reset() {
    std::lock_guard lock(mutex_);
    samples_.clear();
    next_ = 0;
    tickCount_ = 0;
    lastMs_ = 0.0;
    peakMs_ = 0.0;
}

} // namespace ctc::combat