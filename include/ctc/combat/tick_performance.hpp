#pragma once

/// @file tick_performance.hpp
/// @brief Rolling tick-duration statistics (average, max, p99).

#include <cstdint>
#include <mutex>
#include <vector>

namespace ctc::combat {

struct TickStats {
    uint64_t tickCount = 0;
    std::size_t sampleCount = 0;
    double lastMs = 0.0;
    double averageMs = 0.0;
    /// Max over the rolling window.
    double maxMs = 0.0;
    /// Max since construction or reset().
    double peakMs = 0.0;
    /// Zero until at least kMinSamplesForP99 samples exist.
    double p99Ms = 0.0;
};

/// Fixed-size ring of recent tick durations.
class TickPerformance {
public:
    static constexpr std::size_t kDefaultWindow = 1000;
    static constexpr std::size_t kMinSamplesForP99 = 10;

    explicit TickPerformance(std::size_t window = kDefaultWindow);

    void record(double durationMs);

    [[nodiscard]] TickStats snapshot() const;

    void reset();

private:
    mutable std::mutex mutex_;
    std::vector<double> samples_;
    std::size_t window_;
    std::size_t next_ = 0;
    uint64_t tickCount_ = 0;
    double lastMs_ = 0.0;
    double peakMs_ = 0.0;
};

} // namespace ctc::combat