#pragma once

/// @file shadow_verifier.hpp
/// @brief Side-by-side comparison of the active and a reference timing provider.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ctc/combat/combat_events.hpp"
#include "ctc/combat/timing_provider.hpp"
#include "ctc/foundation/game_result.hpp"
#include "ctc/foundation/time_source.hpp"

namespace ctc::audit {

class CombatAudit;

struct ShadowSettings {
    /// Compare every Nth observed swing.
    int sampleEvery = 1;
    double discrepancyThresholdMs = 10.0;
    std::size_t maxComparisons = 10000;
};

/// Both providers' interval for the same swing.
struct TimingComparison {
    int64_t timestampMs = 0;
    foundation::TimePoint at{};
    foundation::ActorId actorId;
    std::string actorName;
    uint32_t weaponId = 0;
    std::string weaponName;
    int dexterity = 0;
    std::string provider1Name;
    double provider1DelayMs = 0.0;
    std::string provider2Name;
    double provider2DelayMs = 0.0;
    /// |provider1 - provider2|
    double varianceMs = 0.0;
};

struct WeaponComparisonStats {
    std::string weaponName;
    std::size_t count = 0;
    double avgVarianceMs = 0.0;
    double maxVarianceMs = 0.0;
};

struct ShadowReport {
    std::size_t totalComparisons = 0;
    double minVarianceMs = 0.0;
    double maxVarianceMs = 0.0;
    double avgVarianceMs = 0.0;
    std::size_t discrepancyCount = 0;
    double discrepancyPercentage = 0.0;
    /// Sorted by average variance, highest first.
    std::vector<WeaponComparisonStats> weaponBreakdown;
    /// Set when there is nothing to report.
    std::string message;
};

/// Computes each sampled swing with the active provider and a reference
/// provider and keeps the pair. Observes only; never changes timing.
class ShadowVerifier {
public:
    ShadowVerifier(std::shared_ptr<const combat::ITimingProvider> reference,
                   combat::TimingProviderSlot& active, const foundation::TimeSource& clock,
                   ShadowSettings settings = {});

    ShadowVerifier(const ShadowVerifier&) = delete;
    ShadowVerifier& operator=(const ShadowVerifier&) = delete;

    /// Mirror comparisons into the audit buffer when it runs at Debug level.
    void setAudit(CombatAudit* audit) noexcept { audit_ = audit; }

    /// Compare one swing now. Provider exceptions are logged.
    std::optional<TimingComparison> compare(const combat::IActor& actor,
                                            const combat::WeaponDescriptor* weapon);

    /// Swing-begin hook; applies sampling.
    void observe(const combat::ActionEvent& event);

    [[nodiscard]] std::vector<TimingComparison> comparisons(
        std::optional<std::chrono::milliseconds> window = std::nullopt) const;

    [[nodiscard]] ShadowReport report(
        std::optional<std::chrono::milliseconds> window = std::nullopt) const;

    /// Write every comparison to @p file.
    foundation::GameResult<void> exportCsv(const std::filesystem::path& file) const;

    /// Write to `<dir>/shadow-comparison-YYYY-MM-DD-HHMMSS.csv`.
    /// @return The file written.
    foundation::GameResult<std::filesystem::path> exportCsvTo(
        const std::filesystem::path& directory) const;

    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] uint64_t totalComparisons() const noexcept { return total_.load(); }
    [[nodiscard]] uint64_t discrepancyCount() const noexcept { return discrepancies_.load(); }
    [[nodiscard]] const ShadowSettings& settings() const noexcept { return settings_; }

private:
    std::shared_ptr<const combat::ITimingProvider> reference_;
    combat::TimingProviderSlot& active_;
    const foundation::TimeSource& clock_;
    ShadowSettings settings_;
    CombatAudit* audit_ = nullptr;

    mutable std::mutex mutex_;
    std::deque<TimingComparison> comparisons_;

    std::atomic<uint64_t> observed_{0};
    std::atomic<uint64_t> total_{0};
    std::atomic<uint64_t> discrepancies_{0};
};

} // namespace ctc::audit