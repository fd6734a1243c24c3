/// @file shadow_verifier.cpp
/// @brief ShadowVerifier implementation.

#include "ctc/audit/shadow_verifier.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <map>
#include <system_error>

#include "ctc/audit/combat_audit.hpp"
#include "ctc/foundation/combat_logger.hpp"

namespace ctc::audit {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr std::string_view kCsvHeader =
    "Timestamp,ActorSerial,ActorName,WeaponId,WeaponName,Dexterity,"
    "Provider1,Provider1Delay,Provider2,Provider2Delay,Variance";

std::string fixed2(double value) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

}  // anonymous namespace
ShadowVerifier::ShadowVerifier(std::shared_ptr<const combat::ITimingProvider> reference,
                               combat::TimingProviderSlot& active,
                               const foundation::TimeSource& clock, ShadowSettings settings)
    : reference_(std::move(reference)), active_(active), clock_(clock), settings_(settings) {
    settings_.sampleEvery = std::max(settings_.sampleEvery, 1);
    settings_.maxComparisons = std::max<std::size_t>(settings_.maxComparisons, 1);
}

std::optional<TimingComparison> ShadowVerifier::compare(const combat::IActor& actor,
                                                        const combat::WeaponDescriptor* weapon) {
    auto active = active_.current();
    if (!active || !reference_) {
        return std::nullopt;
    }

    TimingComparison comparison;
    comparison.timestampMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 clock_.wallNow().time_since_epoch())
                                 .count();
    comparison.at = clock_.now();
    comparison.actorId = actor.id();
    comparison.actorName = actor.name();
    comparison.dexterity = actor.dexterity();
    if (weapon != nullptr) {
        comparison.weaponId = weapon->itemId;
        comparison.weaponName = weapon->name;
    } else {
        comparison.weaponName = "Fists";
    }
    comparison.provider1Name = std::string(active->name());
    comparison.provider2Name = std::string(reference_->name());

    try {
        comparison.provider1DelayMs = active->attackIntervalMs(actor, weapon);
        comparison.provider2DelayMs = reference_->attackIntervalMs(actor, weapon);
    } catch (const std::exception& e) {
        CTC_LOG_ERROR(LogCategory::Shadow,
                      std::string("Shadow comparison failed: ") + e.what());
        return std::nullopt;
    } catch (...) {
        CTC_LOG_ERROR(LogCategory::Shadow, "Shadow comparison failed");
        return std::nullopt;
    }
    comparison.varianceMs = std::abs(comparison.provider1DelayMs - comparison.provider2DelayMs);

    {
        std::lock_guard lock(mutex_);
        comparisons_.push_back(comparison);
        while (comparisons_.size() > settings_.maxComparisons) {
            comparisons_.pop_front();
        }
    }
    total_.fetch_add(1);

    if (comparison.varianceMs > settings_.discrepancyThresholdMs) {
        discrepancies_.fetch_add(1);
        CTC_LOG_DEBUG(LogCategory::Shadow,
                      "Timing discrepancy: " + comparison.weaponName + " (" +
                          std::to_string(comparison.dexterity) + " dex) " +
                          comparison.provider1Name + " " + fixed2(comparison.provider1DelayMs) +
                          "ms vs " + comparison.provider2Name + " " +
                          fixed2(comparison.provider2DelayMs) + "ms");
    }

    if (audit_ != nullptr && audit_->shouldRecord(AuditLevel::Debug)) {
        AuditLogEntry entry;
        entry.actorId = comparison.actorId;
        entry.actorName = comparison.actorName;
        entry.actionType = std::string(action_types::kShadowComparison);
        entry.timingProvider = comparison.provider1Name;
        entry.expectedDelayMs = comparison.provider1DelayMs;
        entry.actualDelayMs = comparison.provider2DelayMs;
        entry.varianceMs = comparison.varianceMs;
        entry.weaponId = static_cast<int>(comparison.weaponId);
        entry.weaponName = comparison.weaponName;
        entry.dexterity = comparison.dexterity;
        entry.auditLevel = AuditLevel::Debug;
        entry.addDetail("Provider1", comparison.provider1Name);
        entry.addDetail("Provider2", comparison.provider2Name);
        entry.addDetail("Provider1Delay", fixed2(comparison.provider1DelayMs));
        entry.addDetail("Provider2Delay", fixed2(comparison.provider2DelayMs));
        audit_->record(std::move(entry));
    }
    return comparison;
}

void ShadowVerifier::observe(const combat::ActionEvent& event) {
    if (event.kind != combat::ActionEventKind::Begin ||
        event.category != combat::ActionCategory::Swing) {
        return;
    }
    auto actor = event.actor.lock();
    if (!actor) {
        return;
    }
    auto n = observed_.fetch_add(1) + 1;
    if (n % static_cast<uint64_t>(settings_.sampleEvery) != 0) {
        return;
    }
    (void)compare(*actor, event.weapon ? &*event.weapon : nullptr);
}

std::vector<TimingComparison> ShadowVerifier::comparisons(
    std::optional<std::chrono::milliseconds> window) const {
    std::lock_guard lock(mutex_);
    if (!window) {
        return {comparisons_.begin(), comparisons_.end()};
    }
    const auto cutoff = clock_.now() - *window;
    std::vector<TimingComparison> result;
    for (const auto& c : comparisons_) {
        if (c.at >= cutoff) {
            result.push_back(c);
        }
    }
    return result;
}

ShadowReport ShadowVerifier::report(std::optional<std::chrono::milliseconds> window) const {
    auto all = comparisons(window);

    ShadowReport result;
    if (all.empty()) {
        result.message = "No shadow comparisons available";
        return result;
    }

    result.totalComparisons = all.size();
    result.minVarianceMs = all.front().varianceMs;
    result.maxVarianceMs = all.front().varianceMs;
    double sum = 0.0;

    struct Accumulator {
        std::size_t count = 0;
        double sum = 0.0;
        double max = 0.0;
    };
    std::map<std::string, Accumulator> perWeapon;

    for (const auto& c : all) {
        result.minVarianceMs = std::min(result.minVarianceMs, c.varianceMs);
        result.maxVarianceMs = std::max(result.maxVarianceMs, c.varianceMs);
        sum += c.varianceMs;
        if (c.varianceMs > settings_.discrepancyThresholdMs) {
            ++result.discrepancyCount;
        }
        auto& acc = perWeapon[c.weaponName];
        ++acc.count;
        acc.sum += c.varianceMs;
        acc.max = std::max(acc.max, c.varianceMs);
    }
    result.avgVarianceMs = sum / static_cast<double>(all.size());
    result.discrepancyPercentage =
        static_cast<double>(result.discrepancyCount) / static_cast<double>(all.size()) * 100.0;

    for (const auto& [name, acc] : perWeapon) {
        result.weaponBreakdown.push_back(WeaponComparisonStats{
            name, acc.count, acc.sum / static_cast<double>(acc.count), acc.max});
    }
    std::stable_sort(result.weaponBreakdown.begin(), result.weaponBreakdown.end(),
                     [](const auto& a, const auto& b) { return a.avgVarianceMs > b.avgVarianceMs; });
    return result;
}

GameResult<void> ShadowVerifier::exportCsv(const std::filesystem::path& file) const {
    auto all = comparisons();

    std::ofstream out(file, std::ios::out | std::ios::trunc);
    if (!out) {
        CTC_LOG_ERROR(LogCategory::Shadow, "Cannot open " + file.string() + " for CSV export");
        return GameResult<void>::err(
            GameError(ErrorCode::AuditExportFailed, "cannot open " + file.string()));
    }
    out << kCsvHeader << '\n';
    for (const auto& c : all) {
        out << c.timestampMs << ',' << formatSerial(c.actorId) << ',' << csvField(c.actorName)
            << ',' << c.weaponId << ',' << csvField(c.weaponName) << ',' << c.dexterity << ','
            << csvField(c.provider1Name) << ',' << fixed2(c.provider1DelayMs) << ','
            << csvField(c.provider2Name) << ',' << fixed2(c.provider2DelayMs) << ','
            << fixed2(c.varianceMs) << '\n';
    }
    out.flush();
    if (!out) {
        return GameResult<void>::err(
            GameError(ErrorCode::AuditExportFailed, "write error on " + file.string()));
    }
    CTC_LOG_INFO(LogCategory::Shadow, "Shadow comparisons exported to " + file.string());
    return GameResult<void>::ok();
}

GameResult<std::filesystem::path> ShadowVerifier::exportCsvTo(
    const std::filesystem::path& directory) const {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return GameResult<std::filesystem::path>::err(GameError(
            ErrorCode::AuditExportFailed, "cannot create " + directory.string() + ": " +
                                              ec.message()));
    }
    auto file = directory / ("shadow-comparison-" +
                             foundation::formatCompactDateTime(clock_.wallNow()) + ".csv");
    auto written = exportCsv(file);
    if (!written) {
        return GameResult<std::filesystem::path>::err(written.error());
    }
    return GameResult<std::filesystem::path>::ok(std::move(file));
}

void ShadowVerifier::clear() {
    {
        std::lock_guard lock(mutex_);
        comparisons_.clear();
    }
    total_.store(0);
    discrepancies_.store(0);
    CTC_LOG_INFO(LogCategory::Shadow, "Shadow comparisons cleared");
}

std::size_t ShadowVerifier::size() const {
    std::lock_guard lock(mutex_);
    return comparisons_.size();
}

}  // namespace ctc::audit