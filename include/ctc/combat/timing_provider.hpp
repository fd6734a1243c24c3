#pragma once

/// @file timing_provider.hpp
/// @brief Swappable interval-calculation strategy and its runtime slot.

#include <memory>
#include <mutex>
#include <string_view>

#include "ctc/combat/actor.hpp"
#include "ctc/combat/weapon.hpp"

namespace ctc::combat {

/// Scheduling granularity of the global tick.
inline constexpr int kTickMs = 50;

/// Bounds applied to every tick-rounded attack interval.
inline constexpr int kMinAttackIntervalMs = 200;
inline constexpr int kMaxAttackIntervalMs = 4000;

/// Used by the orchestrator when a provider throws.
inline constexpr int kFallbackAttackIntervalMs = 1500;
inline constexpr int kFallbackHitOffsetMs = 300;
inline constexpr int kFallbackAnimationMs = 600;

/// Strategy computing the timing of a swing.
///
/// Implementations must be deterministic and free of side effects so the
/// same inputs can be evaluated by a shadow provider for comparison.
/// A null weapon means the actor fights unarmed.
class ITimingProvider {
public:
    virtual ~ITimingProvider() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Milliseconds until the attacker may swing again.
    [[nodiscard]] virtual int attackIntervalMs(const IActor& attacker,
                                               const WeaponDescriptor* weapon) const = 0;

    /// Milliseconds between swing start and hit resolution.
    [[nodiscard]] virtual int hitOffsetMs(const WeaponDescriptor* weapon) const = 0;

    [[nodiscard]] virtual int animationDurationMs(const WeaponDescriptor* weapon) const = 0;
};

/// The single active-provider slot read by the orchestrator.
///
/// Swapping is safe while swings are in flight: readers keep the provider
/// they fetched alive through the returned shared_ptr.
class TimingProviderSlot {
public:
    explicit TimingProviderSlot(std::shared_ptr<const ITimingProvider> initial)
        : provider_(std::move(initial)) {}

    [[nodiscard]] std::shared_ptr<const ITimingProvider> current() const {
        std::lock_guard lock(mutex_);
        return provider_;
    }

    /// Replace the active provider. Null is ignored.
    void set(std::shared_ptr<const ITimingProvider> provider) {
        if (!provider) {
            return;
        }
        std::lock_guard lock(mutex_);
        provider_ = std::move(provider);
    }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const ITimingProvider> provider_;
};

} // namespace ctc::combat