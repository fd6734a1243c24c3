/// @file combat_timing_service.cpp
/// @brief CombatTimingService implementation.

#include "ctc/service/combat_timing_service.hpp"

#include <atomic>
#include <mutex>

#include "ctc/combat/legacy_timing_provider.hpp"
#include "ctc/combat/weapon_timing_provider.hpp"
#include "ctc/foundation/combat_logger.hpp"
#include "ctc/foundation/job_scheduler.hpp"
#include "ctc/foundation/signal.hpp"

namespace ctc::service {

using combat::ActionCategory;
using combat::ActionEvent;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

// Expired timer states are pruned once per this many ticks.
constexpr uint64_t kPruneEveryTicks = 100;

}  // anonymous namespace
// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct CombatTimingService::Impl {
    Impl(CombatTimingConfig cfg, combat::ICombatHandler& handler,
         std::shared_ptr<const foundation::TimeSource> timeSource)
        : clock(timeSource ? std::move(timeSource)
                           : std::make_shared<foundation::SteadyTimeSource>()),
          config(std::move(cfg)),
          providers(std::make_shared<combat::WeaponTimingProvider>(config.weapons)),
          states(config.independentTimers ? combat::TimerMode::Independent
                                          : combat::TimerMode::Shared,
                 config.rules.toTimerRules(), *clock),
          pulse(config.pulse, *clock),
          jobs(1),
          auditTrail(config.auditSettings, *clock),
          routine(states, pulse, providers, handler, events, *clock),
          coordinator(states, events, *clock, config.rules.coordinatorOptions()) {
        if (config.auditSettings.enabled && config.auditSettings.shadowMode) {
            audit::ShadowSettings settings;
            settings.sampleEvery = config.auditSettings.shadowSampleEvery;
            shadow = std::make_unique<audit::ShadowVerifier>(
                std::make_shared<combat::LegacyTimingProvider>(), providers, *clock, settings);
            shadow->setAudit(&auditTrail);
        }

        states.setLogCancellations(config.logCancellations);
        routine.attachToPulse();

        beganLink = foundation::ScopedConnection<const ActionEvent&>(
            events.actionBegan, [this](const ActionEvent& event) {
                auditTrail.observe(event);
                if (shadow) {
                    shadow->observe(event);
                }
            });
        endedLink = foundation::ScopedConnection<const ActionEvent&>(
            events.actionEnded, [this](const ActionEvent& event) { auditTrail.observe(event); });
        tickLink = foundation::ScopedConnection<double>(
            pulse.tickCompleted(), [this](double ms) { onTick(ms); });
    }

    void onTick(double ms) {
        auditTrail.onTickCompleted(ms);
        if (auditPending.load()) {
            startAudit();
        }
        if (++ticks % kPruneEveryTicks == 0) {
            states.pruneExpired();
        }
    }

    /// Install the audit flush timer; retried from the tick while the
    /// timer service is not ready yet.
    void startAudit() {
        std::lock_guard lock(auditStartMutex);
        if (timers == nullptr || !config.auditSettings.enabled) {
            auditPending.store(false);
            return;
        }
        auto started = auditTrail.start(*timers, jobs);
        if (started) {
            auditPending.store(false);
            return;
        }
        if (started.error().code() == ErrorCode::TimerServiceNotReady) {
            auditPending.store(true);
            return;
        }
        auditPending.store(false);
        CTC_LOG_WARN(LogCategory::Audit, "Audit flush timer not installed: " +
                                             std::string(started.error().message()));
    }

    std::shared_ptr<const foundation::TimeSource> clock;
    CombatTimingConfig config;

    combat::CombatEvents events;
    combat::TimingProviderSlot providers;
    combat::ActorStateRegistry states;
    combat::CombatPulse pulse;
    foundation::JobScheduler jobs;
    audit::CombatAudit auditTrail;
    std::unique_ptr<audit::ShadowVerifier> shadow;
    combat::AttackRoutine routine;
    combat::ActionCoordinator coordinator;

    foundation::ITimerService* timers = nullptr;
    std::mutex auditStartMutex;
    std::atomic<bool> auditPending{false};
    std::atomic<bool> running{false};
    std::atomic<uint64_t> ticks{0};

    // Last, so they disconnect before the components they call go away.
    foundation::ScopedConnection<const ActionEvent&> beganLink;
    foundation::ScopedConnection<const ActionEvent&> endedLink;
    foundation::ScopedConnection<double> tickLink;
};

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
CombatTimingService::CombatTimingService(CombatTimingConfig config,
                                         combat::ICombatHandler& handler,
                                         std::shared_ptr<const foundation::TimeSource> clock) {
    config.validate();
    impl_ = std::make_unique<Impl>(std::move(config), handler, std::move(clock));
}

CombatTimingService::~CombatTimingService() {
    stop();
}

GameResult<void> CombatTimingService::start(foundation::ITimerService& timers) {
    if (impl_->running.load()) {
        return GameResult<void>::ok();
    }

    auto pulseStarted = impl_->pulse.initialize(timers);
    if (!pulseStarted) {
        return pulseStarted;
    }
    impl_->timers = &timers;
    impl_->startAudit();
    impl_->running.store(true);

    const auto& cfg = impl_->config;
    CTC_LOG_INFO(LogCategory::Core,
                 "Combat timing started (provider " +
                     std::string(impl_->providers.current()->name()) + ", tick " +
                     std::to_string(cfg.pulse.tickInterval.count()) + "ms, " +
                     (cfg.independentTimers ? "independent" : "shared") + " timers, audit " +
                     std::string(cfg.auditSettings.enabled
                                     ? audit::auditLevelName(cfg.auditSettings.level)
                                     : "off") +
                     (impl_->shadow ? ", shadow on" : "") + ")");
    return GameResult<void>::ok();
}

void CombatTimingService::stop() {
    if (!impl_ || !impl_->running.exchange(false)) {
        return;
    }
    impl_->pulse.shutdown();
    impl_->auditTrail.stop();
    {
        std::lock_guard lock(impl_->auditStartMutex);
        impl_->timers = nullptr;
        impl_->auditPending.store(false);
    }
    CTC_LOG_INFO(LogCategory::Core, "Combat timing stopped");
}

bool CombatTimingService::isRunning() const noexcept {
    return impl_->running.load();
}

combat::TickReport CombatTimingService::tick() {
    return impl_->pulse.tick();
}

// ---------------------------------------------------------------------------
// Actions
// ---------------------------------------------------------------------------
GameResult<combat::ScheduledAttack> CombatTimingService::requestSwing(
    const std::shared_ptr<combat::IActor>& attacker,
    const std::shared_ptr<combat::IActor>& defender,
    const std::optional<combat::WeaponDescriptor>& weapon) {
    return impl_->routine.executeAttack(attacker, defender, weapon);
}

bool CombatTimingService::canAttack(const combat::IActor& actor) const {
    return impl_->routine.canAttack(actor);
}

bool CombatTimingService::cancelSwing(foundation::ActorId actor, std::string_view reason) {
    return impl_->routine.cancelPendingAttack(actor, reason);
}

GameResult<void> CombatTimingService::beginSpell(const std::shared_ptr<combat::IActor>& caster,
                                                 std::string spellName,
                                                 std::optional<foundation::ActorId> target,
                                                 std::chrono::milliseconds castTime) {
    return impl_->coordinator.beginSpell(caster, std::move(spellName), target, castTime);
}

GameResult<void> CombatTimingService::enterCastDelay(foundation::ActorId caster,
                                                     std::chrono::milliseconds delay) {
    return impl_->coordinator.enterCastDelay(caster, delay);
}

GameResult<void> CombatTimingService::completeSpell(const std::shared_ptr<combat::IActor>& caster,
                                                    std::chrono::milliseconds recovery) {
    return impl_->coordinator.completeSpell(caster, recovery);
}

GameResult<void> CombatTimingService::beginBandage(const std::shared_ptr<combat::IActor>& healer,
                                                   std::optional<foundation::ActorId> patient,
                                                   std::chrono::milliseconds healTime) {
    return impl_->coordinator.beginBandage(healer, patient, healTime);
}

GameResult<void> CombatTimingService::completeBandage(
    const std::shared_ptr<combat::IActor>& healer, std::chrono::milliseconds delay) {
    return impl_->coordinator.completeBandage(healer, delay);
}

GameResult<void> CombatTimingService::beginWand(const std::shared_ptr<combat::IActor>& user,
                                                std::string wandName,
                                                std::optional<foundation::ActorId> target,
                                                std::chrono::milliseconds useTime) {
    return impl_->coordinator.beginWand(user, std::move(wandName), target, useTime);
}

GameResult<void> CombatTimingService::completeWand(const std::shared_ptr<combat::IActor>& user,
                                                   std::chrono::milliseconds delay) {
    return impl_->coordinator.completeWand(user, delay);
}

bool CombatTimingService::cancelAction(foundation::ActorId actor, ActionCategory category,
                                       std::string_view reason) {
    if (category == ActionCategory::Swing) {
        return cancelSwing(actor, reason);
    }
    return impl_->coordinator.cancel(actor, category, reason);
}

bool CombatTimingService::canPerform(const combat::IActor& actor,
                                     ActionCategory category) const {
    if (category == ActionCategory::Swing) {
        return canAttack(actor);
    }
    return impl_->coordinator.canPerform(actor, category);
}

void CombatTimingService::onActorRemoved(foundation::ActorId actor) {
    impl_->pulse.unregisterParticipant(actor);
    impl_->states.remove(actor);
    impl_->auditTrail.forgetActor(actor);
    CTC_LOG_DEBUG(LogCategory::Core, "Actor " + std::to_string(actor.value()) + " removed");
}

// ---------------------------------------------------------------------------
// Providers
// ---------------------------------------------------------------------------
void CombatTimingService::setActiveProvider(
    std::shared_ptr<const combat::ITimingProvider> provider) {
    if (!provider) {
        CTC_LOG_WARN(LogCategory::Timing, "Ignoring null timing provider");
        return;
    }
    CTC_LOG_INFO(LogCategory::Timing,
                 "Active timing provider set to " + std::string(provider->name()));
    impl_->providers.set(std::move(provider));
}

std::shared_ptr<const combat::ITimingProvider> CombatTimingService::activeProvider() const {
    return impl_->providers.current();
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
combat::TickStats CombatTimingService::performance() const {
    return impl_->pulse.performance();
}

std::string CombatTimingService::stateSummary(foundation::ActorId actor) const {
    auto state = impl_->states.find(actor);
    if (!state) {
        return "actor=" + std::to_string(actor.value()) + " untracked";
    }
    return state->stateSummary();
}

std::vector<audit::AuditLogEntry> CombatTimingService::auditSnapshot() const {
    return impl_->auditTrail.snapshot();
}

std::vector<audit::AuditLogEntry> CombatTimingService::actorHistory(
    foundation::ActorId actor, std::optional<std::chrono::milliseconds> window) const {
    return impl_->auditTrail.actorHistory(actor, window);
}

GameResult<std::size_t> CombatTimingService::flushAudit() {
    return impl_->auditTrail.flush();
}

void CombatTimingService::clearAudit() {
    impl_->auditTrail.clear();
}

audit::AuditStats CombatTimingService::auditStats() const {
    return impl_->auditTrail.stats();
}

audit::ShadowReport CombatTimingService::shadowReport(
    std::optional<std::chrono::milliseconds> window) const {
    if (!impl_->shadow) {
        audit::ShadowReport report;
        report.message = "Shadow mode is disabled";
        return report;
    }
    return impl_->shadow->report(window);
}

GameResult<std::filesystem::path> CombatTimingService::exportShadowCsv(
    const std::optional<std::filesystem::path>& directory) const {
    if (!impl_->shadow) {
        return GameResult<std::filesystem::path>::err(
            GameError(ErrorCode::AuditDisabled, "shadow mode is disabled"));
    }
    return impl_->shadow->exportCsvTo(directory ? *directory
                                                : impl_->config.auditSettings.outputDirectory);
}

combat::CombatEvents& CombatTimingService::events() noexcept {
    return impl_->events;
}

combat::CombatPulse& CombatTimingService::pulse() noexcept {
    return impl_->pulse;
}

combat::ActorStateRegistry& CombatTimingService::states() noexcept {
    return impl_->states;
}

audit::CombatAudit& CombatTimingService::auditTrail() noexcept {
    return impl_->auditTrail;
}

audit::ShadowVerifier* CombatTimingService::shadow() noexcept {
    return impl_->shadow.get();
}

const CombatTimingConfig& CombatTimingService::config() const noexcept {
    return impl_->config;
}

}  // namespace ctc::service