/// @file actor_state_registry.cpp
/// @brief ActorStateRegistry implementation.

#include "ctc/combat/actor_state_registry.hpp"

namespace ctc::combat {

ActorStateRegistry::ActorStateRegistry(TimerMode mode, TimerRules rules,
                                       const foundation::TimeSource& clock)
    : mode_(mode), rules_(rules), clock_(clock) {}

std::shared_ptr<ActorTimerState> ActorStateRegistry::getOrCreate(
    const std::shared_ptr<IActor>& actor) {
    if (!actor) {
        return nullptr;
    }

    std::lock_guard lock(mutex_);
    auto id = actor->id();
    auto it = states_.find(id);
    if (it != states_.end()) {
        if (!it->second->isExpired()) {
            return it->second;
        }
        // Serial reused by a new actor instance; start fresh.
        states_.erase(it);
    }

    auto state = std::make_shared<ActorTimerState>(actor, id, mode_, rules_, clock_);
    state->setLogCancellations(logCancellations_);
    state->setCancellationObserver([this](const CancellationNotice& notice) {
        cancellations_.emit(notice);
    });
    states_.emplace(id, state);
    return state;
}

std::shared_ptr<ActorTimerState> ActorStateRegistry::find(ActorId id) const {
    std::lock_guard lock(mutex_);
    auto it = states_.find(id);
    return it != states_.end() ? it->second : nullptr;
}

bool ActorStateRegistry::remove(ActorId id) {
    std::lock_guard lock(mutex_);
    return states_.erase(id) > 0;
}

std::size_t ActorStateRegistry::pruneExpired() {
    std::lock_guard lock(mutex_);
    return std::erase_if(states_, [](const auto& entry) { return entry.second->isExpired(); });
}

std::size_t ActorStateRegistry::size() const {
    std::lock_guard lock(mutex_);
    return states_.size();
}

void ActorStateRegistry::setLogCancellations(bool enabled) {
    std::lock_guard lock(mutex_);
    logCancellations_ = enabled;
    for (auto& [id, state] : states_) {
        state->setLogCancellations(enabled);
    }
}

} // namespace ctc::combat