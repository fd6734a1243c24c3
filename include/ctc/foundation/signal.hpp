#pragma once

/// @file signal.hpp
/// @brief Thread-safe Signal<Args...> used to publish combat events.
///
/// Slots are snapshotted under a shared lock and invoked after the lock is
/// released, so a slot may connect or disconnect (even itself) while the
/// signal is being emitted.

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace ctc::foundation {

/// Observer list dispatching to registered callbacks.
///
/// @code
///   Signal<double> tickCompleted;
///   auto id = tickCompleted.connect([](double ms) { record(ms); });
///   tickCompleted.emit(3.2);
///   tickCompleted.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// Register a callback. Returns an id for disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        slots_.emplace_back(id, std::make_shared<Slot>(std::move(slot)));
        return id;
    }

    /// Remove a callback. Unknown ids are ignored.
    void disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        std::erase_if(slots_, [id](const auto& entry) { return entry.first == id; });
    }

    void disconnectAll() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

    /// Invoke every slot in connection order.
    void emit(Args... args) const {
        std::vector<std::shared_ptr<Slot>> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& entry : slots_) {
                snapshot.push_back(entry.second);
            }
        }
        for (const auto& slot : snapshot) {
            (*slot)(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

private:
    std::vector<std::pair<SlotId, std::shared_ptr<Slot>>> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

/// Disconnects a slot when it goes out of scope.
///
/// The signal must outlive the connection.
template <typename... Args>
class ScopedConnection {
public:
    ScopedConnection() = default;
    ScopedConnection(Signal<Args...>& signal, typename Signal<Args...>::Slot slot)
        : signal_(&signal), id_(signal.connect(std::move(slot))) {}

    ~ScopedConnection() { reset(); }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    ScopedConnection(ScopedConnection&& other) noexcept
        : signal_(std::exchange(other.signal_, nullptr)), id_(other.id_) {}

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            reset();
            signal_ = std::exchange(other.signal_, nullptr);
            id_ = other.id_;
        }
        return *this;
    }

    void reset() {
        if (signal_ != nullptr) {
            signal_->disconnect(id_);
            signal_ = nullptr;
        }
    }

    [[nodiscard]] bool connected() const noexcept { return signal_ != nullptr; }

private:
    Signal<Args...>* signal_ = nullptr;
    typename Signal<Args...>::SlotId id_ = 0;
};

} // namespace ctc::foundation