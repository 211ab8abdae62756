#pragma once

/// @file signal.hpp
/// @brief Thread-safe Signal<Args...> for observer pattern (event dispatch).
///
/// Slots (callbacks) are registered via connect() and invoked when emit()
/// is called. Session components emit on the session thread; network
/// adapters may emit from library threads, so registration is guarded by
/// a std::shared_mutex.

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <map>
#include <utility>
#include <vector>

namespace csync::foundation {

/// Thread-safe signal that dispatches events to registered callbacks.
///
/// Slots run in registration order.
///
/// @tparam Args The argument types passed to each slot when the signal fires.
///
/// Example:
/// @code
///   Signal<const SessionId&> onAssigned;
///   auto id = onAssigned.connect([](const SessionId& sid) {
///       std::cout << "match " << sid.value() << "\n";
///   });
///   onAssigned.emit(SessionId("a1b2c3d4"));
///   onAssigned.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;
    ~Signal() = default;

    // Non-copyable, non-movable: subscribers hold SlotIds into this object.
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// Register a callback. Returns a SlotId for later disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        slots_.emplace(id, std::move(slot));
        return id;
    }

    /// Remove a previously registered callback by its SlotId.
    void disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        slots_.erase(id);
    }

    /// Fire the signal, invoking every registered slot with the given args.
    ///
    /// Slots are copied under a shared lock and invoked outside it, so a
    /// slot may connect or disconnect without deadlocking.
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& [id, slot] : slots_) {
                snapshot.push_back(slot);
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    /// Return the number of currently connected slots.
    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

private:
    std::map<SlotId, Slot> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

/// RAII subscription: disconnects its slot when destroyed or reset.
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

    /// Disconnect now. Safe to call more than once.
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

} // namespace csync::foundation
