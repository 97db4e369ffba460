#pragma once

/// @file signal.hpp
/// @brief Thread-safe Signal<Args...> used to publish registry membership
///        changes to interested components.

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace arl::foundation {

/// Observer list dispatching events to registered slots.
///
/// emit() snapshots the slots under a shared lock and invokes them unlocked,
/// so a slot may connect or disconnect without deadlocking. Slots run on the
/// emitting thread and must be thread-safe themselves.
///
/// Example:
/// @code
///   Signal<const std::string&> onRemoved;
///   auto id = onRemoved.connect([](const std::string& instanceId) { ... });
///   onRemoved.emit("api-1");
///   onRemoved.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    SlotId connect(Slot slot) {
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    void disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        for (auto it = slots_.begin(); it != slots_.end(); ++it) {
            if (it->first == id) {
                slots_.erase(it);
                return;
            }
        }
    }

    /// Invoke every slot in connection order.
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& entry : slots_) {
                snapshot.push_back(entry.second);
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

private:
    std::vector<std::pair<SlotId, Slot>> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

} // namespace arl::foundation
