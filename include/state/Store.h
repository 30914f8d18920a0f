#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "state/AppState.h"

/**
 * @brief Owns the entity state; every other component reads snapshots
 *
 * One Store is created by the host and handed to each view explicitly. With a dispatcher,
 * a burst of updates before the dispatched task runs produces a single notification.
 */
class Store {
  public:
    using ListenerId = uint64_t;
    using Listener = std::function<void(const AppState &)>;
    using Task = std::function<void()>;
    using Dispatcher = std::function<void(Task)>;

    /**
     * @param dispatcher Schedules listener notification on the event loop; notifies inline when empty
     */
    explicit Store(Dispatcher dispatcher = {});

    Store(const Store &) = delete;
    Store &operator=(const Store &) = delete;

    AppState snapshot() const;
    void update(const std::function<void(AppState &)> &mutator);

    /**
     * @brief Number of updates applied so far
     */
    uint64_t revision() const { return m_revision.load(); }

    ListenerId subscribe(Listener cb);

    /**
     * @brief Subscribe to a derived value; onChange runs only when the value differs from the last one seen
     */
    template <class T, class Selector, class Callback, class Equals = std::equal_to<T>>
    ListenerId subscribe(Selector selector, Callback onChange, Equals equals = Equals{}, bool fireImmediately = false) {
        static_assert(std::is_copy_constructible_v<T>, "T must be copy-constructible.");
        T current;
        {
            std::scoped_lock lock(m_mutex);
            current = static_cast<T>(selector(m_state));
        }

        if (fireImmediately) {
            onChange(current);
        }

        auto lastSeen = std::make_shared<T>(std::move(current));
        return subscribe([selector = std::move(selector), onChange = std::move(onChange), equals = std::move(equals),
                          lastSeen](const AppState &s) mutable {
            T next = static_cast<T>(selector(s));
            if (equals(*lastSeen, next)) {
                return;
            }
            *lastSeen = std::move(next);
            onChange(*lastSeen);
        });
    }

    void unsubscribe(ListenerId id);

  private:
    void scheduleNotify();
    void notifyListeners();

    mutable std::mutex m_mutex;
    AppState m_state{};
    Dispatcher m_dispatcher;
    std::atomic<bool> m_notifyPending{false};
    std::atomic<uint64_t> m_revision{0};

    std::unordered_map<ListenerId, Listener> m_listeners;
    std::atomic<ListenerId> m_nextId{0};
};
