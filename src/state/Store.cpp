#include "state/Store.h"

#include <vector>

Store::Store(Dispatcher dispatcher) : m_dispatcher(std::move(dispatcher)) {}

AppState Store::snapshot() const {
    std::scoped_lock lock(m_mutex);
    return m_state;
}

void Store::update(const std::function<void(AppState &)> &mutator) {
    {
        std::scoped_lock lock(m_mutex);
        mutator(m_state);
    }
    ++m_revision;
    scheduleNotify();
}

Store::ListenerId Store::subscribe(Listener cb) {
    std::scoped_lock lock(m_mutex);
    const auto id = ++m_nextId;
    m_listeners.emplace(id, std::move(cb));
    return id;
}

void Store::unsubscribe(ListenerId id) {
    std::scoped_lock lock(m_mutex);
    m_listeners.erase(id);
}

void Store::scheduleNotify() {
    if (!m_dispatcher) {
        notifyListeners();
        return;
    }
    if (m_notifyPending.exchange(true)) {
        return;
    }
    m_dispatcher([this]() {
        m_notifyPending = false;
        notifyListeners();
    });
}

void Store::notifyListeners() {
    AppState state;
    std::vector<std::pair<ListenerId, Listener>> listeners;
    {
        std::scoped_lock lock(m_mutex);
        state = m_state;
        listeners.assign(m_listeners.begin(), m_listeners.end());
    }

    for (auto &[id, listener] : listeners) {
        // Skip listeners removed by an earlier callback in this round.
        bool active = false;
        {
            std::scoped_lock lock(m_mutex);
            active = m_listeners.count(id) > 0;
        }
        if (active) {
            listener(state);
        }
    }
}
