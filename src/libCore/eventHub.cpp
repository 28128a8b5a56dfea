#include "reversi/eventHub.hpp"

#include <algorithm>

namespace reversi {

void EventHub::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameSignalListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(), [&](const ListenerEntry& e) { return e.listener == listener; }),
	                  m_listeners.end());
}

void EventHub::signal(GameSignal signal) {
	std::vector<IGameSignalListener*> receivers;
	{
		std::lock_guard<std::mutex> lock(m_listenerMutex);
		for (const auto& [listener, signalMask]: m_listeners) {
			if (signalMask & signal)
				receivers.push_back(listener);
		}
	}

	// Notify without holding the lock. Listeners may call back into the game or the hub.
	for (auto* listener: receivers) {
		listener->onGameEvent(signal);
	}
}

} // namespace reversi
