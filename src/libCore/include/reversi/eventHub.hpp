#pragma once

#include "reversi/IGameSignalListener.hpp"
#include "reversi/types.hpp"

#include <mutex>
#include <vector>

namespace reversi {

//! Allows external components to be updated on internal game events.
class EventHub {
	struct ListenerEntry {
		IGameSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;           //!< What events the listener cares about.
	};

public:
	void subscribe(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IGameSignalListener* listener);

	//! Signal a game event.
	void signal(GameSignal signal);

private:
	std::mutex m_listenerMutex;
	std::vector<ListenerEntry> m_listeners;
};

} // namespace reversi
