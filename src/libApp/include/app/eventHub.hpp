#pragma once

#include "app/IGameSignalListener.hpp"

#include <vector>

namespace minigam::app {

//! Allows external components to be updated on game changes and messages.
//! \note Single threaded; listeners are called synchronously from the acting call.
class EventHub {
	struct SignalListenerEntry {
		IGameSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;           //!< What events the listener cares about.
	};

public:
	void subscribe(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IGameSignalListener* listener);
	void subscribe(IGameMessageListener* listener);
	void unsubscribe(IGameMessageListener* listener);

	void signal(GameSignal signal);           //!< Signal a game change.
	void message(const GameMessage& message); //!< Forward a message to every message listener.

private:
	std::vector<SignalListenerEntry> m_signalListeners;
	std::vector<IGameMessageListener*> m_messageListeners;
};

} // namespace minigam::app
