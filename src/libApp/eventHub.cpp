#include "app/eventHub.hpp"

#include <algorithm>

namespace minigam::app {

void EventHub::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	m_signalListeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameSignalListener* listener) {
	m_signalListeners.erase(
	        std::remove_if(m_signalListeners.begin(), m_signalListeners.end(), [&](const SignalListenerEntry& e) { return e.listener == listener; }),
	        m_signalListeners.end());
}

void EventHub::subscribe(IGameMessageListener* listener) {
	m_messageListeners.push_back(listener);
}

void EventHub::unsubscribe(IGameMessageListener* listener) {
	m_messageListeners.erase(std::remove(m_messageListeners.begin(), m_messageListeners.end(), listener), m_messageListeners.end());
}

void EventHub::signal(GameSignal signal) {
	// Listeners may unsubscribe while being notified.
	const auto listeners = m_signalListeners;
	for (const auto& [listener, signalMask]: listeners) {
		if (signalMask & signal) {
			listener->onGameEvent(signal);
		}
	}
}

void EventHub::message(const GameMessage& message) {
	const auto listeners = m_messageListeners;
	for (auto* listener: listeners) {
		listener->onGameMessage(message);
	}
}

} // namespace minigam::app
