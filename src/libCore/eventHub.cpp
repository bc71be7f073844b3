#include "core/eventHub.hpp"

#include <algorithm>

namespace shutbox {

void EventHub::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	m_signalListeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameSignalListener* listener) {
	m_signalListeners.erase(std::remove_if(m_signalListeners.begin(), m_signalListeners.end(),
	                                       [&](const SignalEntry& e) { return e.listener == listener; }),
	                        m_signalListeners.end());
}

void EventHub::subscribe(IGameStateListener* listener) {
	m_stateListeners.push_back(listener);
}

void EventHub::unsubscribe(IGameStateListener* listener) {
	m_stateListeners.erase(std::remove(m_stateListeners.begin(), m_stateListeners.end(), listener), m_stateListeners.end());
}

void EventHub::signal(GameSignal signal) {
	for (const auto& [listener, signalMask]: m_signalListeners) {
		if (signalMask & signal) {
			listener->onGameEvent(signal);
		}
	}
}

void EventHub::signalDelta(const GameDelta& delta) {
	for (auto* listener: m_stateListeners) {
		listener->onGameDelta(delta);
	}
}

} // namespace shutbox
