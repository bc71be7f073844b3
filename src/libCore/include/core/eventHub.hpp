#pragma once

#include "core/IGameSignalListener.hpp"
#include "core/IGameStateListener.hpp"
#include "core/gameEvent.hpp"

#include <cstdint>
#include <vector>

namespace shutbox {

//! Allows external components to be updated on game changes.
//! \note Not synchronized. A game and its listeners live on one thread.
class EventHub {
	struct SignalEntry {
		IGameSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;           //!< What signals the listener cares about.
	};

public:
	void subscribe(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IGameSignalListener* listener);
	void subscribe(IGameStateListener* listener);
	void unsubscribe(IGameStateListener* listener);

	void signal(GameSignal signal);          //!< Signal a game event.
	void signalDelta(const GameDelta& delta); //!< Publish a state change.

private:
	std::vector<SignalEntry> m_signalListeners;
	std::vector<IGameStateListener*> m_stateListeners;
};

} // namespace shutbox
