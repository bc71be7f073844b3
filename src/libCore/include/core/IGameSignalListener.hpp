#pragma once

#include "core/gameEvent.hpp"

namespace shutbox {

class IGameSignalListener {
public:
	virtual ~IGameSignalListener()              = default;
	virtual void onGameEvent(GameSignal signal) = 0;
};

} // namespace shutbox
