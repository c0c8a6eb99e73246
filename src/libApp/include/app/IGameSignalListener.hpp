#pragma once

#include "app/gameSignal.hpp"

namespace minigam::app {

class IGameSignalListener {
public:
	virtual ~IGameSignalListener()              = default;
	virtual void onGameEvent(GameSignal signal) = 0;
};

class IGameMessageListener {
public:
	virtual ~IGameMessageListener()                        = default;
	virtual void onGameMessage(const GameMessage& message) = 0;
};

} // namespace minigam::app
