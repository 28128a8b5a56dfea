#pragma once

#include "reversi/types.hpp"

namespace reversi {

class IGameSignalListener {
public:
	virtual ~IGameSignalListener()              = default;
	virtual void onGameEvent(GameSignal signal) = 0;
};

} // namespace reversi
