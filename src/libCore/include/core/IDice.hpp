#pragma once

#include "core/types.hpp"

namespace shutbox {

//! Source of die throws. Allows injecting deterministic dice into a game.
class IDice {
public:
	virtual ~IDice()        = default;
	virtual Die throwDie() = 0; //!< Returns a face value in [1, 6].
};

} // namespace shutbox
