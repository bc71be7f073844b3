#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>

namespace shutbox {

//! Setup of a single game.
struct GameConfig {
	Tile maxTile{DEFAULT_MAX_TILE};      //!< Tiles 1..maxTile are on the board.
	bool singleDieRule{true};            //!< Allow one die once tiles 7, 8 and 9 are closed.
	std::optional<uint64_t> seed{};      //!< Seed of the default dice. Random seed if empty.
};

} // namespace shutbox
