#pragma once

#include "core/types.hpp"

#include <optional>
#include <vector>

namespace shutbox {

//! Read only view of the game state.
struct GameSnapshot {
	Tile maxTile;                          //!< Highest tile value.
	bool singleDieRule;                    //!< One die rule enabled for this game.
	std::vector<bool> open;                //!< Index i holds whether tile i+1 is open.
	std::vector<Tile> openTiles;           //!< Open tiles in ascending order.
	std::optional<unsigned> pendingTarget; //!< Target of the roll awaiting a move.
	std::optional<Roll> lastRoll;          //!< Most recent roll, also after it was resolved.
	unsigned turn;                         //!< Number of rolls made.
	bool over;                             //!< Game reached terminal state.
	unsigned score;                        //!< Sum of open tiles. Final once the game is over.
	bool canUseSingleDie;                  //!< A one die roll may be requested now.

	//! Returns whether tile is on the board and open.
	bool isOpen(Tile tile) const {
		return tile >= 1u && tile <= maxTile && open[tile - 1u];
	}
};

} // namespace shutbox
