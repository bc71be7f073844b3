#pragma once

#include <cstdint>
#include <vector>

namespace shutbox {

using Tile = unsigned;          //!< Tile value on the board. Tiles are numbered 1..maxTile.
using Die  = unsigned;          //!< Face value of a single die in [1, 6].
using Move = std::vector<Tile>; //!< Tiles to close in one turn. Kept sorted ascending.

static constexpr Die DIE_MIN = 1u;
static constexpr Die DIE_MAX = 6u;

static constexpr Tile DEFAULT_MAX_TILE = 9u;

enum class DiceCount { One = 1, Two = 2 };

//! Outcome of one dice draw.
struct Roll {
	std::vector<Die> dice; //!< One or two face values.
	unsigned target{0};    //!< Sum a move has to match.
};

//! Returns the sum of the tiles in the move.
inline unsigned moveSum(const Move& move) {
	unsigned sum = 0;
	for (const auto tile: move) {
		sum += tile;
	}
	return sum;
}

} // namespace shutbox
