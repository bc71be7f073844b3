#pragma once

#include "core/board.hpp"
#include "core/types.hpp"

#include <vector>

namespace shutbox {

//! Tiles whose closure allows rolling a single die.
static constexpr Tile HIGH_TILES[] = {7u, 8u, 9u};

//! Returns every distinct set of open tiles summing exactly to target.
//! Moves are sorted ascending and the list is ordered lexicographically.
std::vector<Move> findMoves(const Board& board, unsigned target);

//! Returns whether at least one set of open tiles sums to target.
bool hasMove(const Board& board, unsigned target);

//! Returns whether all high tiles (7, 8, 9 as far as they exist on the board) are closed.
bool highTilesClosed(const Board& board);

//! Check a candidate move against the board and target.
//! \note The move may be unsorted. Duplicates, unknown or closed tiles make it invalid.
bool isValidMove(const Board& board, unsigned target, const Move& move);

} // namespace shutbox
