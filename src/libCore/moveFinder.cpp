#include "core/moveFinder.hpp"

#include <algorithm>

namespace shutbox {

//! Depth first subset search over the ascending open tiles.
//! Tiles are sorted so a branch stops as soon as the next tile overshoots the remaining sum.
static void collectMoves(const std::vector<Tile>& tiles, const std::size_t start, const unsigned remaining, Move& current,
                         std::vector<Move>& out) {
	for (std::size_t i = start; i < tiles.size(); ++i) {
		const auto tile = tiles[i];
		if (tile > remaining) {
			break;
		}

		current.push_back(tile);
		if (tile == remaining) {
			out.push_back(current);
		} else {
			collectMoves(tiles, i + 1, remaining - tile, current, out);
		}
		current.pop_back();
	}
}

std::vector<Move> findMoves(const Board& board, const unsigned target) {
	std::vector<Move> moves;
	if (target == 0u) {
		return moves;
	}

	const auto tiles = board.openTiles();
	Move current;
	current.reserve(tiles.size());
	collectMoves(tiles, 0u, target, current, moves);

	std::sort(moves.begin(), moves.end());
	return moves;
}

bool hasMove(const Board& board, const unsigned target) {
	return !findMoves(board, target).empty();
}

bool highTilesClosed(const Board& board) {
	return std::none_of(std::begin(HIGH_TILES), std::end(HIGH_TILES), [&](const Tile tile) { return board.isOpen(tile); });
}

bool isValidMove(const Board& board, const unsigned target, const Move& move) {
	if (move.empty()) {
		return false;
	}

	Move sorted = move;
	std::sort(sorted.begin(), sorted.end());
	if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
		return false;
	}

	const auto allOpen = std::all_of(sorted.begin(), sorted.end(), [&](const Tile tile) { return board.isOpen(tile); });
	return allOpen && moveSum(sorted) == target;
}

} // namespace shutbox
