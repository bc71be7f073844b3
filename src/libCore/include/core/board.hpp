#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace shutbox {

//! Row of numbered tiles 1..maxTile. Only the open/closed state of a tile changes during a game.
class Board {
public:
	explicit Board(Tile maxTile);

	Tile maxTile() const;

	bool contains(Tile tile) const; //!< Tile is part of the board.
	bool isOpen(Tile tile) const;   //!< Tile is on the board and still open.
	void close(Tile tile);          //!< Close an open tile.

	std::vector<Tile> openTiles() const; //!< Open tiles in ascending order.
	std::vector<bool> openFlags() const; //!< Index i holds the state of tile i+1.
	unsigned openSum() const;            //!< Sum of all open tile values.
	bool allClosed() const;

	//! Tiles as key string, closed tiles replaced by 'X'. Example: "123X56X89".
	//! \note Tiles above 9 are written with all their digits.
	std::string toKey() const;

private:
	Tile m_maxTile;           //!< Highest tile value.
	std::vector<bool> m_open; //!< Open flag per tile.
};

} // namespace shutbox
