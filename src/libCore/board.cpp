#include "core/board.hpp"

#include <cassert>
#include <stdexcept>

namespace shutbox {

Board::Board(const Tile maxTile) : m_maxTile(maxTile), m_open(maxTile, true) {
	if (maxTile < 1u) {
		throw std::invalid_argument("Board needs at least one tile.");
	}
}

Tile Board::maxTile() const {
	return m_maxTile;
}

bool Board::contains(const Tile tile) const {
	return tile >= 1u && tile <= m_maxTile;
}

bool Board::isOpen(const Tile tile) const {
	return contains(tile) && m_open[tile - 1u];
}

void Board::close(const Tile tile) {
	assert(isOpen(tile)); // Game validates the move before closing.

	m_open[tile - 1u] = false;
}

std::vector<Tile> Board::openTiles() const {
	std::vector<Tile> tiles;
	tiles.reserve(m_maxTile);
	for (Tile tile = 1u; tile <= m_maxTile; ++tile) {
		if (m_open[tile - 1u]) {
			tiles.push_back(tile);
		}
	}
	return tiles;
}

std::vector<bool> Board::openFlags() const {
	return m_open;
}

unsigned Board::openSum() const {
	unsigned sum = 0;
	for (Tile tile = 1u; tile <= m_maxTile; ++tile) {
		if (m_open[tile - 1u]) {
			sum += tile;
		}
	}
	return sum;
}

bool Board::allClosed() const {
	for (const auto open: m_open) {
		if (open) {
			return false;
		}
	}
	return true;
}

std::string Board::toKey() const {
	std::string key;
	key.reserve(m_maxTile);
	for (Tile tile = 1u; tile <= m_maxTile; ++tile) {
		key += m_open[tile - 1u] ? std::to_string(tile) : std::string("X");
	}
	return key;
}

} // namespace shutbox
