#pragma once

#include "core/IGameStateListener.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shutbox::sim {

//! One turn of a game: the roll and what was done with it.
struct StepRecord {
	unsigned step;                //!< Zero based turn index.
	unsigned roll;                //!< Target of the roll.
	std::vector<Die> dice;        //!< Dice values of the roll.
	std::string tilesBefore;      //!< Tile key before the move. Example: "123X56X89".
	std::vector<Move> legalMoves; //!< Moves that were available.
	std::optional<Move> chosen;   //!< Applied move. Empty when the roll ended the game.
	std::string tilesAfter;       //!< Tile key after the move.
	unsigned scoreAfter;          //!< Open tile sum after the move.
	bool terminal;                //!< Game ended with this step.
};

//! Tile key of the given open flags. Closed tiles are replaced by 'X'.
std::string tilesToKey(const std::vector<bool>& open);

//! Formats a move as "3+4". An empty move gives "-".
std::string moveToString(const Move& move);

//! Listens to a game and turns its deltas into one record per roll.
class StepRecorder : public IGameStateListener {
public:
	void onGameDelta(const GameDelta& delta) override;

	const std::vector<StepRecord>& steps() const;
	void clear();

private:
	std::vector<StepRecord> m_steps;
};

} // namespace shutbox::sim
