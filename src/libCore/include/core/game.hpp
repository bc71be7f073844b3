#pragma once

#include "core/IDice.hpp"
#include "core/board.hpp"
#include "core/config.hpp"
#include "core/eventHub.hpp"
#include "core/snapshot.hpp"
#include "core/types.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace shutbox {

//! Rule engine of a single game of Shut the Box.
//! Every turn is a roll followed by a move closing tiles that sum to the roll. Illegal requests throw
//! (see core/errors.hpp) and leave the state untouched.
class Game {
public:
	//! Setup a game with all tiles open and dice seeded from the config.
	explicit Game(const GameConfig& config = {});
	//! Setup a game using the given dice instead of the default random dice.
	Game(const GameConfig& config, std::unique_ptr<IDice> dice);

	//! Roll the dice and set the pending target.
	//! \throws IllegalRollRequest One die while tiles 7-9 are not all closed or a roll is still pending.
	//! \throws GameOver The game already ended.
	Roll roll(DiceCount count = DiceCount::Two);
	Roll roll(Die forced);               //!< One die roll with a forced value.
	Roll roll(Die forced1, Die forced2); //!< Two dice roll with forced values.

	//! Close the tiles of move. Order of the tiles does not matter.
	//! \throws IllegalMove Move does not match the pending target or no roll pending.
	//! \throws GameOver The game already ended.
	GameSnapshot applyMove(const Move& move);

	std::vector<Move> legalMoves() const; //!< Moves for the pending target. Empty if nothing is pending.
	GameSnapshot snapshot() const;

	bool isOver() const;
	unsigned score() const;
	bool canUseSingleDie() const;
	const Board& board() const;

public:
	void subscribeSignals(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribeSignals(IGameSignalListener* listener);
	void subscribeState(IGameStateListener* listener);
	void unsubscribeState(IGameStateListener* listener);

private:
	void checkRollAllowed(DiceCount count) const;
	Roll resolveRoll(std::vector<Die> dice);

private:
	GameConfig m_config;
	Board m_board;
	std::unique_ptr<IDice> m_dice;

	std::optional<unsigned> m_pendingTarget; //!< Target of the current unresolved roll.
	std::optional<Roll> m_lastRoll;          //!< Last roll made.
	unsigned m_turn{0};                      //!< Number of rolls made.
	bool m_over{false};                      //!< Terminal state reached.

	EventHub m_eventHub; //!< Hub to signal updates of the game state to external components.
};

} // namespace shutbox
