#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace shutbox {

//! Bit flags to subscribe to certain game signals.
enum GameSignal : uint64_t {
	GS_Roll     = 1u << 0u, //!< Dice were rolled.
	GS_Close    = 1u << 1u, //!< Tiles were closed.
	GS_GameOver = 1u << 2u, //!< Game reached its terminal state.
	GS_All      = GS_Roll | GS_Close | GS_GameOver,
};

enum class GameAction { Roll, Close };

//! Describes one state change of the game so listeners can follow it without polling.
struct GameDelta {
	unsigned turn;                 //!< Turn number the change belongs to.
	GameAction action;             //!< What happened.
	std::optional<Roll> roll;      //!< Set for roll action.
	std::vector<Move> legalMoves;  //!< Moves available after a roll.
	Move closed;                   //!< Tiles closed by a close action.
	std::vector<bool> openBefore;  //!< Tile state before the change.
	std::vector<bool> openAfter;   //!< Tile state after the change.
	unsigned score;                //!< Sum of open tiles after the change.
	bool over;                     //!< Game is over after this change.
};

} // namespace shutbox
