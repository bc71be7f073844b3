#include "core/game.hpp"

#include "core/errors.hpp"
#include "core/moveFinder.hpp"
#include "core/randomDice.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <cassert>
#include <format>
#include <stdexcept>
#include <string>

namespace shutbox {

static std::string toString(const Move& move) {
	std::string out;
	for (std::size_t i = 0; i < move.size(); ++i) {
		if (i) {
			out.push_back('+');
		}
		out += std::to_string(move[i]);
	}
	return out;
}

//! Log the rejection and throw it.
template <class Error>
[[noreturn]] static void reject(const std::string& message) {
	auto logger = Logger();
	logger.Log(Logging::LogLevel::Warning, std::format("[Game] {}", message));
	throw Error(message);
}

Game::Game(const GameConfig& config) : Game(config, std::make_unique<RandomDice>(config.seed)) {
}

Game::Game(const GameConfig& config, std::unique_ptr<IDice> dice) : m_config{config}, m_board{config.maxTile}, m_dice{std::move(dice)} {
	if (!m_dice) {
		throw std::invalid_argument("Game needs a dice source.");
	}
}

bool Game::canUseSingleDie() const {
	return m_config.singleDieRule && highTilesClosed(m_board);
}

void Game::checkRollAllowed(const DiceCount count) const {
	if (m_over) {
		reject<GameOver>(std::format("Roll rejected: game is over with score {}.", m_board.openSum()));
	}
	if (m_pendingTarget) {
		reject<IllegalRollRequest>(std::format("Roll rejected: target {} still awaits a move.", *m_pendingTarget));
	}
	if (count == DiceCount::One && !canUseSingleDie()) {
		reject<IllegalRollRequest>("Roll rejected: one die is only allowed once tiles 7, 8 and 9 are closed.");
	}
}

Roll Game::roll(const DiceCount count) {
	checkRollAllowed(count);

	std::vector<Die> dice{m_dice->throwDie()};
	if (count == DiceCount::Two) {
		dice.push_back(m_dice->throwDie());
	}
	return resolveRoll(std::move(dice));
}

Roll Game::roll(const Die forced) {
	checkRollAllowed(DiceCount::One);
	return resolveRoll({forced});
}

Roll Game::roll(const Die forced1, const Die forced2) {
	checkRollAllowed(DiceCount::Two);
	return resolveRoll({forced1, forced2});
}

Roll Game::resolveRoll(std::vector<Die> dice) {
	for (const auto die: dice) {
		if (die < DIE_MIN || die > DIE_MAX) {
			reject<IllegalRollRequest>(std::format("Roll rejected: die value {} is outside [{}, {}].", die, DIE_MIN, DIE_MAX));
		}
	}

	Roll result{.dice = std::move(dice), .target = 0u};
	for (const auto die: result.dice) {
		result.target += die;
	}

	++m_turn;
	m_lastRoll      = result;
	m_pendingTarget = result.target;

	auto moves = findMoves(m_board, result.target);
	if (moves.empty()) {
		m_pendingTarget.reset();
		m_over = true;
	}

	m_eventHub.signal(GS_Roll);
	m_eventHub.signalDelta(GameDelta{
	        .turn       = m_turn,
	        .action     = GameAction::Roll,
	        .roll       = result,
	        .legalMoves = std::move(moves),
	        .closed     = {},
	        .openBefore = m_board.openFlags(),
	        .openAfter  = m_board.openFlags(),
	        .score      = m_board.openSum(),
	        .over       = m_over,
	});
	if (m_over) {
		m_eventHub.signal(GS_GameOver);
	}

	return result;
}

GameSnapshot Game::applyMove(const Move& move) {
	if (m_over) {
		reject<GameOver>(std::format("Move {} rejected: game is over with score {}.", toString(move), m_board.openSum()));
	}
	if (!m_pendingTarget) {
		reject<IllegalMove>(std::format("Move {} rejected: no roll pending.", toString(move)));
	}
	if (!isValidMove(m_board, *m_pendingTarget, move)) {
		reject<IllegalMove>(std::format("Move {} rejected: not a set of open tiles summing to {}.", toString(move), *m_pendingTarget));
	}

	Move closed = move;
	std::sort(closed.begin(), closed.end());

	const auto openBefore = m_board.openFlags();
	for (const auto tile: closed) {
		m_board.close(tile);
	}

	m_pendingTarget.reset();
	m_over = m_board.allClosed();

	m_eventHub.signal(GS_Close);
	m_eventHub.signalDelta(GameDelta{
	        .turn       = m_turn,
	        .action     = GameAction::Close,
	        .roll       = m_lastRoll,
	        .legalMoves = {},
	        .closed     = closed,
	        .openBefore = openBefore,
	        .openAfter  = m_board.openFlags(),
	        .score      = m_board.openSum(),
	        .over       = m_over,
	});
	if (m_over) {
		m_eventHub.signal(GS_GameOver);
	}

	return snapshot();
}

std::vector<Move> Game::legalMoves() const {
	if (!m_pendingTarget) {
		return {};
	}
	return findMoves(m_board, *m_pendingTarget);
}

GameSnapshot Game::snapshot() const {
	return GameSnapshot{
	        .maxTile         = m_board.maxTile(),
	        .singleDieRule   = m_config.singleDieRule,
	        .open            = m_board.openFlags(),
	        .openTiles       = m_board.openTiles(),
	        .pendingTarget   = m_pendingTarget,
	        .lastRoll        = m_lastRoll,
	        .turn            = m_turn,
	        .over            = m_over,
	        .score           = m_board.openSum(),
	        .canUseSingleDie = !m_over && canUseSingleDie(),
	};
}

bool Game::isOver() const {
	return m_over;
}

unsigned Game::score() const {
	return m_board.openSum();
}

const Board& Game::board() const {
	return m_board;
}

void Game::subscribeSignals(IGameSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void Game::unsubscribeSignals(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

void Game::subscribeState(IGameStateListener* listener) {
	m_eventHub.subscribe(listener);
}

void Game::unsubscribeState(IGameStateListener* listener) {
	m_eventHub.unsubscribe(listener);
}

} // namespace shutbox
