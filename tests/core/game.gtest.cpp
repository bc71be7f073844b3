#include "core/errors.hpp"
#include "core/game.hpp"
#include "scriptedDice.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

namespace shutbox::gtest {

static bool containsMove(const std::vector<Move>& moves, const Move& move) {
	return std::find(moves.begin(), moves.end(), move) != moves.end();
}

//! Close tiles 9, 8 and 7 with forced two dice rolls.
static void closeHighTiles(Game& game) {
	game.roll(4u, 5u);
	game.applyMove({9u});
	game.roll(3u, 5u);
	game.applyMove({8u});
	game.roll(3u, 4u);
	game.applyMove({7u});
}

TEST(Game, InitialState) {
	for (Tile maxTile = 1u; maxTile <= 12u; ++maxTile) {
		Game game(GameConfig{.maxTile = maxTile, .seed = 1u});
		const auto state = game.snapshot();

		EXPECT_EQ(state.maxTile, maxTile);
		EXPECT_EQ(state.score, maxTile * (maxTile + 1u) / 2u);
		EXPECT_EQ(state.openTiles.size(), maxTile);
		EXPECT_TRUE(std::all_of(state.open.begin(), state.open.end(), [](bool open) { return open; }));
		EXPECT_FALSE(state.pendingTarget.has_value());
		EXPECT_FALSE(state.lastRoll.has_value());
		EXPECT_EQ(state.turn, 0u);
		EXPECT_FALSE(state.over);
		EXPECT_TRUE(game.legalMoves().empty());
	}
}

TEST(Game, InvalidSetup) {
	EXPECT_THROW(Game(GameConfig{.maxTile = 0u}), std::invalid_argument);
	EXPECT_THROW(Game(GameConfig{}, nullptr), std::invalid_argument);
}

TEST(Game, RandomRollsStayInRange) {
	Game game(GameConfig{.seed = 42u});
	const auto roll = game.roll();

	ASSERT_EQ(roll.dice.size(), 2u);
	for (const auto die: roll.dice) {
		EXPECT_GE(die, DIE_MIN);
		EXPECT_LE(die, DIE_MAX);
	}
	EXPECT_EQ(roll.target, roll.dice[0] + roll.dice[1]);
	EXPECT_EQ(game.snapshot().turn, 1u);
}

TEST(Game, SeededGamesRepeat) {
	Game a(GameConfig{.seed = 7u});
	Game b(GameConfig{.seed = 7u});
	for (int i = 0; i < 3 && !a.isOver(); ++i) {
		const auto rollA = a.roll();
		const auto rollB = b.roll();
		EXPECT_EQ(rollA.dice, rollB.dice);
		if (a.isOver()) {
			break;
		}
		const auto move = a.legalMoves().front();
		a.applyMove(move);
		b.applyMove(move);
	}
}

TEST(Game, InjectedDice) {
	Game game(GameConfig{}, std::make_unique<ScriptedDice>(std::initializer_list<Die>{2u, 6u}));
	const auto roll = game.roll();

	EXPECT_EQ(roll.dice, (std::vector<Die>{2u, 6u}));
	EXPECT_EQ(roll.target, 8u);
	EXPECT_EQ(game.snapshot().pendingTarget, 8u);
}

TEST(Game, ForcedRollSevenAndCloseSeven) {
	Game game;
	const auto roll = game.roll(3u, 4u);
	EXPECT_EQ(roll.target, 7u);

	const auto moves = game.legalMoves();
	EXPECT_TRUE(containsMove(moves, {3u, 4u}));
	EXPECT_TRUE(containsMove(moves, {7u}));
	EXPECT_TRUE(containsMove(moves, {1u, 2u, 4u}));

	const auto state = game.applyMove({7u});
	EXPECT_FALSE(state.isOpen(7u));
	EXPECT_TRUE(state.isOpen(3u));
	EXPECT_TRUE(state.isOpen(4u));
	EXPECT_EQ(state.score, 45u - 7u);
	EXPECT_FALSE(state.pendingTarget.has_value());
	EXPECT_FALSE(state.over);
	EXPECT_EQ(state.turn, 1u);
	ASSERT_TRUE(state.lastRoll.has_value());
	EXPECT_EQ(state.lastRoll->target, 7u);
}

TEST(Game, AppliesEveryLegalMove) {
	for (unsigned d1 = DIE_MIN; d1 <= DIE_MAX; ++d1) {
		for (unsigned d2 = DIE_MIN; d2 <= DIE_MAX; ++d2) {
			Game probe;
			probe.roll(d1, d2);
			for (const auto& move: probe.legalMoves()) {
				Game game;
				game.roll(d1, d2);
				const auto state = game.applyMove(move);
				EXPECT_EQ(state.score, 45u - (d1 + d2));
				for (const auto tile: move) {
					EXPECT_FALSE(state.isOpen(tile));
				}
			}
		}
	}
}

TEST(Game, MoveOrderDoesNotMatter) {
	Game game;
	game.roll(4u, 4u);
	const auto state = game.applyMove({5u, 1u, 2u});
	EXPECT_EQ(state.openTiles, (std::vector<Tile>{3u, 4u, 6u, 7u, 8u, 9u}));
}

TEST(Game, SingleDieRequiresHighTilesClosed) {
	Game game;
	EXPECT_THROW(game.roll(DiceCount::One), IllegalRollRequest);
	EXPECT_THROW(game.roll(3u), IllegalRollRequest);

	game.roll(4u, 5u);
	game.applyMove({9u});
	EXPECT_THROW(game.roll(DiceCount::One), IllegalRollRequest);
	game.roll(3u, 5u);
	game.applyMove({8u});
	EXPECT_THROW(game.roll(DiceCount::One), IllegalRollRequest);
	EXPECT_FALSE(game.snapshot().canUseSingleDie);

	game.roll(3u, 4u);
	game.applyMove({7u});
	EXPECT_TRUE(game.snapshot().canUseSingleDie);

	// Rejected requests did not count as turns.
	EXPECT_EQ(game.snapshot().turn, 3u);

	const auto single = game.roll(DiceCount::One);
	ASSERT_EQ(single.dice.size(), 1u);
	EXPECT_GE(single.target, 1u);
	EXPECT_LE(single.target, 6u);
}

TEST(Game, TwoDiceStayAllowedAfterHighTilesClosed) {
	Game game;
	closeHighTiles(game);

	const auto roll = game.roll(2u, 4u);
	EXPECT_EQ(roll.dice.size(), 2u);
	EXPECT_EQ(roll.target, 6u);
	EXPECT_FALSE(game.isOver());
}

TEST(Game, SingleDieRuleDisabled) {
	Game game(GameConfig{.singleDieRule = false});
	closeHighTiles(game);

	EXPECT_FALSE(game.snapshot().canUseSingleDie);
	EXPECT_THROW(game.roll(DiceCount::One), IllegalRollRequest);
	EXPECT_NO_THROW(game.roll(1u, 1u));
}

TEST(Game, SmallBoardAllowsSingleDie) {
	Game game(GameConfig{.maxTile = 6u});
	EXPECT_TRUE(game.snapshot().canUseSingleDie);

	const auto roll = game.roll(4u);
	EXPECT_EQ(roll.target, 4u);
}

TEST(Game, ForcedValuesOutOfRange) {
	Game game;
	EXPECT_THROW(game.roll(0u, 3u), IllegalRollRequest);
	EXPECT_THROW(game.roll(3u, 7u), IllegalRollRequest);

	closeHighTiles(game);
	EXPECT_THROW(game.roll(7u), IllegalRollRequest);
	EXPECT_THROW(game.roll(0u), IllegalRollRequest);
	EXPECT_EQ(game.snapshot().turn, 3u);
	EXPECT_FALSE(game.snapshot().pendingTarget.has_value());
}

TEST(Game, RollWhilePending) {
	Game game;
	game.roll(1u, 1u);
	EXPECT_THROW(game.roll(), IllegalRollRequest);
	EXPECT_THROW(game.roll(2u, 2u), IllegalRollRequest);
	EXPECT_EQ(game.snapshot().pendingTarget, 2u);
	EXPECT_EQ(game.snapshot().turn, 1u);
}

TEST(Game, IllegalMoves) {
	Game game;
	EXPECT_THROW(game.applyMove({3u}), IllegalMove); // No roll pending

	game.roll(1u, 2u);
	EXPECT_THROW(game.applyMove({4u}), IllegalMove);     // Wrong sum
	EXPECT_THROW(game.applyMove({1u, 1u, 1u}), IllegalMove); // Repeated tile
	EXPECT_THROW(game.applyMove({}), IllegalMove);       // Empty
	EXPECT_THROW(game.applyMove({0u, 3u}), IllegalMove); // Unknown tile
	EXPECT_EQ(game.snapshot().pendingTarget, 3u);        // Still waiting for a legal move

	game.applyMove({3u});
	game.roll(1u, 2u);
	EXPECT_THROW(game.applyMove({3u}), IllegalMove); // Closed tile
	EXPECT_NO_THROW(game.applyMove({1u, 2u}));
	EXPECT_THROW(game.applyMove({4u}), IllegalMove); // Turn already resolved
}

TEST(Game, NoLegalMoveEndsGame) {
	Game game;
	closeHighTiles(game);
	for (const Die die: {6u, 5u, 4u, 3u}) {
		game.roll(die);
		game.applyMove({die});
	}
	EXPECT_EQ(game.snapshot().openTiles, (std::vector<Tile>{1u, 2u}));

	const auto roll = game.roll(4u, 5u);
	EXPECT_EQ(roll.target, 9u);
	EXPECT_TRUE(game.legalMoves().empty());

	const auto state = game.snapshot();
	EXPECT_TRUE(state.over);
	EXPECT_EQ(state.score, 3u);
	EXPECT_FALSE(state.pendingTarget.has_value());
	ASSERT_TRUE(state.lastRoll.has_value());
	EXPECT_EQ(state.lastRoll->target, 9u);
	EXPECT_FALSE(state.canUseSingleDie);
}

TEST(Game, ClosingLastTileShutsTheBox) {
	Game game;
	closeHighTiles(game);
	game.roll(6u);
	game.applyMove({6u});
	game.roll(4u);
	game.applyMove({4u});
	game.roll(3u);
	game.applyMove({3u});
	game.roll(3u);
	game.applyMove({1u, 2u});
	EXPECT_EQ(game.snapshot().openTiles, (std::vector<Tile>{5u}));

	game.roll(5u);
	EXPECT_EQ(game.legalMoves(), (std::vector<Move>{{5u}}));
	const auto state = game.applyMove({5u});

	EXPECT_TRUE(state.over);
	EXPECT_EQ(state.score, 0u);
	EXPECT_TRUE(state.openTiles.empty());
}

TEST(Game, TerminalStateIsAbsorbing) {
	Game game(GameConfig{.maxTile = 1u});
	game.roll(1u);
	game.applyMove({1u});
	ASSERT_TRUE(game.isOver());
	EXPECT_EQ(game.score(), 0u);

	EXPECT_THROW(game.roll(), GameOver);
	EXPECT_THROW(game.roll(1u), GameOver);
	EXPECT_THROW(game.roll(1u, 1u), GameOver);
	EXPECT_THROW(game.applyMove({1u}), GameOver);

	Game stuck;
	stuck.roll(1u, 1u);
	stuck.applyMove({2u});
	stuck.roll(1u, 1u); // Only 2 would match
	ASSERT_TRUE(stuck.isOver());
	EXPECT_EQ(stuck.score(), 43u);
	EXPECT_THROW(stuck.roll(), GameOver);
	EXPECT_THROW(stuck.applyMove({1u, 1u}), GameOver);
	EXPECT_EQ(stuck.snapshot().turn, 2u);
}

TEST(Game, ErrorsShareBase) {
	Game game;
	EXPECT_THROW(game.applyMove({1u}), RuleViolation);
	EXPECT_THROW(game.roll(DiceCount::One), RuleViolation);
}

class SignalCounter : public IGameSignalListener {
public:
	void onGameEvent(GameSignal signal) override {
		if (signal == GS_Roll)
			++rolls;
		if (signal == GS_Close)
			++closes;
		if (signal == GS_GameOver)
			++gameOvers;
	}

	unsigned rolls{0};
	unsigned closes{0};
	unsigned gameOvers{0};
};

class DeltaCollector : public IGameStateListener {
public:
	void onGameDelta(const GameDelta& delta) override {
		deltas.push_back(delta);
	}

	std::vector<GameDelta> deltas;
};

TEST(Game, Listeners) {
	Game game(GameConfig{.maxTile = 3u});
	SignalCounter signals;
	SignalCounter closesOnly;
	DeltaCollector collector;
	game.subscribeSignals(&signals, GS_All);
	game.subscribeSignals(&closesOnly, GS_Close);
	game.subscribeState(&collector);

	game.roll(1u, 2u);
	game.applyMove({1u, 2u});
	game.roll(1u, 2u);
	game.applyMove({3u});

	EXPECT_EQ(signals.rolls, 2u);
	EXPECT_EQ(signals.closes, 2u);
	EXPECT_EQ(signals.gameOvers, 1u);
	EXPECT_EQ(closesOnly.rolls, 0u);
	EXPECT_EQ(closesOnly.closes, 2u);

	ASSERT_EQ(collector.deltas.size(), 4u);
	EXPECT_EQ(collector.deltas[0].action, GameAction::Roll);
	EXPECT_EQ(collector.deltas[0].legalMoves, (std::vector<Move>{{1u, 2u}, {3u}}));
	EXPECT_EQ(collector.deltas[1].action, GameAction::Close);
	EXPECT_EQ(collector.deltas[1].closed, (Move{1u, 2u}));
	EXPECT_EQ(collector.deltas[1].openAfter, (std::vector<bool>{false, false, true}));
	EXPECT_EQ(collector.deltas[1].score, 3u);
	EXPECT_TRUE(collector.deltas[3].over);
	EXPECT_EQ(collector.deltas[3].score, 0u);

	game.unsubscribeSignals(&signals);
	game.unsubscribeSignals(&closesOnly);
	game.unsubscribeState(&collector);
}

} // namespace shutbox::gtest
