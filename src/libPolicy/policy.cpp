#include "policy/policy.hpp"

#include <algorithm>
#include <memory>
#include <random>
#include <stdexcept>

namespace shutbox::policy {

static constexpr char RANDOM[]   = "random";
static constexpr char GREEDY[]   = "greedy";
static constexpr char MINSCORE[] = "minscore";
static constexpr char HUMAN[]    = "human";

static void requireMoves(const std::vector<Move>& legalMoves) {
	if (legalMoves.empty()) {
		throw std::invalid_argument("Policy needs at least one legal move.");
	}
}

unsigned remainingSumAfter(const GameSnapshot& state, const Move& move) {
	const auto closed = moveSum(move);
	return closed > state.score ? 0u : state.score - closed;
}

Policy makeRandomPolicy(const uint64_t seed) {
	// Shared so copies of the policy keep drawing from the same sequence.
	auto engine = std::make_shared<std::mt19937_64>(seed);

	return [engine](const GameSnapshot&, const std::vector<Move>& legalMoves) {
		requireMoves(legalMoves);
		std::uniform_int_distribution<std::size_t> pick(0u, legalMoves.size() - 1u);
		return legalMoves[pick(*engine)];
	};
}

Move greedyMove(const GameSnapshot&, const std::vector<Move>& legalMoves) {
	requireMoves(legalMoves);

	const auto better = [](const Move& a, const Move& b) {
		if (a.size() != b.size()) {
			return a.size() < b.size();
		}
		return *std::max_element(a.begin(), a.end()) > *std::max_element(b.begin(), b.end());
	};
	return *std::min_element(legalMoves.begin(), legalMoves.end(), better);
}

Move minScoreMove(const GameSnapshot& state, const std::vector<Move>& legalMoves) {
	requireMoves(legalMoves);

	const Move* best = nullptr;
	unsigned bestScore = 0;
	for (const auto& move: legalMoves) {
		const auto score = remainingSumAfter(state, move);
		if (!best || score < bestScore || (score == bestScore && move.size() < best->size())) {
			best      = &move;
			bestScore = score;
		}
	}
	return *best;
}

Move humanMove(const GameSnapshot& state, const std::vector<Move>& legalMoves) {
	requireMoves(legalMoves);

	const Move* best = nullptr;
	unsigned bestScore = 0;
	for (const auto& move: legalMoves) {
		if (move.size() < 2u) {
			continue;
		}
		const auto score = remainingSumAfter(state, move);
		if (!best || score < bestScore) {
			best      = &move;
			bestScore = score;
		}
	}
	return best ? *best : greedyMove(state, legalMoves);
}

std::vector<std::string> policyNames() {
	return {RANDOM, GREEDY, MINSCORE, HUMAN};
}

std::optional<Policy> policyFromName(const std::string& name, const uint64_t seed) {
	if (name == RANDOM) {
		return makeRandomPolicy(seed);
	}
	if (name == GREEDY) {
		return Policy{greedyMove};
	}
	if (name == MINSCORE) {
		return Policy{minScoreMove};
	}
	if (name == HUMAN) {
		return Policy{humanMove};
	}
	return {};
}

} // namespace shutbox::policy
