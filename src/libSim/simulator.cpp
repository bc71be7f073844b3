#include "sim/simulator.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <random>
#include <stdexcept>
#include <thread>

namespace shutbox::sim {

//! Spread a base seed over episodes and streams (dice, policy).
static uint64_t deriveSeed(uint64_t base, uint64_t episode, uint64_t stream) {
	uint64_t z = base + 0x9E3779B97F4A7C15ULL * (2u * episode + stream + 1u);
	z          = (z ^ (z >> 30u)) * 0xBF58476D1CE4E5B9ULL;
	z          = (z ^ (z >> 27u)) * 0x94D049BB133111EBULL;
	return z ^ (z >> 31u);
}

DiceCount chooseDiceCount(const GameSnapshot& state) {
	return state.canUseSingleDie ? DiceCount::One : DiceCount::Two;
}

EpisodeResult playEpisode(Game& game, const policy::Policy& policy) {
	while (!game.isOver()) {
		game.roll(chooseDiceCount(game.snapshot()));
		if (game.isOver()) {
			break;
		}

		const auto moves = game.legalMoves();
		game.applyMove(policy(game.snapshot(), moves));
	}

	const auto state = game.snapshot();
	return EpisodeResult{.score = state.score, .turns = state.turn};
}

EpisodeResult playEpisode(const GameConfig& config, const policy::Policy& policy, StepRecorder* recorder) {
	Game game(config);
	if (recorder) {
		game.subscribeState(recorder);
	}

	const auto result = playEpisode(game, policy);

	if (recorder) {
		game.unsubscribeState(recorder);
	}
	return result;
}

std::vector<unsigned> simulateScores(const SimulationConfig& config, const std::string& policyName, const uint64_t seed) {
	if (!policy::policyFromName(policyName, seed)) {
		throw std::invalid_argument(std::format("Unknown policy '{}'.", policyName));
	}

	std::vector<unsigned> scores(config.episodes, 0u);
	const auto workers = static_cast<std::size_t>(std::max(1u, config.workers));

	// Worker w plays episodes w, w + workers, ... and only writes its own score slots.
	auto work = [&](const std::size_t worker) {
		for (std::size_t episode = worker; episode < config.episodes; episode += workers) {
			const auto gameConfig = GameConfig{
			        .maxTile       = config.maxTile,
			        .singleDieRule = config.singleDieRule,
			        .seed          = deriveSeed(seed, episode, 0u),
			};
			const auto picker = *policy::policyFromName(policyName, deriveSeed(seed, episode, 1u));
			scores[episode]   = playEpisode(gameConfig, picker).score;
		}
	};

	if (workers == 1u) {
		work(0u);
		return scores;
	}

	std::vector<std::exception_ptr> errors(workers);
	std::vector<std::thread> threads;
	threads.reserve(workers);
	for (std::size_t w = 0; w < workers; ++w) {
		threads.emplace_back([&, w] {
			try {
				work(w);
			} catch (...) {
				errors[w] = std::current_exception();
			}
		});
	}
	for (auto& thread: threads) {
		thread.join();
	}

	for (const auto& error: errors) {
		if (error) {
			std::rethrow_exception(error);
		}
	}
	return scores;
}

std::vector<ScoreSummary> runSimulation(const SimulationConfig& config) {
	const auto names = config.policies.empty() ? policy::policyNames() : config.policies;
	const auto seed  = config.seed ? *config.seed : static_cast<uint64_t>(std::random_device{}());

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[Simulator] Running {} episodes for {} policies on {} workers (seed {}).", config.episodes,
	                                                names.size(), std::max(1u, config.workers), seed));

	std::vector<ScoreSummary> summaries;
	summaries.reserve(names.size());
	for (const auto& name: names) {
		const auto start  = std::chrono::steady_clock::now();
		const auto scores = simulateScores(config, name, seed);
		const auto ms     = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

		summaries.push_back(summarize(name, scores));
		logger.Log(Logging::LogLevel::Info, std::format("[Simulator] Policy '{}' done in {} ms. Mean score {:.3f}.", name, ms.count(),
		                                                summaries.back().mean));
	}

	std::stable_sort(summaries.begin(), summaries.end(), [](const ScoreSummary& a, const ScoreSummary& b) { return a.mean < b.mean; });
	return summaries;
}

} // namespace shutbox::sim
