#include "Logging.hpp"
#include "options.hpp"

#include "core/errors.hpp"
#include "core/game.hpp"
#include "policy/policy.hpp"
#include "sim/simulator.hpp"
#include "sim/stepRecorder.hpp"

#include <format>
#include <iostream>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace shutbox::app {

//! Tiles separated by spaces, closed tiles as 'X'.
static std::string tilesToString(const std::string& key, const Tile maxTile) {
	std::string out;
	std::size_t pos = 0;
	for (Tile tile = 1u; tile <= maxTile; ++tile) {
		if (!out.empty()) {
			out.push_back(' ');
		}
		if (key[pos] == 'X') {
			out.push_back('X');
			++pos;
		} else {
			const auto digits = std::to_string(tile);
			out += digits;
			pos += digits.size();
		}
	}
	return out;
}

static int play(const PlayOptions& options) {
	const auto seed = options.seed ? *options.seed : static_cast<uint64_t>(std::random_device{}());
	auto logger     = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[App] Playing {} games with policy '{}' (seed {}).", options.games, options.policy, seed));

	for (unsigned i = 0; i < options.games; ++i) {
		const auto config = GameConfig{.maxTile = options.maxTile, .singleDieRule = options.singleDieRule, .seed = seed + 2u * i};
		const auto picker = policy::policyFromName(options.policy, seed + 2u * i + 1u);
		if (!picker) {
			std::cerr << std::format("Unknown policy '{}'.\n", options.policy);
			return 1;
		}

		sim::StepRecorder recorder;
		const auto result = sim::playEpisode(config, *picker, &recorder);

		std::cout << std::format("\n=== New Game (policy={}) ===\n", options.policy);
		for (const auto& step: recorder.steps()) {
			const auto move = step.chosen ? sim::moveToString(*step.chosen) : std::string("-");
			std::cout << std::format("Step {:>2} | Roll: {:>2} | Move: {:<5} | Tiles: {} | Score: {}\n", step.step, step.roll, move,
			                         tilesToString(step.tilesAfter, options.maxTile), step.scoreAfter);
		}
		std::cout << std::format("Game over! Final score = {}{}\n", result.score, result.score == 0u ? " (shut the box)" : "");
	}

	return 0;
}

static int simulate(const SimulateOptions& options) {
	const auto summaries = sim::runSimulation(options.config);
	if (summaries.empty()) {
		return 1;
	}

	std::cout << "\n=== Strategy Performance Summary (lower score is better) ===\n";
	std::cout << std::format("{:<10} {:>8} {:>8} {:>8} {:>7} {:>5} {:>5} {:>5} {:>5} {:>4} {:>4} {:>9}\n", "strategy", "runs", "mean", "std", "median",
	                         "p10", "p25", "p75", "p90", "min", "max", "shutout%");
	for (const auto& s: summaries) {
		std::cout << std::format("{:<10} {:>8} {:>8.3f} {:>8.3f} {:>7.1f} {:>5.0f} {:>5.0f} {:>5.0f} {:>5.0f} {:>4} {:>4} {:>9.2f}\n", s.strategy,
		                         s.runs, s.mean, s.stdDev, s.median, s.p10, s.p25, s.p75, s.p90, s.min, s.max, 100.0 * s.shutoutRate);
	}

	const auto& best = summaries.front();
	std::cout << std::format("\nBest strategy: {} with mean score {:.2f} over {} games (10th-90th percentile: {:.0f}-{:.0f}).\n", best.strategy,
	                         best.mean, best.runs, best.p10, best.p90);
	return 0;
}

struct CommandRunner {
	int operator()(const PlayOptions& options) const {
		return play(options);
	}
	int operator()(const SimulateOptions& options) const {
		return simulate(options);
	}
	int operator()(const HelpOptions&) const {
		std::cout << usage();
		return 0;
	}
};

} // namespace shutbox::app

int main(int argc, char** argv) {
	using namespace shutbox::app;

	const std::vector<std::string> args(argv + 1, argv + argc);
	const auto command = parseArguments(args);
	if (!command) {
		std::cerr << usage();
		return 1;
	}

	try {
		return std::visit(CommandRunner{}, *command);
	} catch (const shutbox::RuleViolation& e) {
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Error, std::format("[App] Policy made an illegal request: {}", e.what()));
		std::cerr << std::format("Error: {}\n", e.what());
	} catch (const std::exception& e) {
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Error, std::format("[App] {}", e.what()));
		std::cerr << std::format("Error: {}\n", e.what());
	}
	return 1;
}
