#pragma once

#include "core/config.hpp"
#include "core/game.hpp"
#include "core/snapshot.hpp"
#include "policy/policy.hpp"
#include "sim/statistics.hpp"
#include "sim/stepRecorder.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shutbox::sim {

struct EpisodeResult {
	unsigned score; //!< Final score of the game.
	unsigned turns; //!< Number of rolls made.
};

//! Setup of a batch of simulated games.
struct SimulationConfig {
	Tile maxTile{DEFAULT_MAX_TILE};
	bool singleDieRule{true};
	std::vector<std::string> policies{}; //!< Policy names. All known policies if empty.
	std::size_t episodes{1000};          //!< Games per policy.
	unsigned workers{1};                 //!< Threads playing games in parallel.
	std::optional<uint64_t> seed{};      //!< Base seed. Random if empty.
};

//! Dice count used by the simulated player: one die as soon as the rules allow it.
DiceCount chooseDiceCount(const GameSnapshot& state);

//! Play game until it is over, picking moves with policy.
//! \throws RuleViolation If the policy picks a move the game rejects.
EpisodeResult playEpisode(Game& game, const policy::Policy& policy);

//! Play one new game. Records every step into recorder if given.
EpisodeResult playEpisode(const GameConfig& config, const policy::Policy& policy, StepRecorder* recorder = nullptr);

//! Final scores of episodes games played with the named policy.
//! Episode i uses seeds derived from seed and i only, so the result does not depend on the worker count.
//! \throws std::invalid_argument Unknown policy name.
std::vector<unsigned> simulateScores(const SimulationConfig& config, const std::string& policyName, uint64_t seed);

//! Run all configured policies and summarize them. Sorted by mean score, best first.
std::vector<ScoreSummary> runSimulation(const SimulationConfig& config);

} // namespace shutbox::sim
