#pragma once

#include "core/types.hpp"
#include "sim/simulator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace shutbox::app {

//! Play a few games and print every step.
struct PlayOptions {
	unsigned games{2};
	std::string policy{"greedy"};
	std::optional<uint64_t> seed{};
	Tile maxTile{DEFAULT_MAX_TILE};
	bool singleDieRule{true};
};

//! Simulate many games and print score statistics per policy.
struct SimulateOptions {
	sim::SimulationConfig config{};
};

struct HelpOptions {};

using Command = std::variant<PlayOptions, SimulateOptions, HelpOptions>;

//! Parse command line arguments without the program name. Returns empty on invalid input.
std::optional<Command> parseArguments(const std::vector<std::string>& args);

//! Usage text of the command line interface.
std::string usage();

} // namespace shutbox::app
