#include "options.hpp"

#include "policy/policy.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <string_view>

namespace shutbox::app {

static constexpr std::string_view CMD_PLAY     = "play";
static constexpr std::string_view CMD_SIMULATE = "simulate";
static constexpr std::string_view CMD_HELP     = "help";

static constexpr std::string_view OPT_GAMES         = "--games";
static constexpr std::string_view OPT_EPISODES      = "--episodes";
static constexpr std::string_view OPT_POLICY        = "--policy";
static constexpr std::string_view OPT_WORKERS       = "--workers";
static constexpr std::string_view OPT_SEED          = "--seed";
static constexpr std::string_view OPT_MAX_TILE      = "--max-tile";
static constexpr std::string_view OPT_NO_SINGLE_DIE = "--no-single-die";

static constexpr std::string_view ALL_POLICIES = "all";

//! Largest board the exhaustive move search is meant for.
static constexpr Tile MAX_TILE_LIMIT = 20u;

template <class T>
static bool parseNumber(std::string_view value, T& out) {
	if (value.empty()) {
		return false;
	}
	const auto* begin    = value.data();
	const auto* end      = value.data() + value.size();
	T parsed             = 0;
	const auto [ptr, ec] = std::from_chars(begin, end, parsed);
	if (ec != std::errc() || ptr != end) {
		return false;
	}
	out = parsed;
	return true;
}

static bool isKnownPolicy(const std::string& name) {
	const auto names = policy::policyNames();
	return std::find(names.begin(), names.end(), name) != names.end();
}

static std::optional<Command> parsePlay(const std::vector<std::string>& args) {
	PlayOptions options{};

	for (std::size_t i = 1; i < args.size(); ++i) {
		const std::string_view key = args[i];
		if (key == OPT_NO_SINGLE_DIE) {
			options.singleDieRule = false;
			continue;
		}
		if (i + 1 >= args.size()) {
			return {};
		}
		const std::string_view value = args[++i];

		if (key == OPT_GAMES) {
			if (!parseNumber(value, options.games) || options.games == 0u) {
				return {};
			}
		} else if (key == OPT_POLICY) {
			options.policy = std::string(value);
			if (!isKnownPolicy(options.policy)) {
				return {};
			}
		} else if (key == OPT_SEED) {
			uint64_t seed = 0;
			if (!parseNumber(value, seed)) {
				return {};
			}
			options.seed = seed;
		} else if (key == OPT_MAX_TILE) {
			if (!parseNumber(value, options.maxTile) || options.maxTile < 1u || options.maxTile > MAX_TILE_LIMIT) {
				return {};
			}
		} else {
			return {};
		}
	}

	return options;
}

static std::optional<Command> parseSimulate(const std::vector<std::string>& args) {
	SimulateOptions options{};
	auto& config = options.config;

	for (std::size_t i = 1; i < args.size(); ++i) {
		const std::string_view key = args[i];
		if (key == OPT_NO_SINGLE_DIE) {
			config.singleDieRule = false;
			continue;
		}
		if (i + 1 >= args.size()) {
			return {};
		}
		const std::string_view value = args[++i];

		if (key == OPT_EPISODES) {
			if (!parseNumber(value, config.episodes) || config.episodes == 0u) {
				return {};
			}
		} else if (key == OPT_POLICY) {
			config.policies.clear();
			if (value != ALL_POLICIES) {
				if (!isKnownPolicy(std::string(value))) {
					return {};
				}
				config.policies.emplace_back(value);
			}
		} else if (key == OPT_WORKERS) {
			if (!parseNumber(value, config.workers) || config.workers == 0u) {
				return {};
			}
		} else if (key == OPT_SEED) {
			uint64_t seed = 0;
			if (!parseNumber(value, seed)) {
				return {};
			}
			config.seed = seed;
		} else if (key == OPT_MAX_TILE) {
			if (!parseNumber(value, config.maxTile) || config.maxTile < 1u || config.maxTile > MAX_TILE_LIMIT) {
				return {};
			}
		} else {
			return {};
		}
	}

	return options;
}

std::optional<Command> parseArguments(const std::vector<std::string>& args) {
	if (args.empty() || args.front() == CMD_HELP || args.front() == "--help" || args.front() == "-h") {
		return HelpOptions{};
	}

	if (args.front() == CMD_PLAY) {
		return parsePlay(args);
	}
	if (args.front() == CMD_SIMULATE) {
		return parseSimulate(args);
	}

	return {};
}

std::string usage() {
	std::string names;
	for (const auto& name: policy::policyNames()) {
		names += names.empty() ? name : "|" + name;
	}

	return std::format("Usage:\n"
	                   "  shutbox play     [--games N] [--policy {0}] [--seed S] [--max-tile M] [--no-single-die]\n"
	                   "  shutbox simulate [--episodes N] [--policy {0}|all] [--workers W] [--seed S] [--max-tile M] [--no-single-die]\n"
	                   "  shutbox help\n",
	                   names);
}

} // namespace shutbox::app
