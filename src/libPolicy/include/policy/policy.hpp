#pragma once

#include "core/snapshot.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace shutbox::policy {

//! Picks one of the legal moves for the current state.
//! \note Policies throw std::invalid_argument for an empty move list.
using Policy = std::function<Move(const GameSnapshot& state, const std::vector<Move>& legalMoves)>;

//! Uniformly random choice. The policy owns its generator.
Policy makeRandomPolicy(uint64_t seed);

//! Fewest tiles first. Ties go to the move with the higher top tile.
Move greedyMove(const GameSnapshot& state, const std::vector<Move>& legalMoves);

//! Lowest open tile sum after the move. Ties go to fewer tiles, then to the first move.
Move minScoreMove(const GameSnapshot& state, const std::vector<Move>& legalMoves);

//! Prefer closing two or more tiles with the lowest remaining sum. Falls back to greedy.
Move humanMove(const GameSnapshot& state, const std::vector<Move>& legalMoves);

//! Returns the open tile sum left after applying move to state.
unsigned remainingSumAfter(const GameSnapshot& state, const Move& move);

//! Names accepted by policyFromName.
std::vector<std::string> policyNames();

//! Returns the policy registered under name. Seed is used by policies with random choices.
std::optional<Policy> policyFromName(const std::string& name, uint64_t seed);

} // namespace shutbox::policy
