#include "sim/stepRecorder.hpp"

#include <cassert>

namespace shutbox::sim {

std::string tilesToKey(const std::vector<bool>& open) {
	std::string key;
	key.reserve(open.size());
	for (std::size_t i = 0; i < open.size(); ++i) {
		key += open[i] ? std::to_string(i + 1u) : std::string("X");
	}
	return key;
}

std::string moveToString(const Move& move) {
	if (move.empty()) {
		return "-";
	}

	std::string out;
	for (std::size_t i = 0; i < move.size(); ++i) {
		if (i) {
			out.push_back('+');
		}
		out += std::to_string(move[i]);
	}
	return out;
}

void StepRecorder::onGameDelta(const GameDelta& delta) {
	switch (delta.action) {
	case GameAction::Roll: {
		assert(delta.roll);
		const auto key = tilesToKey(delta.openBefore);
		m_steps.push_back(StepRecord{
		        .step        = static_cast<unsigned>(m_steps.size()),
		        .roll        = delta.roll->target,
		        .dice        = delta.roll->dice,
		        .tilesBefore = key,
		        .legalMoves  = delta.legalMoves,
		        .chosen      = std::nullopt,
		        .tilesAfter  = key,
		        .scoreAfter  = delta.score,
		        .terminal    = delta.over,
		});
		break;
	}
	case GameAction::Close: {
		if (m_steps.empty()) {
			// Subscribed in the middle of a turn.
			return;
		}
		auto& step      = m_steps.back();
		step.chosen     = delta.closed;
		step.tilesAfter = tilesToKey(delta.openAfter);
		step.scoreAfter = delta.score;
		step.terminal   = delta.over;
		break;
	}
	}
}

const std::vector<StepRecord>& StepRecorder::steps() const {
	return m_steps;
}

void StepRecorder::clear() {
	m_steps.clear();
}

} // namespace shutbox::sim
