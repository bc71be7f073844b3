#include "core/randomDice.hpp"

namespace shutbox {

static std::mt19937 makeEngine(const std::optional<uint64_t> seed) {
	if (seed) {
		std::seed_seq seq{static_cast<uint32_t>(*seed), static_cast<uint32_t>(*seed >> 32u)};
		return std::mt19937(seq);
	}

	std::random_device device;
	return std::mt19937(device());
}

RandomDice::RandomDice(const std::optional<uint64_t> seed) : m_engine{makeEngine(seed)} {
}

Die RandomDice::throwDie() {
	return m_distribution(m_engine);
}

} // namespace shutbox
