#pragma once

#include "core/IDice.hpp"

#include <cstdint>
#include <optional>
#include <random>

namespace shutbox {

//! Fair six sided die backed by a generator owned by this instance.
class RandomDice : public IDice {
public:
	//! Seeded for reproducible throws. Without seed the generator is seeded from std::random_device.
	explicit RandomDice(std::optional<uint64_t> seed = std::nullopt);

	Die throwDie() override;

private:
	std::mt19937 m_engine;
	std::uniform_int_distribution<Die> m_distribution{DIE_MIN, DIE_MAX};
};

} // namespace shutbox
