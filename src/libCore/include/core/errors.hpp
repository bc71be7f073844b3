#pragma once

#include <stdexcept>
#include <string>

namespace shutbox {

//! Base of all rule violations raised by the game. The game state is unchanged when one is thrown.
class RuleViolation : public std::logic_error {
public:
	using std::logic_error::logic_error;
};

//! Wrong dice count for the current tiles, a roll while one is pending or forced values outside [1, 6].
class IllegalRollRequest : public RuleViolation {
public:
	using RuleViolation::RuleViolation;
};

//! Move with closed, unknown or repeated tiles, with the wrong sum or without a pending roll.
class IllegalMove : public RuleViolation {
public:
	using RuleViolation::RuleViolation;
};

//! Any roll or move after the game ended.
class GameOver : public RuleViolation {
public:
	using RuleViolation::RuleViolation;
};

} // namespace shutbox
