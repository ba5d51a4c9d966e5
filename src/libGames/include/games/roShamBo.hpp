#pragma once

#include "turnkit/host.hpp"

#include <compare>
#include <string>
#include <string_view>

namespace turnkit::roShamBo {

enum class Choice { Rock, Paper, Scissors };

//! Cyclic comparison. Rock beats Scissors, Scissors beats Paper, Paper beats Rock.
std::strong_ordering compare(Choice lhs, Choice rhs);

std::string_view toString(Choice choice);

//! Announcement made during the game.
struct Msg {
	std::string text;

	bool operator==(const Msg&) const = default;
};

//! Result relative to player one.
enum class Outcome {
	Tie,  //!< Both players picked the same choice.
	Win,  //!< Player one beats player two.
	Loss, //!< Player two beats player one.
};

//! Resuming the game needs no player input. The countdown runs on its own.
struct NoInput {};

//! Both players picked before the game starts. The game counts down and reveals the winner.
class RoShamBo : public Play<Msg, NoInput, Outcome> {
public:
	RoShamBo(Choice player1, Choice player2);

	static Coroutine play(Context<RoShamBo> ctx);

	//! Counts every announcement made.
	void handleEvent(Msg& event);

	Choice player1() const;
	Choice player2() const;
	unsigned announcements() const; //!< Number of events processed so far.

private:
	Choice m_player1;
	Choice m_player2;
	unsigned m_announcements{0u};
};

//! Outcome for player one.
Outcome decide(Choice player1, Choice player2);

//! Text of the final announcement, e.g. "Rock beats Scissors.".
std::string describe(Choice player1, Choice player2);

} // namespace turnkit::roShamBo
