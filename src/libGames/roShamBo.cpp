#include "games/roShamBo.hpp"

#include <format>
#include <utility>

namespace turnkit::roShamBo {

//! Returns the choice that loses against the input choice.
static constexpr Choice beatenBy(const Choice choice) {
	switch (choice) {
	case Choice::Rock:
		return Choice::Scissors;
	case Choice::Paper:
		return Choice::Rock;
	case Choice::Scissors:
		return Choice::Paper;
	}
	return Choice::Rock;
}

std::strong_ordering compare(const Choice lhs, const Choice rhs) {
	if (lhs == rhs) {
		return std::strong_ordering::equal;
	}
	return beatenBy(lhs) == rhs ? std::strong_ordering::greater : std::strong_ordering::less;
}

std::string_view toString(const Choice choice) {
	switch (choice) {
	case Choice::Rock:
		return "Rock";
	case Choice::Paper:
		return "Paper";
	case Choice::Scissors:
		return "Scissors";
	}
	return "Unknown";
}

Outcome decide(const Choice player1, const Choice player2) {
	const auto order = compare(player1, player2);
	if (order == std::strong_ordering::greater) {
		return Outcome::Win;
	}
	if (order == std::strong_ordering::less) {
		return Outcome::Loss;
	}
	return Outcome::Tie;
}

std::string describe(const Choice player1, const Choice player2) {
	switch (decide(player1, player2)) {
	case Outcome::Tie:
		return std::format("{} ties with {}.", toString(player1), toString(player2));
	case Outcome::Win:
		return std::format("{} beats {}.", toString(player1), toString(player2));
	case Outcome::Loss:
		return std::format("{} beats {}.", toString(player2), toString(player1));
	}
	return {};
}

RoShamBo::RoShamBo(const Choice player1, const Choice player2) : m_player1{player1}, m_player2{player2} {
}

RoShamBo::Coroutine RoShamBo::play(Context<RoShamBo> ctx) {
	// Count down to the reveal of both choices.
	// Messages are built outside the co_await operand. GCC 12 mishandles aggregate temporaries there.
	Msg ro{"Ro!"};
	co_await ctx.yieldEvent(std::move(ro));
	Msg sham{"Sham!"};
	co_await ctx.yieldEvent(std::move(sham));
	Msg bo{"Bo!"};
	co_await ctx.yieldEvent(std::move(bo));

	const auto game    = ctx.host.game();
	const auto outcome = decide(game.player1(), game.player2());

	Msg reveal{describe(game.player1(), game.player2())};
	co_await ctx.yieldEvent(std::move(reveal));
	co_return outcome;
}

void RoShamBo::handleEvent(Msg&) {
	++m_announcements;
}

Choice RoShamBo::player1() const {
	return m_player1;
}

Choice RoShamBo::player2() const {
	return m_player2;
}

unsigned RoShamBo::announcements() const {
	return m_announcements;
}

} // namespace turnkit::roShamBo
