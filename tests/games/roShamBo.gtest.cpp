#include "games/roShamBo.hpp"

#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

namespace turnkit::gtest {

using roShamBo::Choice;
using roShamBo::Msg;
using roShamBo::Outcome;
using roShamBo::RoShamBo;

// Drive a full game with five resumes.
static void expectGame(Choice player1, Choice player2, const std::string& expectedMsg, Outcome expectedOutcome) {
	SCOPED_TRACE(expectedMsg);

	const Host host{RoShamBo{player1, player2}};
	auto coroutine = host.play();

	using State = RoShamBo::Coroutine::State;
	EXPECT_EQ(coroutine.resume(), State{Yielded<Msg>{Msg{"Ro!"}}});
	EXPECT_EQ(coroutine.resume(), State{Yielded<Msg>{Msg{"Sham!"}}});
	EXPECT_EQ(coroutine.resume(), State{Yielded<Msg>{Msg{"Bo!"}}});
	EXPECT_EQ(coroutine.resume(), State{Yielded<Msg>{Msg{expectedMsg}}});
	EXPECT_EQ(coroutine.resume(), State{Complete<Outcome>{expectedOutcome}});
	EXPECT_TRUE(coroutine.isDone());

	EXPECT_EQ(host.game().announcements(), 4u);
}

TEST(RoShamBo, AllPairings) {
	expectGame(Choice::Rock, Choice::Rock, "Rock ties with Rock.", Outcome::Tie);
	expectGame(Choice::Rock, Choice::Paper, "Paper beats Rock.", Outcome::Loss);
	expectGame(Choice::Rock, Choice::Scissors, "Rock beats Scissors.", Outcome::Win);
	expectGame(Choice::Paper, Choice::Rock, "Paper beats Rock.", Outcome::Win);
	expectGame(Choice::Paper, Choice::Paper, "Paper ties with Paper.", Outcome::Tie);
	expectGame(Choice::Paper, Choice::Scissors, "Scissors beats Paper.", Outcome::Loss);
	expectGame(Choice::Scissors, Choice::Rock, "Rock beats Scissors.", Outcome::Loss);
	expectGame(Choice::Scissors, Choice::Paper, "Scissors beats Paper.", Outcome::Win);
	expectGame(Choice::Scissors, Choice::Scissors, "Scissors ties with Scissors.", Outcome::Tie);
}

TEST(RoShamBo, CyclicCompare) {
	EXPECT_EQ(roShamBo::compare(Choice::Rock, Choice::Scissors), std::strong_ordering::greater);
	EXPECT_EQ(roShamBo::compare(Choice::Scissors, Choice::Paper), std::strong_ordering::greater);
	EXPECT_EQ(roShamBo::compare(Choice::Paper, Choice::Rock), std::strong_ordering::greater);
	EXPECT_EQ(roShamBo::compare(Choice::Scissors, Choice::Rock), std::strong_ordering::less);
	EXPECT_EQ(roShamBo::compare(Choice::Paper, Choice::Paper), std::strong_ordering::equal);
}

TEST(RoShamBo, ChoicesReadableWhilePaused) {
	const Host host{RoShamBo{Choice::Paper, Choice::Rock}};
	auto coroutine = host.play();
	coroutine.resume();

	const auto game = host.game();
	EXPECT_EQ(game.player1(), Choice::Paper);
	EXPECT_EQ(game.player2(), Choice::Rock);
	EXPECT_EQ(game.announcements(), 1u);
}

TEST(RoShamBo, SecondPlayRefused) {
	const Host host{RoShamBo{Choice::Rock, Choice::Rock}};
	auto coroutine = host.play();

	try {
		auto second = host.play();
		FAIL() << "Second run was started.";
	} catch (const PlayError& e) {
		EXPECT_EQ(e.kind(), PlayError::Kind::AlreadyStarted);
	}
}

TEST(RoShamBo, ReplayedAnnouncementMatchesInBand) {
	const Host played{RoShamBo{Choice::Rock, Choice::Paper}};
	auto coroutine = played.play();
	coroutine.resume();

	const Host replayed{RoShamBo{Choice::Rock, Choice::Paper}};
	Msg msg{"Ro!"};
	replayed.processEvent(msg);

	EXPECT_EQ(msg.text, "Ro!");
	EXPECT_EQ(replayed.game().announcements(), played.game().announcements());
}

} // namespace turnkit::gtest
