#include "counterGame.hpp"

#include "turnkit/errors.hpp"
#include "turnkit/host.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace turnkit::gtest {

//! Remembers whether its body started running.
struct Probe : public Play<int, int, int> {
	bool entered{false};

	static Coroutine play(Context<Probe> ctx);
};

//! Keeps a transaction open across a yield.
struct GuardAcrossYield : public Play<int, int, int> {
	static Coroutine play(Context<GuardAcrossYield> ctx);
};

//! Opens a transaction from inside another one.
struct NestedTransaction : public Play<int, int, int> {
	static Coroutine play(Context<NestedTransaction> ctx);
};

//! Fails with its own exception after the first turn.
struct Failing : public Play<int, int, int> {
	static Coroutine play(Context<Failing> ctx);
};

struct NoInput {};

//! Yields a default event and has no event hook of its own.
struct Greeter : public Play<std::string, NoInput, int> {
	static Coroutine play(Context<Greeter> ctx);
};

Probe::Coroutine Probe::play(Context<Probe> ctx) {
	ctx.host.withGameMut([](Probe& game) { game.entered = true; });
	co_await ctx.yieldEvent(1);
	co_return 2;
}

GuardAcrossYield::Coroutine GuardAcrossYield::play(Context<GuardAcrossYield> ctx) {
	const auto guard = ctx.host.borrowGameMut();
	co_await ctx.yieldEvent(1);
	co_return 0;
}

NestedTransaction::Coroutine NestedTransaction::play(Context<NestedTransaction> ctx) {
	ctx.host.withGame([&](const NestedTransaction&) { ctx.host.withGameMut([](NestedTransaction&) {}); });
	co_await ctx.yieldEvent(1);
	co_return 0;
}

Failing::Coroutine Failing::play(Context<Failing> ctx) {
	co_await ctx.yieldEvent(1);
	throw std::runtime_error("rules violated");
}

Greeter::Coroutine Greeter::play(Context<Greeter> ctx) {
	co_await ctx.yieldDefault();
	std::string greeting{"hello"};
	co_await ctx.yieldEvent(std::move(greeting));
	co_return 1;
}

//! Sequence of events and the outcome of a Counter run.
struct Transcript {
	std::vector<int> events;
	int outcome{0};

	bool operator==(const Transcript&) const = default;
};

static Transcript runCounter(const std::vector<int>& inputs) {
	Host host{Counter{}};
	auto coroutine = host.play();

	Transcript transcript;
	for (const int input: inputs) {
		const auto state = coroutine.resume(input);
		if (const auto* yielded = std::get_if<Yielded<int>>(&state)) {
			transcript.events.push_back(yielded->event);
		} else {
			transcript.outcome = std::get<Complete<int>>(state).outcome;
		}
	}
	EXPECT_TRUE(coroutine.isDone());
	return transcript;
}

TEST(Coroutine, BodyStartsOnFirstResume) {
	Host host{Probe{}};
	auto coroutine = host.play();
	EXPECT_FALSE(host.game().entered);
	EXPECT_FALSE(coroutine.isDone());

	EXPECT_EQ(coroutine.resume(), Probe::Coroutine::State{Yielded<int>{1}});
	EXPECT_TRUE(host.game().entered);

	EXPECT_EQ(coroutine.resume(), Probe::Coroutine::State{Complete<int>{2}});
	EXPECT_TRUE(coroutine.isDone());
}

TEST(Coroutine, InputsReachBodyInOrder) {
	Host host{Counter{}};
	auto coroutine = host.play();

	// The first input has no pending yield to receive it.
	EXPECT_EQ(coroutine.resume(99), Counter::Coroutine::State{Yielded<int>{0 + Counter::EventTag}});
	EXPECT_EQ(coroutine.resume(5), Counter::Coroutine::State{Yielded<int>{5 + Counter::EventTag}});
	EXPECT_EQ(coroutine.resume(7), Counter::Coroutine::State{Yielded<int>{12 + Counter::EventTag}});
	EXPECT_EQ(coroutine.resume(1), Counter::Coroutine::State{Complete<int>{13}});

	const auto game = host.game();
	EXPECT_EQ(game.value, 13);
	EXPECT_EQ(game.handled, 3);
	EXPECT_EQ(game.lastSeen, 12);
}

TEST(Coroutine, Deterministic) {
	const std::vector<int> inputs{0, 3, -1, 4};

	const auto first  = runCounter(inputs);
	const auto second = runCounter(inputs);
	EXPECT_EQ(first, second);
	EXPECT_EQ(first.events, (std::vector<int>{1000, 1003, 1002}));
	EXPECT_EQ(first.outcome, 6);
}

TEST(Coroutine, CompletesWithoutYield) {
	Counter silent{};
	silent.rounds = 0;

	Host host{silent};
	auto coroutine = host.play();
	EXPECT_EQ(coroutine.resume(0), Counter::Coroutine::State{Complete<int>{0}});
	EXPECT_EQ(host.game().handled, 0);
}

TEST(Coroutine, ResumeAfterCompletionThrows) {
	Host host{Probe{}};
	auto coroutine = host.play();
	coroutine.resume();
	coroutine.resume();
	ASSERT_TRUE(coroutine.isDone());

	EXPECT_THROW(coroutine.resume(), ResumeError);
}

TEST(Coroutine, MovedFromThrows) {
	Host host{Probe{}};
	auto coroutine = host.play();
	auto moved     = std::move(coroutine);

	EXPECT_THROW(coroutine.resume(), ResumeError);
	EXPECT_TRUE(coroutine.isDone());
	EXPECT_EQ(moved.resume(), Probe::Coroutine::State{Yielded<int>{1}});

	Probe::Coroutine empty;
	EXPECT_THROW(empty.resume(), ResumeError);
}

TEST(Coroutine, RaisedEventBeforeHook) {
	Host host{Counter{}};
	auto coroutine = host.play();
	EXPECT_FALSE(coroutine.raisedEvent().has_value());

	coroutine.resume(0);
	EXPECT_EQ(coroutine.raisedEvent(), 0);
	EXPECT_EQ(coroutine.resume(3), Counter::Coroutine::State{Yielded<int>{3 + Counter::EventTag}});
	EXPECT_EQ(coroutine.raisedEvent(), 3);

	Probe::Coroutine empty;
	EXPECT_FALSE(empty.raisedEvent().has_value());
}

TEST(Coroutine, DriverTransactsWhilePaused) {
	Host host{Counter{}};
	auto coroutine = host.play();
	coroutine.resume(0);

	// No transaction is left open while the game waits for input.
	host.withGameMut([](Counter& game) { game.value = 100; });
	{
		const auto guard = host.borrowGame();
		EXPECT_EQ(guard->value, 100);
	}

	EXPECT_EQ(coroutine.resume(1), Counter::Coroutine::State{Yielded<int>{101 + Counter::EventTag}});
}

TEST(Coroutine, GuardHeldAcrossYieldThrows) {
	Host host{GuardAcrossYield{}};
	auto coroutine = host.play();

	EXPECT_THROW(coroutine.resume(), BorrowError);
	EXPECT_TRUE(coroutine.isDone());
	EXPECT_THROW(coroutine.resume(), ResumeError);

	// The guard was released when the body unwound.
	EXPECT_NO_THROW(host.game());
}

TEST(Coroutine, NestedTransactionInBodyThrows) {
	Host host{NestedTransaction{}};
	auto coroutine = host.play();

	EXPECT_THROW(coroutine.resume(), BorrowError);
	EXPECT_TRUE(coroutine.isDone());
}

TEST(Coroutine, GameExceptionPropagates) {
	Host host{Failing{}};
	auto coroutine = host.play();

	EXPECT_EQ(coroutine.resume(), Failing::Coroutine::State{Yielded<int>{1}});
	EXPECT_THROW(coroutine.resume(), std::runtime_error);
	EXPECT_TRUE(coroutine.isDone());
}

TEST(Coroutine, YieldDefault) {
	Host host{Greeter{}};
	auto coroutine = host.play();

	EXPECT_EQ(coroutine.resume(), Greeter::Coroutine::State{Yielded<std::string>{""}});
	EXPECT_EQ(coroutine.resume(), Greeter::Coroutine::State{Yielded<std::string>{"hello"}});
	EXPECT_EQ(coroutine.resume(), Greeter::Coroutine::State{Complete<int>{1}});
}

TEST(Coroutine, DestroyingAbandonsRun) {
	Host host{Counter{}};
	{
		auto coroutine = host.play();
		coroutine.resume(0);
		coroutine.resume(4);
	}

	// The state stays where the run left it and the session stays used up.
	EXPECT_EQ(host.game().value, 4);
	EXPECT_EQ(host.useCount(), 1);
	EXPECT_THROW(host.play(), PlayError);
}

} // namespace turnkit::gtest
