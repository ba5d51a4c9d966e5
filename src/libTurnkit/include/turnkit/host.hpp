#pragma once

#include "turnkit/borrowCell.hpp"
#include "turnkit/context.hpp"
#include "turnkit/coroutine.hpp"
#include "turnkit/errors.hpp"
#include "turnkit/play.hpp"
#include "turnkit/sharedState.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace turnkit {

//! Manages one game session.
//! Offers read/write transactions on the game state whenever the game is not currently running its own code.
//! Copies of a Host share the same game state. They never duplicate it.
template <class Game>
class Host {
	static_assert(Playable<Game>, "Game must define the Event, Input and Outcome types.");

	using State = SharedState<Game>;
	using Cell  = BorrowCell<State>;

public:
	using Event     = typename Game::Event;
	using Input     = typename Game::Input;
	using Outcome   = typename Game::Outcome;
	using Coroutine = turnkit::Coroutine<Event, Input, Outcome>;

public:
	//! Setup a session holding the initial game state. Any game setup happens before this.
	explicit Host(Game game) : m_state{std::make_shared<Cell>(State{.started = false, .game = std::move(game)})} {
	}

	//! Start the game. Resume the returned coroutine to run the turns.
	//! \note Throws PlayError::Kind::InUse if a transaction is currently open.
	//! \note Throws PlayError::Kind::AlreadyStarted if a run was already started on this game state.
	Coroutine play() const {
		static_assert(std::same_as<decltype(Game::play(std::declval<Context<Game>>())), Coroutine>,
		              "Game must define: static Coroutine<Event, Input, Outcome> play(Context<Game> ctx).");

		{
			auto state = m_state->tryBorrowMut();
			if (!state) {
				throw PlayError(PlayError::Kind::InUse);
			}
			if ((*state)->started) {
				throw PlayError(PlayError::Kind::AlreadyStarted);
			}
			(*state)->started = true;
		}

		auto channel   = std::make_shared<YieldChannel<Event, Input>>();
		auto coroutine = Game::play(Context<Game>{*this, channel});
		coroutine.bind(std::move(channel));
		return coroutine;
	}

	//! Returns true once play() succeeded on this game state.
	bool isStarted() const {
		return m_state->borrow()->started;
	}

	//! Copy the game state out of the host.
	Game game() const
	    requires std::is_trivially_copyable_v<Game>
	{
		return withGame([](const Game& game) { return game; });
	}

	//! Deep copy of the game state.
	Game cloneGame() const
	    requires std::copy_constructible<Game>
	{
		return withGame([](const Game& game) { return Game(game); });
	}

	//! Run a read transaction on the game state.
	//! \note Throws a BorrowError if called from inside another transaction on the same state.
	template <class Transaction>
	auto withGame(Transaction&& transact) const {
		const auto state = m_state->borrow();
		return std::invoke(std::forward<Transaction>(transact), std::as_const(state->game));
	}

	//! Run a write transaction on the game state.
	//! \note Throws a BorrowError if called from inside another transaction on the same state.
	template <class Transaction>
	auto withGameMut(Transaction&& transact) const {
		const auto state = m_state->borrowMut();
		return std::invoke(std::forward<Transaction>(transact), state->game);
	}

	//! Open a read transaction that lasts as long as the returned guard.
	Ref<Game> borrowGame() const {
		return m_state->borrow().map(&State::game, m_state);
	}

	//! Open a write transaction that lasts as long as the returned guard.
	RefMut<Game> borrowGameMut() const {
		return m_state->borrowMut().map(&State::game, m_state);
	}

	//! Let the game react to an event in its own write transaction.
	//! Used by the game body before yielding and by drivers replaying events from elsewhere.
	void processEvent(Event& event) const {
		auto state = m_state->borrowMut();
		if constexpr (HandlesEvents<Game>) {
			state->game.handleEvent(event);
		}
	}

	//! Another handle on the same game state.
	Host clone() const {
		return *this;
	}

	//! Returns true if both handles share one game state.
	bool sharesStateWith(const Host& other) const noexcept {
		return m_state == other.m_state;
	}

	//! Number of handles on the game state, including the ones held by running games.
	long useCount() const noexcept {
		return m_state.use_count();
	}

private:
	std::shared_ptr<Cell> m_state;
};

} // namespace turnkit
