#pragma once

#include "turnkit/coroutine.hpp"

#include <concepts>

namespace turnkit {

template <class>
class Context;

//! A game that can be run by a Host.
//! Besides the associated types, a game provides
//!     static Coroutine<Event, Input, Outcome> play(Context<Game> ctx);
//! which is checked when the game is started.
template <class Game>
concept Playable = requires {
	typename Game::Event;
	typename Game::Input;
	typename Game::Outcome;
};

//! A game that reacts to events before they reach the driver.
template <class Game>
concept HandlesEvents = Playable<Game> && requires(Game& game, typename Game::Event& event) { game.handleEvent(event); };

//! Optional base for games.
//! Supplies the associated types and a handleEvent hook that does nothing.
template <class EventT, class InputT, class OutcomeT>
struct Play {
	using Event     = EventT;   //!< Emitted whenever the game state changed and the game waits to be resumed.
	using Input     = InputT;   //!< Supplied by the driver on every resume.
	using Outcome   = OutcomeT; //!< Returned when the game is over.
	using Coroutine = turnkit::Coroutine<Event, Input, Outcome>;

	//! Update game state in response to an event raised by play() or supplied through Host::processEvent().
	void handleEvent(Event&) {
	}
};

} // namespace turnkit
