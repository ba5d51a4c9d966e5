#pragma once

#include "turnkit/play.hpp"
#include "turnkit/yieldChannel.hpp"

#include <concepts>
#include <memory>
#include <utility>

namespace turnkit {

template <class>
class Host;

//! Handed to the game body once per run.
//! Lets the body yield events to the driver and run transactions on the shared game state.
template <class Game>
class Context {
public:
	using Event   = typename Game::Event;
	using Input   = typename Game::Input;
	using Channel = YieldChannel<Event, Input>;

public:
	Context(Host<Game> host, std::shared_ptr<Channel> channel) : host{std::move(host)}, m_channel{std::move(channel)} {
	}

	//! Raise an event to the driver and wait for the next input.
	//! The game reacts to the event in its own transaction first. That transaction is closed before the body suspends.
	//! \note co_await the result immediately. Holding a game guard across this call throws a BorrowError.
	YieldAwaiter<Event, Input> yieldEvent(Event event) const {
		m_channel->raise(event);
		host.processEvent(event);
		return YieldAwaiter<Event, Input>{*m_channel, std::move(event)};
	}

	//! Raise a value initialised event.
	YieldAwaiter<Event, Input> yieldDefault() const
	    requires std::default_initializable<Event>
	{
		return yieldEvent(Event{});
	}

public:
	Host<Game> host; //!< Shared game state. Use it to run transactions from the game body.

private:
	std::shared_ptr<Channel> m_channel;
};

} // namespace turnkit
