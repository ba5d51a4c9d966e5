#pragma once

#include "replay/eventJournal.hpp"
#include "turnkit/host.hpp"

#include <concepts>
#include <utility>
#include <variant>

namespace turnkit::replay {

//! Drives a game and records every event it yields.
//! Events are recorded as the game raised them, before its handleEvent hook ran.
//! Replaying the journal through Host::processEvent runs the hook once per event, like the recorded run did.
template <class Game>
class RecordingDriver {
public:
	using Event     = typename Game::Event;
	using Input     = typename Game::Input;
	using Outcome   = typename Game::Outcome;
	using Coroutine = typename Host<Game>::Coroutine;
	using State     = typename Coroutine::State;

public:
	explicit RecordingDriver(Coroutine coroutine) : m_coroutine{std::move(coroutine)} {
	}

	//! Resume the game. Yielded events are appended to the journal before being returned.
	State resume(Input input) {
		auto state = m_coroutine.resume(std::move(input));
		if (const auto* yielded = std::get_if<Yielded<Event>>(&state)) {
			auto raised = m_coroutine.raisedEvent();
			m_journal.append(raised ? std::move(*raised) : yielded->event);
		}
		return state;
	}

	State resume()
	    requires std::default_initializable<Input>
	{
		return resume(Input{});
	}

	bool isDone() const {
		return m_coroutine.isDone();
	}

	const EventJournal<Event>& journal() const {
		return m_journal;
	}

private:
	Coroutine m_coroutine;
	EventJournal<Event> m_journal;
};

} // namespace turnkit::replay
