#pragma once

#include "turnkit/host.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace turnkit::replay {

//! Ordered record of the events a game yielded.
template <class Event>
class EventJournal {
public:
	void append(Event event) {
		m_events.push_back(std::move(event));
	}

	void clear() {
		m_events.clear();
	}

	std::size_t size() const {
		return m_events.size();
	}
	bool empty() const {
		return m_events.empty();
	}

	const std::vector<Event>& events() const {
		return m_events;
	}

private:
	std::vector<Event> m_events;
};

//! Apply every recorded event, in order, to the game state of a host.
//! Each event goes through Host::processEvent, like it would when yielded by a running game. No run is started.
//! \note Expects events as raised by the game, before its handleEvent hook. RecordingDriver records them that way.
//! \returns Number of events applied.
template <class Game>
std::size_t replay(const EventJournal<typename Game::Event>& journal, const Host<Game>& host) {
	for (const auto& recorded: journal.events()) {
		auto event = recorded;
		host.processEvent(event);
	}
	return journal.size();
}

//! Text form of a journal. One line per event.
template <class Event, class Format>
std::vector<std::string> toLines(const EventJournal<Event>& journal, Format&& format) {
	std::vector<std::string> lines;
	lines.reserve(journal.size());
	for (const auto& event: journal.events()) {
		lines.push_back(std::invoke(format, event));
	}
	return lines;
}

//! Parse the text form of a journal. Returns empty if any line is invalid.
//! \param parse Returns std::optional<Event> for one line.
template <class Event, class Parse>
std::optional<EventJournal<Event>> fromLines(const std::vector<std::string>& lines, Parse&& parse) {
	EventJournal<Event> journal;
	for (const auto& line: lines) {
		std::optional<Event> event = std::invoke(parse, line);
		if (!event) {
			return {};
		}
		journal.append(std::move(*event));
	}
	return journal;
}

} // namespace turnkit::replay
