#pragma once

#include "turnkit/errors.hpp"

#include <coroutine>
#include <optional>
#include <utility>

namespace turnkit {

//! Single slot exchange between a running game body and its driver.
//! Events travel from the body to the driver, inputs from the driver to the body.
template <class Event, class Input>
class YieldChannel {
public:
	//! Body side: keep the event as raised, before the game reacted to it.
	void raise(const Event& event) {
		m_raised.emplace(event);
	}

	//! Driver side: event of the last yield as raised by the game.
	const std::optional<Event>& raised() const noexcept {
		return m_raised;
	}

	//! Body side: hand an event to the driver. The body suspends right after.
	void post(Event event) {
		m_event.emplace(std::move(event));
		m_awaitingInput = true;
	}

	//! Driver side: take the event posted by the last suspension.
	Event takeEvent() {
		if (!m_event) {
			throw ResumeError("Game suspended without yielding an event.");
		}
		Event event = std::move(*m_event);
		m_event.reset();
		return event;
	}

	//! Driver side: true if a suspended yield waits for an input.
	bool awaitingInput() const noexcept {
		return m_awaitingInput;
	}

	//! Driver side: supply the input for the pending yield.
	void supply(Input input) {
		m_input.emplace(std::move(input));
	}

	//! Body side: receive the input supplied for the pending yield.
	Input takeInput() {
		if (!m_input) {
			throw ResumeError("Game resumed without an input.");
		}
		Input input = std::move(*m_input);
		m_input.reset();
		m_awaitingInput = false;
		return input;
	}

private:
	std::optional<Event> m_raised;
	std::optional<Event> m_event;
	std::optional<Input> m_input;
	bool m_awaitingInput{false};
};

//! Awaitable returned by the yield operations of a Context.
//! This is the only thing a game body may co_await.
template <class Event, class Input>
class YieldAwaiter {
public:
	YieldAwaiter(YieldChannel<Event, Input>& channel, Event event) : m_channel{&channel}, m_event{std::move(event)} {
	}

	bool await_ready() const noexcept {
		return false;
	}

	void await_suspend(std::coroutine_handle<>) {
		m_channel->post(std::move(m_event));
	}

	Input await_resume() {
		return m_channel->takeInput();
	}

private:
	YieldChannel<Event, Input>* m_channel;
	Event m_event;
};

} // namespace turnkit
