#pragma once

#include "turnkit/errors.hpp"
#include "turnkit/yieldChannel.hpp"

#include <concepts>
#include <coroutine>
#include <exception>
#include <memory>
#include <optional>
#include <utility>
#include <variant>

namespace turnkit {

template <class>
class Host;

//! The game suspended and handed an event to the driver.
template <class Event>
struct Yielded {
	Event event;

	bool operator==(const Yielded&) const = default;
};

//! The game finished.
template <class Outcome>
struct Complete {
	Outcome outcome;

	bool operator==(const Complete&) const = default;
};

//! Result of resuming a game.
template <class Event, class Outcome>
using CoroutineState = std::variant<Yielded<Event>, Complete<Outcome>>;

//! Driver facing handle of a game run.
//! Owns the coroutine frame. Destroying it before completion abandons the run.
template <class Event, class Input, class Outcome>
class Coroutine {
public:
	using State = CoroutineState<Event, Outcome>;

	struct promise_type {
		Coroutine get_return_object() {
			return Coroutine{std::coroutine_handle<promise_type>::from_promise(*this)};
		}

		// The body only starts on the first resume.
		std::suspend_always initial_suspend() noexcept {
			return {};
		}
		std::suspend_always final_suspend() noexcept {
			return {};
		}

		void return_value(Outcome value) {
			outcome.emplace(std::move(value));
		}
		void unhandled_exception() {
			exception = std::current_exception();
		}

		// Suspending on anything but a Context yield does not compile.
		YieldAwaiter<Event, Input> await_transform(YieldAwaiter<Event, Input> awaiter) {
			return awaiter;
		}

		std::optional<Outcome> outcome;
		std::exception_ptr exception;
	};

public:
	Coroutine() = default;

	Coroutine(const Coroutine&)            = delete;
	Coroutine& operator=(const Coroutine&) = delete;

	Coroutine(Coroutine&& other) noexcept
	    : m_handle{std::exchange(other.m_handle, nullptr)}, m_channel{std::move(other.m_channel)} {
	}

	Coroutine& operator=(Coroutine&& other) noexcept {
		if (this != &other) {
			destroy();
			m_handle  = std::exchange(other.m_handle, nullptr);
			m_channel = std::move(other.m_channel);
		}
		return *this;
	}

	~Coroutine() {
		destroy();
	}

	//! Run the game until it yields the next event or completes.
	//! \note The input of the first resume is discarded. There is no pending yield to receive it.
	//! \note Exceptions thrown by the game are rethrown here and complete the run.
	State resume(Input input) {
		if (!m_handle || !m_channel) {
			throw ResumeError("Cannot resume an empty or unbound game coroutine.");
		}
		if (m_handle.done()) {
			throw ResumeError("Cannot resume a game that has already completed.");
		}

		if (m_channel->awaitingInput()) {
			m_channel->supply(std::move(input));
		}
		m_handle.resume();

		auto& promise = m_handle.promise();
		if (promise.exception) {
			std::rethrow_exception(std::exchange(promise.exception, nullptr));
		}
		if (m_handle.done()) {
			if (!promise.outcome) {
				throw ResumeError("Game completed without an outcome.");
			}
			return Complete<Outcome>{std::move(*promise.outcome)};
		}
		return Yielded<Event>{m_channel->takeEvent()};
	}

	//! Run the game with a value initialised input.
	State resume()
	    requires std::default_initializable<Input>
	{
		return resume(Input{});
	}

	//! Event of the last yield as the game raised it, before its handleEvent hook changed it.
	//! Empty before the first yield.
	std::optional<Event> raisedEvent() const {
		if (!m_channel) {
			return {};
		}
		return m_channel->raised();
	}

	//! Returns true once the game returned an outcome or failed.
	bool isDone() const {
		return !m_handle || m_handle.done();
	}

private:
	template <class>
	friend class Host;

	explicit Coroutine(std::coroutine_handle<promise_type> handle) : m_handle{handle} {
	}

	//! Connect the driver side to the channel the game body yields through.
	void bind(std::shared_ptr<YieldChannel<Event, Input>> channel) {
		m_channel = std::move(channel);
	}

	void destroy() noexcept {
		if (m_handle) {
			m_handle.destroy();
			m_handle = nullptr;
		}
	}

private:
	std::coroutine_handle<promise_type> m_handle{};
	std::shared_ptr<YieldChannel<Event, Input>> m_channel;
};

} // namespace turnkit
