#pragma once

#include "turnkit/errors.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace turnkit {

enum class BorrowState { Unused, Reading, Writing };

//! Single threaded access flag. Only one transaction may be open at a time, readers included.
//! \note Never blocks. A second acquire throws a BorrowError.
class BorrowFlag {
public:
	void acquire(BorrowState mode);    //!< Open a transaction or throw.
	bool tryAcquire(BorrowState mode); //!< Open a transaction. Returns false if one is already open.
	void release() noexcept;           //!< Close the open transaction.

	BorrowState state() const noexcept;

private:
	BorrowState m_state{BorrowState::Unused};
};

//! Read guard. Holds the transaction open until destroyed.
template <class T>
class Ref {
public:
	//! Takes over a flag that was already acquired for reading.
	//! \param owner Optional handle that keeps the flag and value alive for the lifetime of the guard.
	Ref(const T& value, BorrowFlag& flag, std::shared_ptr<const void> owner = {}) noexcept
	    : m_value{&value}, m_flag{&flag}, m_owner{std::move(owner)} {
	}

	Ref(const Ref&)            = delete;
	Ref& operator=(const Ref&) = delete;

	Ref(Ref&& other) noexcept
	    : m_value{std::exchange(other.m_value, nullptr)}, m_flag{std::exchange(other.m_flag, nullptr)}, m_owner{std::move(other.m_owner)} {
	}

	Ref& operator=(Ref&& other) noexcept {
		if (this != &other) {
			release();
			m_value = std::exchange(other.m_value, nullptr);
			m_flag  = std::exchange(other.m_flag, nullptr);
			m_owner = std::move(other.m_owner);
		}
		return *this;
	}

	~Ref() {
		release();
	}

	const T& operator*() const {
		return *m_value;
	}
	const T* operator->() const {
		return m_value;
	}

	//! Narrow the guard to a part of the value. The transaction moves to the returned guard.
	//! \note Throws a BorrowError on a moved-from guard.
	template <class Project>
	auto map(Project&& project, std::shared_ptr<const void> owner = {}) && {
		if (!m_flag) {
			throw BorrowError("Cannot narrow a guard that no longer holds a transaction.");
		}
		using Part        = std::remove_cvref_t<std::invoke_result_t<Project, const T&>>;
		const Part& part  = std::invoke(std::forward<Project>(project), *m_value);
		BorrowFlag* flag  = std::exchange(m_flag, nullptr);
		auto keepAlive    = owner ? std::move(owner) : std::move(m_owner);
		m_value           = nullptr;
		return Ref<Part>{part, *flag, std::move(keepAlive)};
	}

private:
	void release() noexcept {
		if (m_flag) {
			m_flag->release();
			m_flag = nullptr;
		}
	}

private:
	const T* m_value;
	BorrowFlag* m_flag;
	std::shared_ptr<const void> m_owner;
};

//! Write guard. Holds the transaction open until destroyed.
template <class T>
class RefMut {
public:
	//! Takes over a flag that was already acquired for writing.
	RefMut(T& value, BorrowFlag& flag, std::shared_ptr<const void> owner = {}) noexcept
	    : m_value{&value}, m_flag{&flag}, m_owner{std::move(owner)} {
	}

	RefMut(const RefMut&)            = delete;
	RefMut& operator=(const RefMut&) = delete;

	RefMut(RefMut&& other) noexcept
	    : m_value{std::exchange(other.m_value, nullptr)}, m_flag{std::exchange(other.m_flag, nullptr)}, m_owner{std::move(other.m_owner)} {
	}

	RefMut& operator=(RefMut&& other) noexcept {
		if (this != &other) {
			release();
			m_value = std::exchange(other.m_value, nullptr);
			m_flag  = std::exchange(other.m_flag, nullptr);
			m_owner = std::move(other.m_owner);
		}
		return *this;
	}

	~RefMut() {
		release();
	}

	T& operator*() const {
		return *m_value;
	}
	T* operator->() const {
		return m_value;
	}

	//! Narrow the guard to a part of the value. The transaction moves to the returned guard.
	//! \note Throws a BorrowError on a moved-from guard.
	template <class Project>
	auto map(Project&& project, std::shared_ptr<const void> owner = {}) && {
		if (!m_flag) {
			throw BorrowError("Cannot narrow a guard that no longer holds a transaction.");
		}
		using Part       = std::remove_cvref_t<std::invoke_result_t<Project, T&>>;
		Part& part       = std::invoke(std::forward<Project>(project), *m_value);
		BorrowFlag* flag = std::exchange(m_flag, nullptr);
		auto keepAlive   = owner ? std::move(owner) : std::move(m_owner);
		m_value          = nullptr;
		return RefMut<Part>{part, *flag, std::move(keepAlive)};
	}

private:
	void release() noexcept {
		if (m_flag) {
			m_flag->release();
			m_flag = nullptr;
		}
	}

private:
	T* m_value;
	BorrowFlag* m_flag;
	std::shared_ptr<const void> m_owner;
};

//! Value with runtime checked exclusive access.
template <class T>
class BorrowCell {
public:
	explicit BorrowCell(T value) : m_value{std::move(value)} {
	}

	BorrowCell(const BorrowCell&)            = delete;
	BorrowCell& operator=(const BorrowCell&) = delete;

	//! Open a read transaction.
	//! \note Throws a BorrowError if a transaction is already open.
	Ref<T> borrow() {
		m_flag.acquire(BorrowState::Reading);
		return Ref<T>{m_value, m_flag};
	}

	//! Open a write transaction.
	//! \note Throws a BorrowError if a transaction is already open.
	RefMut<T> borrowMut() {
		m_flag.acquire(BorrowState::Writing);
		return RefMut<T>{m_value, m_flag};
	}

	//! Open a write transaction. Returns empty if a transaction is already open.
	std::optional<RefMut<T>> tryBorrowMut() {
		if (!m_flag.tryAcquire(BorrowState::Writing)) {
			return {};
		}
		return RefMut<T>{m_value, m_flag};
	}

	bool isBorrowed() const noexcept {
		return m_flag.state() != BorrowState::Unused;
	}

private:
	T m_value;
	BorrowFlag m_flag;
};

} // namespace turnkit
