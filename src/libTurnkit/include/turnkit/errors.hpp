#pragma once

#include <stdexcept>
#include <string_view>

namespace turnkit {

//! Thrown by Host::play when a run cannot be started.
class PlayError : public std::runtime_error {
public:
	enum class Kind {
		InUse,         //!< Game state is currently being accessed. Transient.
		AlreadyStarted //!< A run was already started on this state. Permanent.
	};

public:
	explicit PlayError(Kind kind);

	Kind kind() const noexcept;

private:
	Kind m_kind;
};

//! Returns a stable name for the error kind.
std::string_view toString(PlayError::Kind kind);

//! A transaction was opened while another one is still open on the same state.
//! \note This is a programming error, not contention.
class BorrowError : public std::logic_error {
public:
	using std::logic_error::logic_error;
};

//! A coroutine was resumed after it completed or after it was moved from.
class ResumeError : public std::logic_error {
public:
	using std::logic_error::logic_error;
};

} // namespace turnkit
