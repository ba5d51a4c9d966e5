#include "turnkit/errors.hpp"

#include <format>
#include <string>

namespace turnkit {

static std::string describe(const PlayError::Kind kind) {
	switch (kind) {
	case PlayError::Kind::InUse:
		return "the game state is currently being accessed";
	case PlayError::Kind::AlreadyStarted:
		return "the game has already been started";
	}
	return "unknown error";
}

PlayError::PlayError(const Kind kind) : std::runtime_error{std::format("Cannot start game: {}.", describe(kind))}, m_kind{kind} {
}

PlayError::Kind PlayError::kind() const noexcept {
	return m_kind;
}

std::string_view toString(const PlayError::Kind kind) {
	switch (kind) {
	case PlayError::Kind::InUse:
		return "InUse";
	case PlayError::Kind::AlreadyStarted:
		return "AlreadyStarted";
	}
	return "Unknown";
}

} // namespace turnkit
