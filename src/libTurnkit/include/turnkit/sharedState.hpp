#pragma once

namespace turnkit {

//! Game state shared by all handles of one session.
template <class Game>
struct SharedState {
	bool started{false}; //!< Set once a run was started. Never reset.
	Game game;           //!< Current game state.
};

} // namespace turnkit
