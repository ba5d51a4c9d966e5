#pragma once

#include "appConfig.hpp"
#include "games/ticTacToe.hpp"
#include "replay/eventJournal.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace turnkit::console {

//! Plays TicTacToe games on text streams until the player quits or the input ends.
class ConsoleSession {
public:
	ConsoleSession(std::istream& in, std::ostream& out, const AppConfig& config);

	//! Play games until quit. Returns the process exit code.
	int run();

private:
	enum class Command { NewGame, Quit };

	//! Line typed by the player: a move or a command.
	struct PlayerInput {
		std::optional<ticTacToe::Pos> move;
		std::optional<Command> command;
	};

	Command playGame();
	PlayerInput readInput();                               //!< Blocks until a valid line or end of input.
	std::optional<Command> readCommand();                  //!< Blocks until 'new', 'quit' or end of input.
	static std::optional<ticTacToe::Pos> parseMove(const std::string& line);

	void render(const ticTacToe::TicTacToe& game) const;
	void announce(const ticTacToe::Event& event) const;
	void announce(const ticTacToe::Outcome& outcome) const;

	void writeJournal(const replay::EventJournal<ticTacToe::Event>& journal) const;

private:
	std::istream& m_in;
	std::ostream& m_out;
	const AppConfig& m_config;
	unsigned m_gamesPlayed{0u};
};

} // namespace turnkit::console
