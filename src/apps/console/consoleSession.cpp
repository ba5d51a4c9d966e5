#include "consoleSession.hpp"

#include "Logging.hpp"
#include "replay/recordingDriver.hpp"
#include "turnkit/errors.hpp"

#include <format>
#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>
#include <variant>

namespace turnkit::console {

using ticTacToe::TicTacToe;

static std::string trim(const std::string& text) {
	const auto first = text.find_first_not_of(" \t\r");
	if (first == std::string::npos) {
		return {};
	}
	const auto last = text.find_last_not_of(" \t\r");
	return text.substr(first, last - first + 1);
}

static std::string describe(const ticTacToe::Line& line) {
	switch (line.kind()) {
	case ticTacToe::Line::Kind::Row:
		return std::format("row {}", line.offset());
	case ticTacToe::Line::Kind::Col:
		return std::format("column {}", line.offset());
	case ticTacToe::Line::Kind::Diagonal:
		return line.offset() ? "the rising diagonal" : "the falling diagonal";
	}
	return "a line";
}

ConsoleSession::ConsoleSession(std::istream& in, std::ostream& out, const AppConfig& config) : m_in{in}, m_out{out}, m_config{config} {
	InitializeLogging(m_config);
}

int ConsoleSession::run() {
	auto logger = Logger();
	for (const auto& warning: m_config.warnings) {
		logger.Log(Logging::LogLevel::Warning, warning);
	}

	m_out << "TicTacToe. Enter a move as 'col row' (0-2). Type 'new' to restart or 'quit' to exit.\n";

	try {
		while (playGame() == Command::NewGame) {
		}
	} catch (const PlayError& e) {
		logger.Log(Logging::LogLevel::Error, std::format("[Console] {} ({})", e.what(), toString(e.kind())));
		return 1;
	} catch (const BorrowError& e) {
		logger.Log(Logging::LogLevel::Error, std::format("[Console] Game state access violated: {}", e.what()));
		return 1;
	} catch (const ResumeError& e) {
		logger.Log(Logging::LogLevel::Error, std::format("[Console] Game could not be resumed: {}", e.what()));
		return 1;
	}

	logger.Log(Logging::LogLevel::Info, std::format("[Console] Session ended after {} game(s).", m_gamesPlayed));
	logger.Flush();
	return 0;
}

ConsoleSession::Command ConsoleSession::playGame() {
	auto logger = Logger();

	// Every game gets a fresh host. A host can only be played once.
	Host<TicTacToe> host{TicTacToe{}};
	replay::RecordingDriver<TicTacToe> driver{host.play()};

	++m_gamesPlayed;
	logger.Log(Logging::LogLevel::Info, std::format("[Console] Game {} started.", m_gamesPlayed));

	ticTacToe::Pos move{};
	while (true) {
		const auto state = driver.resume(move);
		host.withGame([&](const TicTacToe& game) { render(game); });

		if (const auto* complete = std::get_if<Complete<ticTacToe::Outcome>>(&state)) {
			announce(complete->outcome);
			writeJournal(driver.journal());
			return readCommand().value_or(Command::Quit);
		}

		announce(std::get<Yielded<ticTacToe::Event>>(state).event);

		const auto input = readInput();
		if (input.command) {
			logger.Log(Logging::LogLevel::Info, std::format("[Console] Game {} abandoned.", m_gamesPlayed));
			return *input.command;
		}

		move = *input.move;
		logger.Log(Logging::LogLevel::Debug, std::format("[Console] Move at ({}, {}).", move.col(), move.row()));
	}
}

ConsoleSession::PlayerInput ConsoleSession::readInput() {
	std::string line;
	while (true) {
		m_out << "> " << std::flush;
		if (!std::getline(m_in, line)) {
			return PlayerInput{.move = std::nullopt, .command = Command::Quit};
		}

		line = trim(line);
		if (line == "quit" || line == "exit") {
			return PlayerInput{.move = std::nullopt, .command = Command::Quit};
		}
		if (line == "new") {
			return PlayerInput{.move = std::nullopt, .command = Command::NewGame};
		}
		if (const auto move = parseMove(line)) {
			return PlayerInput{.move = *move, .command = std::nullopt};
		}

		m_out << std::format("Invalid input '{}'. Expected 'col row' with values from 0 to {}.\n", line, ticTacToe::Pos::BoardSize - 1u);
		Logger().Log(Logging::LogLevel::Warning, std::format("[Console] Invalid input '{}'.", line));
	}
}

std::optional<ConsoleSession::Command> ConsoleSession::readCommand() {
	m_out << "Type 'new' for another game or 'quit' to exit.\n";

	std::string line;
	while (true) {
		m_out << "> " << std::flush;
		if (!std::getline(m_in, line)) {
			return {};
		}

		line = trim(line);
		if (line == "new") {
			return Command::NewGame;
		}
		if (line == "quit" || line == "exit") {
			return Command::Quit;
		}
	}
}

std::optional<ticTacToe::Pos> ConsoleSession::parseMove(const std::string& line) {
	std::istringstream stream{line};
	unsigned col = 0u;
	unsigned row = 0u;
	if (!(stream >> col >> row)) {
		return {};
	}

	std::string rest;
	if (stream >> rest) {
		return {};
	}
	return ticTacToe::Pos::make(col, row);
}

void ConsoleSession::render(const TicTacToe& game) const {
	for (unsigned row = 0u; row != ticTacToe::Pos::BoardSize; ++row) {
		if (row) {
			m_out << "---+---+---\n";
		}
		for (unsigned col = 0u; col != ticTacToe::Pos::BoardSize; ++col) {
			const auto& tile = game.tile(*ticTacToe::Pos::make(col, row));
			m_out << (col ? "| " : " ") << (tile ? ticTacToe::toString(*tile) : " ") << ' ';
		}
		m_out << '\n';
	}
}

void ConsoleSession::announce(const ticTacToe::Event& event) const {
	if (const auto* player = std::get_if<ticTacToe::Player>(&event)) {
		m_out << std::format("Player {} to move.\n", ticTacToe::toString(*player));
		return;
	}

	m_out << "That tile is already taken. Try again.\n";
	Logger().Log(Logging::LogLevel::Info, "[Console] Move rejected: tile already taken.");
}

void ConsoleSession::announce(const ticTacToe::Outcome& outcome) const {
	auto logger = Logger();

	if (const auto* win = std::get_if<ticTacToe::Win>(&outcome)) {
		const auto message = std::format("Player {} wins on {}.", ticTacToe::toString(win->player), describe(win->line));
		m_out << message << '\n';
		logger.Log(Logging::LogLevel::Info, std::format("[Console] Game {} over. {}", m_gamesPlayed, message));
		return;
	}

	m_out << "Cat's game!\n";
	logger.Log(Logging::LogLevel::Info, std::format("[Console] Game {} over. Cat's game.", m_gamesPlayed));
}

void ConsoleSession::writeJournal(const replay::EventJournal<ticTacToe::Event>& journal) const {
	if (!m_config.journalPath) {
		return;
	}

	auto logger = Logger();

	std::ofstream file{*m_config.journalPath, std::ios::app};
	if (!file) {
		logger.Log(Logging::LogLevel::Error, std::format("[Console] Could not open journal file '{}'.", m_config.journalPath->string()));
		return;
	}

	file << std::format("# game {}\n", m_gamesPlayed);
	for (const auto& line: replay::toLines(journal, [](const ticTacToe::Event& event) { return ticTacToe::toString(event); })) {
		file << line << '\n';
	}

	logger.Log(Logging::LogLevel::Debug, std::format("[Console] Wrote {} events to '{}'.", journal.size(), m_config.journalPath->string()));
}

} // namespace turnkit::console
