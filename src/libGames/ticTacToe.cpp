#include "games/ticTacToe.hpp"

#include <algorithm>
#include <vector>

namespace turnkit::ticTacToe {

std::string_view toString(const Player player) {
	return player == Player::X ? "X" : "O";
}

// -- Pos --

Pos::Pos(const std::uint16_t col, const std::uint16_t row) : m_col{col}, m_row{row} {
}

std::optional<Pos> Pos::make(const unsigned col, const unsigned row) {
	if (col >= BoardSize || row >= BoardSize) {
		return {};
	}
	return Pos{static_cast<std::uint16_t>(col), static_cast<std::uint16_t>(row)};
}

std::uint16_t Pos::col() const {
	return m_col;
}

std::uint16_t Pos::row() const {
	return m_row;
}

std::size_t Pos::index() const {
	return static_cast<std::size_t>(m_row) * BoardSize + m_col;
}

Pos Pos::flipRow() const {
	return Pos{m_col, static_cast<std::uint16_t>(BoardSize - m_row - 1u)};
}

// -- Line --

Line::Line(const Kind kind, const std::uint16_t offset) : m_kind{kind}, m_offset{offset} {
}

Line Line::row(const std::uint16_t row) {
	return Line{Kind::Row, row};
}

Line Line::col(const std::uint16_t col) {
	return Line{Kind::Col, col};
}

Line Line::diagonal(const bool flipped) {
	return Line{Kind::Diagonal, static_cast<std::uint16_t>(flipped ? 1u : 0u)};
}

Line::Kind Line::kind() const {
	return m_kind;
}

std::uint16_t Line::offset() const {
	return m_offset;
}

bool Line::contains(const Pos pos) const {
	switch (m_kind) {
	case Kind::Row:
		return pos.row() == m_offset;
	case Kind::Col:
		return pos.col() == m_offset;
	case Kind::Diagonal: {
		const auto flipped = m_offset ? pos.flipRow() : pos;
		return flipped.col() == flipped.row();
	}
	}
	return false;
}

std::array<Pos, Pos::BoardSize> Line::tiles() const {
	std::array<Pos, Pos::BoardSize> tiles{};
	for (std::uint16_t i = 0u; i != Pos::BoardSize; ++i) {
		switch (m_kind) {
		case Kind::Row:
			tiles[i] = *Pos::make(i, m_offset);
			break;
		case Kind::Col:
			tiles[i] = *Pos::make(m_offset, i);
			break;
		case Kind::Diagonal: {
			const auto pos = *Pos::make(i, i);
			tiles[i]       = m_offset ? pos.flipRow() : pos;
			break;
		}
		}
	}
	return tiles;
}

// -- TicTacToe --

TicTacToe::Coroutine TicTacToe::play(Context<TicTacToe> ctx) {
	bool lastMoveValid = true;

	while (true) {
		Event prompt = InvalidMove{};
		if (lastMoveValid) {
			prompt = ctx.host.withGame([](const TicTacToe& game) { return game.currentPlayer(); });
		}

		// Wait for the player to pick a tile.
		const Pos pos = co_await ctx.yieldEvent(prompt);

		lastMoveValid = ctx.host.withGameMut([&](TicTacToe& game) { return game.takeTurn(pos); });
		if (!lastMoveValid) {
			continue;
		}

		const auto outcome = ctx.host.withGame([](const TicTacToe& game) { return game.checkOutcome(); });
		if (outcome) {
			ctx.host.withGameMut([&](TicTacToe& game) { game.m_outcome = outcome; });
			co_return *outcome;
		}
	}
}

Player TicTacToe::currentPlayer() const {
	return m_currentPlayer;
}

const std::optional<Player>& TicTacToe::tile(const Pos pos) const {
	return m_board[pos.index()];
}

const Board& TicTacToe::board() const {
	return m_board;
}

const std::optional<Outcome>& TicTacToe::outcome() const {
	return m_outcome;
}

bool TicTacToe::takeTurn(const Pos pos) {
	auto& tile = m_board[pos.index()];
	if (tile) {
		return false;
	}

	tile            = m_currentPlayer;
	m_currentPlayer = next(m_currentPlayer);
	return true;
}

std::optional<Outcome> TicTacToe::checkOutcome() const {
	std::vector<Line> lines;
	lines.reserve(2u * Pos::BoardSize + 2u);
	for (std::uint16_t offset = 0u; offset != Pos::BoardSize; ++offset) {
		lines.push_back(Line::row(offset));
		lines.push_back(Line::col(offset));
	}
	lines.push_back(Line::diagonal(false));
	lines.push_back(Line::diagonal(true));

	for (const auto& line: lines) {
		if (const auto owner = checkLine(line)) {
			return Win{.player = *owner, .line = line};
		}
	}

	const auto boardFull = std::ranges::all_of(m_board, [](const auto& tile) { return tile.has_value(); });
	if (boardFull) {
		return CatsGame{};
	}
	return {};
}

std::optional<Player> TicTacToe::checkLine(const Line& line) const {
	std::optional<Player> owner;
	for (const auto pos: line.tiles()) {
		const auto& tile = this->tile(pos);
		if (!tile || (owner && *tile != *owner)) {
			return {};
		}
		owner = *tile;
	}
	return owner;
}

// -- Event text form --

std::string toString(const Event& event) {
	if (const auto* player = std::get_if<Player>(&event)) {
		return std::string{"TURN:"} + std::string{toString(*player)};
	}
	return "INVALID";
}

std::optional<Event> parseEvent(const std::string_view text) {
	if (text == "TURN:X") {
		return Player::X;
	}
	if (text == "TURN:O") {
		return Player::O;
	}
	if (text == "INVALID") {
		return InvalidMove{};
	}
	return {};
}

} // namespace turnkit::ticTacToe
