#pragma once

#include "turnkit/host.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace turnkit::ticTacToe {

enum class Player {
	X, //!< Moves first.
	O
};

//! Returns the next player in the turn order.
inline constexpr Player next(Player player) {
	return player == Player::X ? Player::O : Player::X;
}

std::string_view toString(Player player);

//! Valid position on the board.
class Pos {
public:
	static constexpr std::uint16_t BoardSize = 3u; //!< Width and height of the square board.

	Pos() = default;

	//! Returns empty if the column or row is out of bounds.
	static std::optional<Pos> make(unsigned col, unsigned row);

	std::uint16_t col() const;
	std::uint16_t row() const;
	std::size_t index() const; //!< Row major tile index.
	Pos flipRow() const;       //!< Same position mirrored on the horizontal axis.

	bool operator==(const Pos&) const = default;

private:
	Pos(std::uint16_t col, std::uint16_t row);

private:
	std::uint16_t m_col{0u};
	std::uint16_t m_row{0u};
};

//! Straight line across the board.
class Line {
public:
	enum class Kind { Row, Col, Diagonal };

	static Line row(std::uint16_t row);
	static Line col(std::uint16_t col);
	//! \param flipped Starts at (0, 2) instead of (0, 0).
	static Line diagonal(bool flipped);

	Kind kind() const;
	std::uint16_t offset() const; //!< Row or column index. For diagonals 1 if flipped else 0.

	bool contains(Pos pos) const;
	std::array<Pos, Pos::BoardSize> tiles() const;

	bool operator==(const Line&) const = default;

private:
	Line(Kind kind, std::uint16_t offset);

private:
	Kind m_kind;
	std::uint16_t m_offset;
};

//! The last move was rejected, e.g. because the tile was already taken.
struct InvalidMove {
	bool operator==(const InvalidMove&) const = default;
};

struct CatsGame {
	bool operator==(const CatsGame&) const = default;
};
struct Win {
	Player player;
	Line line;

	bool operator==(const Win&) const = default;
};

using Outcome = std::variant<CatsGame, Win>;

//! Either the player that has to move next or the rejection of the last move.
using Event = std::variant<Player, InvalidMove>;

using Board = std::array<std::optional<Player>, Pos::BoardSize * Pos::BoardSize>;

class TicTacToe : public Play<Event, Pos, Outcome> {
public:
	static Coroutine play(Context<TicTacToe> ctx);

	Player currentPlayer() const;                  //!< Player whose turn it is.
	const std::optional<Player>& tile(Pos pos) const;
	const Board& board() const;
	const std::optional<Outcome>& outcome() const; //!< Set once the game is over.

private:
	//! Claim a tile for the current player. Returns false if the tile is already claimed.
	bool takeTurn(Pos pos);

	//! Returns the outcome if the game is over.
	std::optional<Outcome> checkOutcome() const;

	//! Returns the player owning every tile of the line, if any.
	std::optional<Player> checkLine(const Line& line) const;

private:
	Player m_currentPlayer{Player::X};
	Board m_board{};
	std::optional<Outcome> m_outcome;
};

// Text form of events, used for journals and console output.
std::string toString(const Event& event);
std::optional<Event> parseEvent(std::string_view text);

} // namespace turnkit::ticTacToe
