#pragma once

#include "reversi/types.hpp"

#include <optional>
#include <vector>

namespace reversi {

//! Rectangular reversi board.
//! \note Coordinates origin is at the top left of the board and start at 0. Column -> x, Row -> y.
class Board {
public:
	//! Possible ownership values of fields on the board.
	enum class Value { Empty = 0, Black = static_cast<int>(Player::Black), White = static_cast<int>(Player::White) };

public:
	//! Creates an empty board. Use Board::withStartPosition for a playable setup.
	Board(std::size_t width, std::size_t height);

	//! Board with the four centre fields split diagonally between both players.
	static Board withStartPosition(std::size_t width, std::size_t height);

	//! True if a board of the given dimensions can hold the start position.
	static bool isValidSize(std::size_t width, std::size_t height);

	std::size_t width() const;
	std::size_t height() const;

	void setAt(Coord c, Player player); //!< Set at given coordinate (x,y) on the board.
	void clearAt(Coord c);              //!< Reset given coordinate (x,y) on the board to empty.

	//! Value at the given coordinate or std::nullopt if the coordinate is off board.
	std::optional<Value> getAt(Coord c) const;

	bool isOnBoard(Coord c) const;
	bool isFree(Coord c) const;           //!< True if on board and empty.
	std::size_t count(Value value) const; //!< Number of fields holding value.

private:
	std::size_t m_width;          //!< Number of columns.
	std::size_t m_height;         //!< Number of rows.
	std::vector<Value> m_board{}; //!< Board values, row major.
};

//! Returns the Board::Value enum value of input player.
inline constexpr Board::Value toBoardValue(Player player) {
	return player == Player::White ? Board::Value::White : Board::Value::Black;
}

} // namespace reversi
