#include "reversi/board.hpp"

#include <algorithm>
#include <cassert>

namespace reversi {

Board::Board(const std::size_t width, const std::size_t height) : m_width(width), m_height(height), m_board(width * height, Value::Empty) {
	assert(isValidSize(width, height));
}

Board Board::withStartPosition(const std::size_t width, const std::size_t height) {
	Board board{width, height};

	const auto cx = static_cast<Id>(width / 2);
	const auto cy = static_cast<Id>(height / 2);
	board.setAt({cx - 1, cy - 1}, Player::White);
	board.setAt({cx, cy}, Player::White);
	board.setAt({cx, cy - 1}, Player::Black);
	board.setAt({cx - 1, cy}, Player::Black);

	return board;
}

bool Board::isValidSize(const std::size_t width, const std::size_t height) {
	return width >= 2u && height >= 2u;
}

std::size_t Board::width() const {
	return m_width;
}

std::size_t Board::height() const {
	return m_height;
}

void Board::setAt(const Coord c, const Player player) {
	assert(isOnBoard(c)); // Game should check legal moves before setting

	m_board[static_cast<std::size_t>(c.y) * m_width + static_cast<std::size_t>(c.x)] = toBoardValue(player);
}

void Board::clearAt(const Coord c) {
	assert(isOnBoard(c));

	m_board[static_cast<std::size_t>(c.y) * m_width + static_cast<std::size_t>(c.x)] = Value::Empty;
}

std::optional<Board::Value> Board::getAt(const Coord c) const {
	if (!isOnBoard(c))
		return std::nullopt;

	return m_board[static_cast<std::size_t>(c.y) * m_width + static_cast<std::size_t>(c.x)];
}

bool Board::isOnBoard(const Coord c) const {
	return c.x >= 0 && c.y >= 0 && static_cast<std::size_t>(c.x) < m_width && static_cast<std::size_t>(c.y) < m_height;
}

bool Board::isFree(const Coord c) const {
	return getAt(c) == Value::Empty;
}

std::size_t Board::count(const Value value) const {
	return static_cast<std::size_t>(std::count(m_board.begin(), m_board.end(), value));
}

} // namespace reversi
