#include "reversi/playerState.hpp"

#include <format>

namespace reversi {

PlayerState::PlayerState(const Player id) : m_id(id) {
}

Player PlayerState::id() const {
	return m_id;
}

void PlayerState::addPiece(const Coord c) {
	m_pieces.insert(c);
}

void PlayerState::removePiece(const Coord c) {
	if (m_pieces.erase(c) == 0u) {
		throw InvariantViolation(std::format("Player {} does not own piece ({}, {}).", static_cast<int>(m_id), c.x, c.y));
	}
}

bool PlayerState::owns(const Coord c) const {
	return m_pieces.contains(c);
}

const std::set<Coord>& PlayerState::pieces() const {
	return m_pieces;
}

std::size_t PlayerState::pieceCount() const {
	return m_pieces.size();
}

bool PlayerState::skippedLastTurn() const {
	return m_skippedLastTurn;
}

void PlayerState::setSkipped(const bool skipped) {
	m_skippedLastTurn = skipped;
}

} // namespace reversi
