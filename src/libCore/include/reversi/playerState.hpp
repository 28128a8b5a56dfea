#pragma once

#include "reversi/types.hpp"

#include <set>
#include <stdexcept>

namespace reversi {

//! Thrown when the ownership bookkeeping of a player diverges from the board.
class InvariantViolation : public std::logic_error {
public:
	using std::logic_error::logic_error;
};

//! A participant of the game and the pieces it currently owns.
class PlayerState {
public:
	explicit PlayerState(Player id);

	Player id() const;

	void addPiece(Coord c);    //!< Add a piece. Adding an owned piece is a no-op.
	void removePiece(Coord c); //!< Remove an owned piece. \throws InvariantViolation if c is not owned.

	bool owns(Coord c) const;
	const std::set<Coord>& pieces() const;
	std::size_t pieceCount() const;

	bool skippedLastTurn() const;
	void setSkipped(bool skipped);

private:
	Player m_id;
	std::set<Coord> m_pieces{};
	bool m_skippedLastTurn{false}; //!< Player had no legal move on its last turn.
};

} // namespace reversi
