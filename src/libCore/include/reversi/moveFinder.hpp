#pragma once

#include "reversi/board.hpp"
#include "reversi/playerState.hpp"
#include "reversi/types.hpp"

namespace reversi {

//! Returns all legal moves of mover with the opponent pieces each move captures.
//! Targets are searched around the opponent pieces. An empty map means mover has to skip.
MoveMap findLegalMoves(const Board& board, const PlayerState& mover, const PlayerState& opponent);

//! Returns the pieces captured if mover placed a piece at target.
//! \note Empty chain if the target is occupied, off board or captures nothing.
CaptureChain findCaptures(const Board& board, Player mover, Coord target);

} // namespace reversi
