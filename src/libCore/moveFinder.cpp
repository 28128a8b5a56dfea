#include "reversi/moveFinder.hpp"

#include <algorithm>
#include <array>

namespace reversi {

static constexpr std::array<int, 8> kDx{-1, 0, 1, -1, 1, -1, 0, 1};
static constexpr std::array<int, 8> kDy{-1, -1, -1, 0, 0, 1, 1, 1};

//! Walk from start in direction (dx, dy) collecting opponent pieces until a mover piece closes the chain.
//! Returns an empty chain if the walk runs into an empty field or off the board.
static CaptureChain walkToMover(const Board& board, const Player mover, const Coord start, const int dx, const int dy) {
	CaptureChain chain;

	Coord c = start;
	while (true) {
		c = {c.x + dx, c.y + dy};

		const auto value = board.getAt(c);
		if (!value || *value == Board::Value::Empty)
			return {};
		if (*value == toBoardValue(mover))
			return chain;

		chain.push_back(c);
	}
}

//! Append pieces of from which are not yet part of into.
static void mergeChain(CaptureChain& into, const CaptureChain& from) {
	for (const auto c: from) {
		if (std::find(into.begin(), into.end(), c) == into.end())
			into.push_back(c);
	}
}

MoveMap findLegalMoves(const Board& board, const PlayerState& mover, const PlayerState& opponent) {
	MoveMap moves;

	for (const auto piece: opponent.pieces()) {
		for (std::size_t i = 0; i < kDx.size(); ++i) {
			const Coord target{piece.x + kDx[i], piece.y + kDy[i]};
			if (target == piece || !board.isFree(target))
				continue;

			// Walk back over the opponent piece we started from.
			const auto chain = walkToMover(board, mover.id(), target, -kDx[i], -kDy[i]);
			if (chain.empty())
				continue;

			mergeChain(moves[target], chain);
		}
	}

	return moves;
}

CaptureChain findCaptures(const Board& board, const Player mover, const Coord target) {
	if (!board.isFree(target))
		return {};

	CaptureChain captures;
	for (std::size_t i = 0; i < kDx.size(); ++i) {
		mergeChain(captures, walkToMover(board, mover, target, kDx[i], kDy[i]));
	}
	return captures;
}

} // namespace reversi
