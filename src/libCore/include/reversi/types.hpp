#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <vector>

namespace reversi {

using Id = int; //!< Board coordinate component. Signed so scans can step off the board.

//! Coordinate pair for the board. (0,0) is the top left, y grows downwards.
struct Coord {
	Id x, y;

	auto operator<=>(const Coord&) const = default;
};

enum class Player { Black = 1, White = 2 };

using CaptureChain = std::vector<Coord>;            //!< Opponent pieces a move re-owns.
using MoveMap      = std::map<Coord, CaptureChain>; //!< Legal target -> merged capture chain.

//! Types of notifications.
enum GameSignal : uint64_t {
	GS_None         = 0,
	GS_BoardChange  = 1 << 0, //!< Board was modified.
	GS_PlayerChange = 1 << 1, //!< Active player changed.
	GS_StateChange  = 1 << 2, //!< Game state changed. Finished or restarted.
};

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::White ? Player::Black : Player::White;
}

} // namespace reversi
