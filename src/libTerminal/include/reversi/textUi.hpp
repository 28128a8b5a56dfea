#pragma once

#include "reversi/board.hpp"
#include "reversi/game.hpp"
#include "reversi/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace reversi::terminal {

constexpr char kEmptySymbol  = '-';
constexpr char kMarkerSymbol = '?'; //!< Field where the current player may move.

constexpr std::size_t kMaxBoardSize = 64u; //!< Largest width or height offered on the terminal.

//! Symbol a player is drawn with and named by in prompts.
inline constexpr char toSymbol(Player player) {
	return player == Player::White ? 'w' : 'b';
}

//! Render the board with a header of column indices and one line per row.
//! Fields contained in markers are drawn with kMarkerSymbol. The board itself is not modified.
std::string renderBoard(const Board& board, const MoveMap& markers = {});

//! Parse "<column> <row>". Returns std::nullopt if the input is not exactly two integers.
std::optional<Coord> parseMove(std::string_view input);

//! Parse a board width or height given on the command line.
//! Returns std::nullopt unless the whole input is an integer in [2, kMaxBoardSize].
std::optional<std::size_t> parseBoardDimension(std::string_view input);

//! Final scores, highest first. Ties keep black first.
std::string renderScores(const Scores& scores);

//! Escape sequence clearing the terminal and moving the cursor home.
std::string_view clearScreen();

} // namespace reversi::terminal
