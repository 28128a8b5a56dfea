#include "Logging.hpp"

#include "reversi/game.hpp"
#include "reversi/textUi.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <string>

using namespace reversi;

//! Board dimensions from "reversi [width height]". False on malformed input.
static bool readBoardSize(int argc, char** argv, std::size_t& width, std::size_t& height) {
	if (argc == 1)
		return true;
	if (argc != 3)
		return false;

	const auto w = terminal::parseBoardDimension(argv[1]);
	const auto h = terminal::parseBoardDimension(argv[2]);
	if (!w || !h)
		return false;

	width  = *w;
	height = *h;
	return Board::isValidSize(width, height);
}

//! Ask the current player for a move until a parsable one is entered.
//! \returns False once the input stream is closed.
static bool readMove(Player player, Coord& move) {
	while (true) {
		std::cout << std::format("player '{}': please enter your move\n>>> ", terminal::toSymbol(player)) << std::flush;

		std::string line;
		if (!std::getline(std::cin, line))
			return false;

		if (const auto parsed = terminal::parseMove(line)) {
			move = *parsed;
			return true;
		}
		std::cout << "this is an invalid move. Please try again.\n";
	}
}

int main(int argc, char** argv) {
	std::size_t width  = 8u;
	std::size_t height = 8u;
	if (!readBoardSize(argc, argv, width, height)) {
		std::cerr << std::format("Usage: reversi [width height]\n  width, height: board dimensions from 2 to {} (default 8 8)\n",
		                         terminal::kMaxBoardSize);
		return EXIT_FAILURE;
	}

	auto logger = app::Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[App] Starting game on {}x{} board.", width, height));

	Game game{width, height};
	std::string notice;
	while (!game.isFinished()) {
		std::cout << terminal::clearScreen() << notice;
		notice.clear();

		const auto& moves = game.legalMoves();
		if (moves.empty()) {
			notice = "user cannot move, skipping...\n";
			if (!game.skipTurn()) {
				logger.Log(Logging::LogLevel::Error, "[App] Skip rejected without legal moves.");
				return EXIT_FAILURE;
			}
			continue;
		}

		std::cout << terminal::renderBoard(game.board(), moves);

		Coord move{};
		if (!readMove(game.currentPlayer(), move)) {
			logger.Log(Logging::LogLevel::Info, "[App] Input closed. Quitting.");
			return EXIT_SUCCESS;
		}

		if (game.applyMove(move) != MoveResult::Applied) {
			notice = "this is an invalid move. Please try again.\n";
		}
	}

	std::cout << terminal::clearScreen() << notice << terminal::renderBoard(game.board()) << "\n ### GAME OVER ### \n\n"
	          << terminal::renderScores(game.scores());

	const auto winner = game.winner();
	logger.Log(Logging::LogLevel::Info, winner ? std::format("[App] Game over. Winner: '{}'.", terminal::toSymbol(*winner)) : "[App] Game over. Tie.");
	return EXIT_SUCCESS;
}
