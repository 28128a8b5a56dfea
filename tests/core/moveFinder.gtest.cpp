#include "reversi/moveFinder.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <set>

namespace reversi::gtest {

//! Board with player bookkeeping kept in sync.
struct Setup {
	Board board;
	PlayerState black{Player::Black};
	PlayerState white{Player::White};

	Setup(std::size_t width = 8u, std::size_t height = 8u) : board(width, height) {
	}

	void put(Player player, std::initializer_list<Coord> coords) {
		for (const auto c: coords) {
			board.setAt(c, player);
			(player == Player::Black ? black : white).addPiece(c);
		}
	}
};

static Setup startPosition() {
	gtest::Setup setup;
	setup.put(Player::White, {{3, 3}, {4, 4}});
	setup.put(Player::Black, {{4, 3}, {3, 4}});
	return setup;
}

static std::set<Coord> asSet(const CaptureChain& chain) {
	return {chain.begin(), chain.end()};
}

TEST(MoveFinder, StartPosition) {
	const auto setup = startPosition();

	const auto moves = findLegalMoves(setup.board, setup.black, setup.white);
	ASSERT_EQ(moves.size(), 4u);
	EXPECT_EQ(moves.at({2, 3}), CaptureChain({{3, 3}}));
	EXPECT_EQ(moves.at({3, 2}), CaptureChain({{3, 3}}));
	EXPECT_EQ(moves.at({5, 4}), CaptureChain({{4, 4}}));
	EXPECT_EQ(moves.at({4, 5}), CaptureChain({{4, 4}}));

	// Same for white mirrored
	const auto whiteMoves = findLegalMoves(setup.board, setup.white, setup.black);
	ASSERT_EQ(whiteMoves.size(), 4u);
	EXPECT_EQ(whiteMoves.at({2, 4}), CaptureChain({{3, 4}}));
	EXPECT_EQ(whiteMoves.at({4, 2}), CaptureChain({{4, 3}}));
	EXPECT_EQ(whiteMoves.at({5, 3}), CaptureChain({{4, 3}}));
	EXPECT_EQ(whiteMoves.at({3, 5}), CaptureChain({{3, 4}}));
}

TEST(MoveFinder, LongChainNearestFirst) {
	gtest::Setup setup;
	setup.put(Player::Black, {{0, 0}});
	setup.put(Player::White, {{1, 0}, {2, 0}, {3, 0}});

	const auto moves = findLegalMoves(setup.board, setup.black, setup.white);
	ASSERT_EQ(moves.size(), 1u);
	EXPECT_EQ(moves.at({4, 0}), CaptureChain({{3, 0}, {2, 0}, {1, 0}}));
}

TEST(MoveFinder, ChainsOfAllDirectionsAreMerged) {
	gtest::Setup setup;
	setup.put(Player::White, {{1, 0}, {0, 1}, {1, 1}});
	setup.put(Player::Black, {{2, 0}, {0, 2}, {2, 2}});

	const auto moves = findLegalMoves(setup.board, setup.black, setup.white);
	ASSERT_TRUE(moves.contains({0, 0}));

	// Every captured piece exactly once
	const auto& chain = moves.at({0, 0});
	EXPECT_EQ(chain.size(), 3u);
	EXPECT_EQ(asSet(chain), std::set<Coord>({{1, 0}, {0, 1}, {1, 1}}));
}

TEST(MoveFinder, GapBreaksChain) {
	gtest::Setup setup;
	setup.put(Player::Black, {{0, 0}});
	setup.put(Player::White, {{1, 0}, {3, 0}});

	const auto moves = findLegalMoves(setup.board, setup.black, setup.white);
	EXPECT_FALSE(moves.contains({4, 0}));
	ASSERT_EQ(moves.size(), 1u);
	EXPECT_EQ(moves.at({2, 0}), CaptureChain({{1, 0}}));
}

TEST(MoveFinder, BoardEdgeBreaksChain) {
	// Pieces in the corner can never be flanked.
	gtest::Setup setup;
	setup.put(Player::White, {{0, 0}, {7, 7}});
	setup.put(Player::Black, {{1, 1}, {6, 6}});

	EXPECT_TRUE(findLegalMoves(setup.board, setup.black, setup.white).empty());
}

TEST(MoveFinder, OccupiedTargetIsNeverLegal) {
	// Placing on the opponent piece at (1,0) would flank (2,0). Only the empty field is legal.
	gtest::Setup setup;
	setup.put(Player::White, {{1, 0}, {2, 0}});
	setup.put(Player::Black, {{3, 0}});

	const auto moves = findLegalMoves(setup.board, setup.black, setup.white);
	EXPECT_FALSE(moves.contains({1, 0}));
	EXPECT_FALSE(moves.contains({2, 0}));
	ASSERT_EQ(moves.size(), 1u);
	EXPECT_EQ(moves.at({0, 0}), CaptureChain({{1, 0}, {2, 0}}));

	const auto start = startPosition();
	for (const auto& [target, chain]: findLegalMoves(start.board, start.white, start.black)) {
		EXPECT_TRUE(start.board.isFree(target));
		EXPECT_FALSE(chain.empty());
	}
}

TEST(MoveFinder, NoOpponentPiecesNoMoves) {
	gtest::Setup setup;
	setup.put(Player::Black, {{3, 3}, {4, 4}});

	EXPECT_TRUE(findLegalMoves(setup.board, setup.black, setup.white).empty());
}

TEST(MoveFinder, FindCapturesMatchesLegalMoves) {
	gtest::Setup setup;
	setup.put(Player::White, {{1, 0}, {0, 1}, {1, 1}, {3, 3}, {4, 3}});
	setup.put(Player::Black, {{2, 0}, {0, 2}, {2, 2}, {5, 3}, {2, 4}});

	const auto moves = findLegalMoves(setup.board, setup.black, setup.white);
	ASSERT_FALSE(moves.empty());
	for (const auto& [target, chain]: moves) {
		EXPECT_EQ(asSet(findCaptures(setup.board, Player::Black, target)), asSet(chain));
	}

	// Fields outside the map capture nothing
	for (Id y = 0; y < 8; ++y) {
		for (Id x = 0; x < 8; ++x) {
			if (!moves.contains({x, y})) {
				EXPECT_TRUE(findCaptures(setup.board, Player::Black, {x, y}).empty());
			}
		}
	}
	EXPECT_TRUE(findCaptures(setup.board, Player::Black, {-1, 0}).empty());
}

} // namespace reversi::gtest
