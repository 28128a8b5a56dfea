#pragma once

#include "reversi/board.hpp"
#include "reversi/eventHub.hpp"
#include "reversi/playerState.hpp"
#include "reversi/types.hpp"

#include <array>
#include <map>
#include <optional>

namespace reversi {

enum class GameStatus {
	InProgress, //!< Players are taking turns.
	Finished    //!< Both players had to skip consecutively.
};

//! Outcome of Game::applyMove.
enum class MoveResult {
	Applied,     //!< Piece placed and chain captured.
	InvalidMove, //!< Target is not a legal move. Nothing changed.
	GameFinished //!< Game is over. Nothing changed.
};

using Scores = std::map<Player, std::size_t>; //!< Number of fields owned per player.

//! Core game setup. Black moves first.
//! \note Not thread safe. The driving loop calls into the game sequentially.
class Game {
public:
	//! Setup a game with the start position on a board of given dimensions.
	Game(std::size_t width = 8u, std::size_t height = 8u);

	//! Start a new game on a board of the same dimensions.
	void reset();

	//! Legal moves of the current player. Empty if the player has to skip.
	const MoveMap& legalMoves() const;

	//! Current player places a piece at c and captures the corresponding chain.
	MoveResult applyMove(Coord c);

	//! Current player passes. Only possible if there is no legal move.
	//! \returns False if the game is finished or the player could still move.
	bool skipTurn();

	const Board& board() const;   //!< Get board data for rendering.
	Player currentPlayer() const; //!< Returns the currently active player.
	const PlayerState& player(Player id) const;
	GameStatus status() const;
	bool isFinished() const;
	unsigned moveCount() const; //!< Number of placed pieces since the start position.

	Scores scores() const;                //!< Fields owned per player.
	std::optional<Player> winner() const; //!< Player with most fields. std::nullopt on a tie.

public:
	void subscribeEvents(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribeEvents(IGameSignalListener* listener);

private:
	PlayerState& mover();
	PlayerState& opponent();

	void nextPlayer(); //!< Hand the turn to the other player. Callers signal the change.

private:
	Board m_board;
	std::array<PlayerState, 2> m_players; //!< Black and White in turn order.
	std::size_t m_current{0u};            //!< Index of the player to move.
	GameStatus m_status{GameStatus::InProgress};
	unsigned m_moveCount{0u};

	uint64_t m_version{0u};                 //!< Incremented on every state change.
	mutable uint64_t m_movesVersion{0u};    //!< State version m_moves was computed for.
	mutable std::optional<MoveMap> m_moves; //!< Legal moves of the current player.

	EventHub m_eventHub; //!< Hub to signal updates of the game state to external components.
};

} // namespace reversi
