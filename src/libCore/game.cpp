#include "reversi/game.hpp"

#include "Logging.hpp"
#include "reversi/moveFinder.hpp"

#include <format>

namespace reversi {

//! Players in turn order, owning the start position pieces on board.
static std::array<PlayerState, 2> setupPlayers(const Board& board) {
	std::array<PlayerState, 2> players{PlayerState{Player::Black}, PlayerState{Player::White}};

	for (Id y = 0; y < static_cast<Id>(board.height()); ++y) {
		for (Id x = 0; x < static_cast<Id>(board.width()); ++x) {
			const auto value = board.getAt({x, y});
			if (value == Board::Value::Black) {
				players[0].addPiece({x, y});
			} else if (value == Board::Value::White) {
				players[1].addPiece({x, y});
			}
		}
	}

	return players;
}

Game::Game(const std::size_t width, const std::size_t height)
    : m_board{Board::withStartPosition(width, height)}, m_players{setupPlayers(m_board)} {
}

void Game::reset() {
	m_board     = Board::withStartPosition(m_board.width(), m_board.height());
	m_players   = setupPlayers(m_board);
	m_current   = 0u;
	m_status    = GameStatus::InProgress;
	m_moveCount = 0u;
	++m_version;

	Logger().Log(Logging::LogLevel::Info, std::format("[Game] New game on {}x{} board.", m_board.width(), m_board.height()));

	m_eventHub.signal(GS_BoardChange);
	m_eventHub.signal(GS_PlayerChange);
	m_eventHub.signal(GS_StateChange);
}

const MoveMap& Game::legalMoves() const {
	if (!m_moves || m_movesVersion != m_version) {
		const auto& mover    = m_players[m_current];
		const auto& opponent = m_players[1u - m_current];

		m_moves        = findLegalMoves(m_board, mover, opponent);
		m_movesVersion = m_version;
	}
	return *m_moves;
}

MoveResult Game::applyMove(const Coord c) {
	if (m_status == GameStatus::Finished) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Game] Move ({}, {}) rejected: game is finished.", c.x, c.y));
		return MoveResult::GameFinished;
	}

	const auto& moves = legalMoves();
	const auto it     = moves.find(c);
	if (it == moves.end()) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Game] Move ({}, {}) rejected: not a legal move.", c.x, c.y));
		return MoveResult::InvalidMove;
	}

	// Copy. The cached move map is invalidated below.
	const CaptureChain chain = it->second;

	m_board.setAt(c, mover().id());
	mover().addPiece(c);
	for (const auto captured: chain) {
		opponent().removePiece(captured);
		m_board.setAt(captured, mover().id());
		mover().addPiece(captured);
	}
	mover().setSkipped(false);

	++m_moveCount;
	++m_version;
	Logger().Log(Logging::LogLevel::Debug,
	             std::format("[Game] Move {}: player {} placed ({}, {}) capturing {}.", m_moveCount, static_cast<int>(mover().id()), c.x, c.y,
	                         chain.size()));

	nextPlayer();

	m_eventHub.signal(GS_BoardChange);
	m_eventHub.signal(GS_PlayerChange);
	return MoveResult::Applied;
}

bool Game::skipTurn() {
	if (m_status == GameStatus::Finished) {
		return false;
	}
	if (!legalMoves().empty()) {
		Logger().Log(Logging::LogLevel::Warning, "[Game] Skip rejected: player has legal moves.");
		return false;
	}

	mover().setSkipped(true);
	Logger().Log(Logging::LogLevel::Info, std::format("[Game] Player {} cannot move, skipping.", static_cast<int>(mover().id())));

	const bool finished = mover().skippedLastTurn() && opponent().skippedLastTurn();
	if (finished) {
		m_status = GameStatus::Finished;

		const auto score = scores();
		Logger().Log(Logging::LogLevel::Info,
		             std::format("[Game] Game over. Black {} - White {}.", score.at(Player::Black), score.at(Player::White)));
	}

	nextPlayer();

	// Signal once the state is complete. Listeners may restart the game.
	m_eventHub.signal(GS_PlayerChange);
	if (finished)
		m_eventHub.signal(GS_StateChange);
	return true;
}

const Board& Game::board() const {
	return m_board;
}

Player Game::currentPlayer() const {
	return m_players[m_current].id();
}

const PlayerState& Game::player(const Player id) const {
	return m_players[0].id() == id ? m_players[0] : m_players[1];
}

GameStatus Game::status() const {
	return m_status;
}

bool Game::isFinished() const {
	return m_status == GameStatus::Finished;
}

unsigned Game::moveCount() const {
	return m_moveCount;
}

Scores Game::scores() const {
	return {
	        {Player::Black, m_board.count(Board::Value::Black)},
	        {Player::White, m_board.count(Board::Value::White)},
	};
}

std::optional<Player> Game::winner() const {
	const auto score = scores();
	const auto black = score.at(Player::Black);
	const auto white = score.at(Player::White);

	if (black == white)
		return std::nullopt;
	return black > white ? Player::Black : Player::White;
}

void Game::subscribeEvents(IGameSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void Game::unsubscribeEvents(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

PlayerState& Game::mover() {
	return m_players[m_current];
}

PlayerState& Game::opponent() {
	return m_players[1u - m_current];
}

void Game::nextPlayer() {
	m_current = 1u - m_current;
	++m_version;
}

} // namespace reversi
