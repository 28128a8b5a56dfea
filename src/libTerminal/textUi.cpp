#include "reversi/textUi.hpp"

#include <algorithm>
#include <format>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace reversi::terminal {

static char fieldSymbol(const Board& board, const MoveMap& markers, const Coord c) {
	if (markers.contains(c))
		return kMarkerSymbol;

	switch (board.getAt(c).value_or(Board::Value::Empty)) {
	case Board::Value::Black:
		return toSymbol(Player::Black);
	case Board::Value::White:
		return toSymbol(Player::White);
	default:
		return kEmptySymbol;
	}
}

std::string renderBoard(const Board& board, const MoveMap& markers) {
	const auto width  = static_cast<Id>(board.width());
	const auto height = static_cast<Id>(board.height());

	std::string out = "  ";
	for (Id x = 0; x < width; ++x) {
		out += std::format("{}{}", x == 0 ? "" : " ", x);
	}
	out += "\n";

	for (Id y = 0; y < height; ++y) {
		out += std::format("{}", y);
		for (Id x = 0; x < width; ++x) {
			out += ' ';
			out += fieldSymbol(board, markers, {x, y});
		}
		out += "\n";
	}

	return out;
}

std::optional<Coord> parseMove(const std::string_view input) {
	std::istringstream stream{std::string(input)};

	Id x = 0;
	Id y = 0;
	if (!(stream >> x >> y))
		return std::nullopt;

	std::string rest;
	if (stream >> rest)
		return std::nullopt;

	return Coord{x, y};
}

std::optional<std::size_t> parseBoardDimension(const std::string_view input) {
	const std::string text(input);

	std::size_t pos = 0u;
	int value       = 0;
	try {
		value = std::stoi(text, &pos);
	} catch (const std::exception&) {
		return std::nullopt;
	}

	if (pos != text.size() || value < 2 || static_cast<std::size_t>(value) > kMaxBoardSize)
		return std::nullopt;
	return static_cast<std::size_t>(value);
}

std::string renderScores(const Scores& scores) {
	std::vector<std::pair<Player, std::size_t>> sorted(scores.begin(), scores.end());
	std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) { return a.second > b.second; });

	std::string out = "final scores\n============\n\n";
	for (const auto& [player, count]: sorted) {
		out += std::format("{}: {}\n", toSymbol(player), count);
	}
	return out;
}

std::string_view clearScreen() {
	return "\033[2J\033[1;1H";
}

} // namespace reversi::terminal
