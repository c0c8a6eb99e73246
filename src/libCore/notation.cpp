#include "core/notation.hpp"

#include "core/errors.hpp"

#include <algorithm>
#include <format>

namespace minigam {

std::string formatMove(const Move& move) {
	switch (move.kind) {
	case MoveKind::Enter:
		return std::format("{}", move.target.value_or(0));
	case MoveKind::Move:
		return std::format("m {} {}", move.source.value_or(0), move.target.value_or(0));
	case MoveKind::Bear:
		return std::format("b {}", move.source.value_or(0));
	}
	throw InvariantError(std::format("Unknown move kind {}.", static_cast<int>(move.kind)));
}

std::string summarizeMoves(const std::vector<Move>& moves) {
	std::vector<std::string> summaries;
	for (const auto& move: moves) {
		auto summary = formatMove(move);
		if (std::find(summaries.begin(), summaries.end(), summary) == summaries.end()) {
			summaries.push_back(std::move(summary));
		}
	}

	if (summaries.empty()) {
		return "no legal moves";
	}

	std::string result = summaries.front();
	for (std::size_t i = 1; i < summaries.size(); ++i) {
		result += "; " + summaries[i];
	}
	return result;
}

} // namespace minigam
