#include "core/moveChecker.hpp"

#include "core/errors.hpp"

#include <format>

namespace minigam {

static bool ownsChecker(const Board& board, const PointId pointNumber, const Player player) {
	const auto& p = board.point(pointNumber);
	return p.owner == toOwner(player) && p.count > 0;
}

std::optional<PointId> farthestFromExit(const Board& board, const Player player) {
	const auto& traits = traitsOf(player);

	// Walk away from the exit; the last occupied point seen is the one most behind.
	std::optional<PointId> farthest;
	for (PointId p = traits.exitPoint - traits.direction; withinBoard(p); p -= traits.direction) {
		if (ownsChecker(board, p, player)) {
			farthest = p;
		}
	}
	return farthest;
}

bool hasExactBear(const Board& board, const Player player, const DieValue die) {
	for (PointId p = 1; p <= kPointCount; ++p) {
		if (ownsChecker(board, p, player) && bearingDie(player, p) == die) {
			return true;
		}
	}
	return false;
}

//! Bear off from a point whose exact die is smaller than the rolled one.
//! Only the checker most behind may use the larger die, and only if nothing bears off exactly.
static bool isOvershootBearLegal(const Board& board, const PointId pointNumber, const Player player, const DieValue die) {
	if (board.bar(player) != 0) {
		return false;
	}
	if (farthestFromExit(board, player) != pointNumber) {
		return false;
	}
	return !hasExactBear(board, player, die);
}

std::vector<Move> listLegalMoves(const Board& board, const Player player, const DieValue die) {
	std::vector<Move> legalMoves;
	if (!isValidDie(die)) {
		return legalMoves;
	}

	if (board.bar(player) > 0) {
		const auto target = entryTarget(player, die);
		if (withinBoard(target) && board.isPointOpen(player, target)) {
			legalMoves.push_back(Move::enter(target, die));
		}
	}

	for (PointId pointNumber = 1; pointNumber <= kPointCount; ++pointNumber) {
		if (!ownsChecker(board, pointNumber, player)) {
			continue;
		}

		const auto target = computeTarget(player, pointNumber, die);
		if (withinBoard(target)) {
			if (board.isPointOpen(player, target)) {
				legalMoves.push_back(Move::move(pointNumber, target, die));
			}
			continue;
		}

		if (!isPastExit(player, target)) {
			continue;
		}

		const auto requiredDie = bearingDie(player, pointNumber);
		if (requiredDie == die || (die > requiredDie && isOvershootBearLegal(board, pointNumber, player, die))) {
			legalMoves.push_back(Move::bear(pointNumber, die));
		}
	}

	return legalMoves;
}

void applyMove(Board& board, const Move& move, const Player player) {
	switch (move.kind) {
	case MoveKind::Enter:
		if (!move.target) {
			throw InvariantError("Enter move without target.");
		}
		board.enterFromBar(*move.target, player);
		return;
	case MoveKind::Move:
		if (!move.source || !move.target) {
			throw InvariantError("Board move without source or target.");
		}
		board.moveChecker(*move.source, *move.target, player);
		return;
	case MoveKind::Bear:
		if (!move.source) {
			throw InvariantError("Bear move without source.");
		}
		board.bearOff(*move.source, player);
		return;
	}

	throw InvariantError(std::format("Unknown move kind {}.", static_cast<int>(move.kind)));
}

Board cloneState(const Board& board) {
	return board;
}

} // namespace minigam
